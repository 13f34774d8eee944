#include "xylo/minify.hpp"
#include "xylo/parser.hpp"
#include <cctype>
#include <stdexcept>

namespace xylo {

namespace {

bool is_word(const std::string& name){
    if(name.empty()) return false;
    for(char c : name) if(!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
    return true;
}

std::string function_name(const std::string& name){ return is_word(name) ? name : "(" + name + ")"; }

std::string definition_head(const Definition& def, bool with_weight){
    std::string out = function_name(def.name);
    if(with_weight && def.weight != 1.0f) out += "@" + format_float(def.weight);
    for(auto& p : def.params) out += " " + function_name(p);
    return out + "=";
}

// Control construct waiting for the end of its current sub-block.
struct Pending {
    const Token* token = nullptr;
    std::size_t stop = 0;         // index where the current sub-block ends
    std::size_t arm = 0;          // match: arm being collected
    std::vector<std::string> parts;
};

class Printer {
public:
    explicit Printer(const Block& block) : b_(block) {}

    std::string run(){
        std::size_t i = 0;
        for(;;){
            while(!pending_.empty() && pending_.back().stop == i) i = close(i);
            if(i >= b_.size()) break;
            i = open(i);
        }
        if(!pending_.empty() || out_.size() != 1) throw std::logic_error("malformed block");
        return out_.back();
    }

private:
    std::string pop(){
        if(out_.empty()) throw std::logic_error("malformed block");
        std::string s = std::move(out_.back());
        out_.pop_back();
        return s;
    }

    const JumpToken& jump_at(std::size_t i) const {
        auto* j = i < b_.size() ? std::get_if<JumpToken>(&b_[i].data) : nullptr;
        if(!j) throw std::logic_error("malformed block");
        return *j;
    }

    // Prints token i (or opens its construct) and returns the next index.
    std::size_t open(std::size_t i){
        const token_data& t = b_[i].data;
        if(auto* lit = std::get_if<Literal>(&t)){
            out_.push_back(to_string(*lit));
        } else if(auto* op = std::get_if<BinaryOperator>(&t)){
            std::string rhs = pop(), lhs = pop();
            out_.push_back("(" + lhs + symbol(*op) + rhs + ")");
        } else if(auto* call = std::get_if<CallToken>(&t)){
            if(out_.size() < call->argc) throw std::logic_error("malformed block");
            std::string s = function_name(call->name);
            if(call->argc){
                std::string args;
                for(std::size_t k = out_.size() - call->argc; k < out_.size(); ++k) args += " " + out_[k];
                out_.resize(out_.size() - call->argc);
                s = "(" + s + args + ")";
            }
            out_.push_back(std::move(s));
        } else if(auto* tok = std::get_if<IfToken>(&t)){
            pending_.push_back(Pending{&b_[i], i + tok->skip, 0, {pop()}});
        } else if(auto* tok = std::get_if<MatchToken>(&t)){
            if(tok->arms.empty()) throw std::logic_error("malformed block");
            pending_.push_back(Pending{&b_[i], i + tok->arms[0].skip, 0, {pop()}});
        } else if(auto* tok = std::get_if<LetToken>(&t)){
            std::string defs;
            for(auto& d : tok->defs){
                if(!defs.empty()) defs += ";";
                defs += definition_head(d, false) + minify(d.block);
            }
            pending_.push_back(Pending{&b_[i], i + tok->skip, 0, {defs}});
        } else if(auto* tok = std::get_if<ForToken>(&t)){
            pending_.push_back(Pending{&b_[i], i + tok->skip, 0, {pop()}});
        } else if(auto* tok = std::get_if<LoopToken>(&t)){
            pending_.push_back(Pending{&b_[i], i + tok->skip, 0, {pop()}});
        } else {
            throw std::logic_error("malformed block");
        }
        return i + 1;
    }

    // The innermost construct reached the end of a sub-block at i.
    std::size_t close(std::size_t i){
        Pending& p = pending_.back();
        const token_data& t = p.token->data;
        if(std::holds_alternative<IfToken>(t)){
            p.parts.push_back(pop());
            if(p.parts.size() == 2){
                p.stop = i + jump_at(i).skip;
                return i + 1;
            }
            finish("(if " + p.parts[0] + "->" + p.parts[1] + ";else->" + p.parts[2] + ")");
            return i;
        }
        if(auto* m = std::get_if<MatchToken>(&t)){
            // each arm ends on its jump
            jump_at(i);
            p.parts.push_back(pop());
            if(++p.arm < m->arms.size()){
                p.stop = i + m->arms[p.arm].skip;
                return i + 1;
            }
            std::string s = "(match " + p.parts[0] + "->";
            for(std::size_t k = 0; k < m->arms.size(); ++k){
                if(k) s += ";";
                s += pattern_string(m->arms[k].pattern) + "->" + p.parts[k + 1];
            }
            finish(s + ")");
            return i + 1;
        }
        std::string body = pop();
        if(std::holds_alternative<LetToken>(t)) finish("(let " + p.parts[0] + "->" + body + ")");
        else if(auto* f = std::get_if<ForToken>(&t)) finish("(for " + function_name(f->var) + " in " + p.parts[0] + "->" + body + ")");
        else finish("(loop " + p.parts[0] + "->" + body + ")");
        return i;
    }

    void finish(std::string s){
        pending_.pop_back();
        out_.push_back(std::move(s));
    }

    static std::string pattern_string(const Pattern& pattern){
        if(std::holds_alternative<PatternWildcard>(pattern)) return "_";
        std::string s;
        for(auto& lit : std::get<PatternMatches>(pattern).literals){
            if(!s.empty()) s += ",";
            s += to_string(lit);
        }
        return s;
    }

    const Block& b_;
    std::vector<std::string> out_;
    std::vector<Pending> pending_;
};

} // namespace

std::string minify(const Block& block){ return Printer(block).run(); }

std::string minify(const Tree& tree){
    std::string out;
    for(auto& def : tree){
        if(!out.empty()) out += "\n";
        out += definition_head(def, true) + minify(def.block);
    }
    return out;
}

std::string minify(std::string_view source){ return minify(parse(source)); }

} // namespace xylo
