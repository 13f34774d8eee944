#include "xylo/parser.hpp"
#include "parser/actions.hpp"
#include "parser/grammar.hpp"
#include <cctype>
#include <optional>
#include <utility>

namespace xylo {

namespace {

namespace pg = tao::pegtl;

void append(Block& out, Block&& more){
    out.insert(out.end(), std::make_move_iterator(more.begin()), std::make_move_iterator(more.end()));
}

bool is_ident_char(char c){ return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

// Recursive descent over the source with a byte cursor. PEGTL rules recognise
// the terminals; layout (indentation, statement shapes, operator climbing) is
// handled here. Every production restores the cursor when it fails.
class BlockParser {
public:
    explicit BlockParser(std::string_view src) : d_(src) {}

    Tree parse_tree(){
        Tree tree;
        for(;;){
            skip_blank_lines();
            size_t at = p_;
            auto def = definition();
            if(!def){ p_ = at; break; }
            tree.push_back(std::move(*def));
        }
        multispace0();
        if(!eof()){
            expected("definition");
            fail_here();
        }
        return tree;
    }

private:
    std::string_view d_;
    size_t p_ = 0;
    size_t err_pos_ = 0;
    std::string err_expected_;

    [[noreturn]] void fail_here() const {
        int line = 1, col = 1;
        for(size_t i = 0; i < err_pos_ && i < d_.size(); ++i){
            if(d_[i] == '\n'){ ++line; col = 1; } else { ++col; }
        }
        std::string msg = "parse error at line " + std::to_string(line) + ", column " + std::to_string(col);
        if(!err_expected_.empty()) msg += ": expected " + err_expected_;
        throw parse_error(msg, line, col);
    }

    // Remember the farthest position anything was expected at.
    void expected(const std::string& what){
        if(err_expected_.empty() || p_ > err_pos_){ err_pos_ = p_; err_expected_ = what; }
    }

    bool eof() const { return p_ >= d_.size(); }
    char peek(size_t ahead = 0) const { return p_ + ahead < d_.size() ? d_[p_ + ahead] : '\0'; }

    template<typename Rule>
    bool match(){
        pg::memory_input<> in(d_.data() + p_, d_.data() + d_.size(), "xylo");
        if(!pg::parse<Rule>(in)) return false;
        p_ = static_cast<size_t>(in.current() - d_.data());
        return true;
    }

    template<typename Rule, template<typename...> class Action, typename State>
    bool match(State& st){
        pg::memory_input<> in(d_.data() + p_, d_.data() + d_.size(), "xylo");
        if(!pg::parse<Rule, Action>(in, st)) return false;
        p_ = static_cast<size_t>(in.current() - d_.data());
        return true;
    }

    template<typename Rule>
    bool lookahead(){ size_t at = p_; bool ok = match<Rule>(); p_ = at; return ok; }

    size_t space0(){ size_t n = 0; while(peek() == ' ' || peek() == '\t'){ ++p_; ++n; } return n; }
    bool space1(){ return space0() > 0; }
    size_t multispace0(){ size_t s = p_; while(peek() == ' ' || peek() == '\t' || peek() == '\n' || peek() == '\r') ++p_; return p_ - s; }
    bool multispace1(){ return multispace0() > 0; }
    bool at_line_ending() const { return peek() == '\n' || (peek() == '\r' && peek(1) == '\n'); }
    bool line_ending(){
        if(peek() == '\n'){ ++p_; return true; }
        if(peek() == '\r' && peek(1) == '\n'){ p_ += 2; return true; }
        return false;
    }
    void skip_blank_lines(){
        for(;;){ size_t at = p_; space0(); if(!line_ending()){ p_ = at; return; } }
    }
    bool skip_blank_lines_crossed(){
        bool crossed = false;
        for(;;){ size_t at = p_; space0(); if(line_ending()){ crossed = true; continue; } p_ = at; return crossed; }
    }
    bool tag(char c){ if(peek() == c){ ++p_; return true; } expected(std::string("`") + c + "`"); return false; }

    // Consumes blank lines and leading blanks; a new line must be indented by
    // at least `indent` columns. Returns the indent for what follows.
    std::optional<size_t> indentation(size_t indent){
        size_t save = p_;
        bool newline = skip_blank_lines_crossed();
        size_t spacing = space0();
        if(newline && spacing < indent){
            expected("indentation of at least " + std::to_string(indent) + " columns");
            p_ = save;
            return std::nullopt;
        }
        return newline ? spacing : indent;
    }

    // Whitespace before a trailing binary operator; a new line continues the
    // expression only when indented by at least `indent` columns.
    bool operator_continues(size_t indent){
        size_t start = p_;
        bool newline = skip_blank_lines_crossed();
        size_t col = space0();
        if(newline && col < indent){ p_ = start; return false; }
        return true;
    }

    // `;`, a line ending, or end of input after optional blanks.
    bool end_of_item(){
        size_t at = p_;
        space0();
        if(peek() == ';'){ ++p_; return true; }
        if(line_ending() || eof()) return true;
        expected("`;` or a new line");
        p_ = at;
        return false;
    }

    // `->`, or a line break (and `;` where allowed) introducing a body.
    bool body_separator(bool allow_semicolon){
        size_t save = p_;
        multispace0();
        if(match<grammar::arrow>()) return true;
        p_ = save;
        space0();
        if(allow_semicolon && peek() == ';'){ ++p_; return true; }
        if(at_line_ending()) return true;
        p_ = save;
        expected("`->`");
        return false;
    }

    std::optional<Literal> literal(){
        if(peek() == '[') return list_literal();
        actions::literal_state st;
        if(match<grammar::scalar, actions::literal_action>(st)) return st.value;
        expected("literal");
        return std::nullopt;
    }

    std::optional<Literal> list_literal(){
        size_t save = p_;
        if(!tag('[')) return std::nullopt;
        LiteralList list;
        multispace0();
        if(peek() != ']'){
            for(;;){
                multispace0();
                auto item = literal();
                if(!item){ p_ = save; return std::nullopt; }
                list.items.push_back(std::move(*item));
                multispace0();
                if(peek() == ','){ ++p_; continue; }
                break;
            }
        }
        multispace0();
        if(!tag(']')){ p_ = save; return std::nullopt; }
        return Literal{std::move(list)};
    }

    std::optional<std::string> identifier(){
        size_t start = p_;
        if(match<grammar::identifier>()) return std::string(d_.substr(start, p_ - start));
        if(match<grammar::operator_name>()) return std::string(d_.substr(start + 1, p_ - start - 2));
        expected("identifier");
        return std::nullopt;
    }

    std::optional<BinaryOperator> binary_operator(){
        actions::operator_state st;
        if(match<grammar::binary_operator, actions::operator_action>(st)) return st.op;
        return std::nullopt;
    }

    void params(std::vector<std::string>& out){
        for(;;){
            size_t at = p_;
            if(!multispace1()) return;
            auto id = identifier();
            if(!id){ p_ = at; return; }
            out.push_back(std::move(*id));
        }
    }

    // `=` but not `==`
    bool equals_sign(){
        if(peek() == '=' && peek(1) != '='){ ++p_; return true; }
        expected("`=`");
        return false;
    }

    std::optional<Definition> definition(){
        size_t save = p_;
        auto name = identifier();
        if(!name) return std::nullopt;
        Definition def;
        def.name = std::move(*name);
        if(peek() == '@'){
            ++p_;
            actions::literal_state st;
            if(!match<pg::sor<grammar::floating, grammar::integer>, actions::literal_action>(st)){
                expected("weight");
                p_ = save;
                return std::nullopt;
            }
            if(auto* i = std::get_if<std::int32_t>(&st.value.data)) def.weight = static_cast<float>(*i);
            else def.weight = std::get<float>(st.value.data);
        }
        params(def.params);
        multispace0();
        if(!equals_sign()){ p_ = save; return std::nullopt; }
        auto body = expr(1, false, 0);
        if(!body || !end_of_item()){ p_ = save; return std::nullopt; }
        def.block = std::move(*body);
        return def;
    }

    std::optional<Block> expr(size_t indent, bool consume_semicolon, int min_prec){
        size_t save = p_;
        auto ind = indentation(indent);
        if(!ind) return std::nullopt;
        indent = *ind;
        auto lhs = primary(indent, min_prec);
        if(!lhs){ p_ = save; return std::nullopt; }
        Block out = std::move(*lhs);
        for(;;){
            size_t before = p_;
            if(!operator_continues(indent)) break;
            auto op = binary_operator();
            if(!op || precedence(*op) < min_prec){ p_ = before; break; }
            auto rhs = expr(indent + 1, false, precedence(*op) + 1);
            if(!rhs){ p_ = save; return std::nullopt; }
            append(out, std::move(*rhs));
            out.push_back(Token{*op});
        }
        if(consume_semicolon){
            size_t at = p_;
            space0();
            if(peek() == ';') ++p_; else p_ = at;
        }
        return out;
    }

    std::optional<Block> primary(size_t indent, int min_prec){
        if(auto lit = literal()){ Block b; b.push_back(Token{std::move(*lit)}); return b; }
        if(auto b = let_statement(indent)) return b;
        if(auto b = if_statement(indent)) return b;
        if(auto b = match_statement(indent)) return b;
        if(auto b = for_statement(indent)) return b;
        if(auto b = loop_statement(indent)) return b;
        if(auto b = call(indent, min_prec)) return b;
        return parenthesized();
    }

    std::optional<Block> call(size_t indent, int min_prec){
        auto name = identifier();
        if(!name) return std::nullopt;
        Block out;
        size_t argc = 0;
        // Arguments are atoms; a call in argument position takes none.
        if(min_prec < max_precedence){
            for(;;){
                size_t at = p_;
                if(!space1() || at_line_ending()){ p_ = at; break; }
                auto arg = expr(indent + 1, false, max_precedence);
                if(!arg){ p_ = at; break; }
                append(out, std::move(*arg));
                ++argc;
            }
        }
        out.push_back(Token{CallToken{std::move(*name), argc}});
        return out;
    }

    std::optional<Block> parenthesized(){
        size_t save = p_;
        if(!tag('(')) return std::nullopt;
        multispace0();
        auto inner = expr(0, true, 0);
        if(!inner){ p_ = save; return std::nullopt; }
        multispace0();
        if(!tag(')')){ p_ = save; return std::nullopt; }
        return inner;
    }

    std::optional<Definition> let_definition(size_t indent){
        size_t save = p_;
        auto name = identifier();
        if(!name) return std::nullopt;
        Definition def;
        def.name = std::move(*name);
        params(def.params);
        multispace0();
        if(!equals_sign()){ p_ = save; return std::nullopt; }
        auto body = expr(indent + 1, false, 0);
        if(!body){ p_ = save; return std::nullopt; }
        def.block = std::move(*body);
        return def;
    }

    std::optional<Block> let_statement(size_t indent){
        size_t save = p_;
        if(!match<grammar::kw_let>() || !space1()){ p_ = save; return std::nullopt; }
        std::vector<Definition> defs;
        for(;;){
            size_t before = p_;
            if(!defs.empty()){
                if(!end_of_item()) break;
                multispace0();
            }
            auto def = let_definition(indent + 1);
            if(!def){ p_ = before; break; }
            defs.push_back(std::move(*def));
        }
        if(defs.empty() || !body_separator(true)){ p_ = save; return std::nullopt; }
        auto body = expr(indent + 1, true, 0);
        if(!body){ p_ = save; return std::nullopt; }
        Block out;
        size_t skip = body->size() + 1;
        out.push_back(Token{LetToken{std::move(defs), skip}});
        append(out, std::move(*body));
        return out;
    }

    std::optional<Block> if_statement(size_t indent){
        size_t save = p_;
        if(!match<grammar::kw_if>() || !space1()){ p_ = save; return std::nullopt; }
        auto cond = expr(indent + 1, true, 0);
        if(!cond || !body_separator(false)){ p_ = save; return std::nullopt; }
        auto then_block = expr(indent + 1, true, 0);
        if(!then_block){ p_ = save; return std::nullopt; }
        multispace0();
        if(!match<grammar::kw_else>()){ expected("`else`"); p_ = save; return std::nullopt; }
        std::optional<Block> else_block;
        size_t at = p_;
        if(multispace1() && lookahead<grammar::kw_if>()){
            else_block = if_statement(indent);
        } else {
            p_ = at;
            if(body_separator(false)) else_block = expr(indent + 1, true, 0);
        }
        if(!else_block){ p_ = save; return std::nullopt; }
        Block out = std::move(*cond);
        out.push_back(Token{IfToken{then_block->size() + 1}});
        append(out, std::move(*then_block));
        out.push_back(Token{JumpToken{else_block->size() + 1}});
        append(out, std::move(*else_block));
        return out;
    }

    std::optional<std::pair<Pattern, Block>> pattern_block(size_t indent){
        size_t save = p_;
        auto ind = indentation(indent);
        if(!ind) return std::nullopt;
        Pattern pattern;
        if(peek() == '_' && !is_ident_char(peek(1))){
            ++p_;
            pattern = PatternWildcard{};
        } else {
            PatternMatches m;
            for(;;){
                auto lit = literal();
                if(!lit){ p_ = save; return std::nullopt; }
                m.literals.push_back(std::move(*lit));
                size_t at = p_;
                space0();
                if(peek() == ','){ ++p_; space0(); continue; }
                p_ = at;
                break;
            }
            pattern = std::move(m);
        }
        if(!body_separator(false)){ p_ = save; return std::nullopt; }
        auto body = expr(*ind + 1, true, 0);
        if(!body){ p_ = save; return std::nullopt; }
        return std::make_pair(std::move(pattern), std::move(*body));
    }

    std::optional<Block> match_statement(size_t indent){
        size_t save = p_;
        if(!match<grammar::kw_match>() || !space1()){ p_ = save; return std::nullopt; }
        auto scrutinee = expr(indent + 1, true, 0);
        if(!scrutinee || !body_separator(false)){ p_ = save; return std::nullopt; }
        std::vector<std::pair<Pattern, Block>> arms;
        for(;;){
            size_t at = p_;
            auto arm = pattern_block(indent + 1);
            if(!arm){ p_ = at; break; }
            arms.push_back(std::move(*arm));
        }
        if(arms.empty()){ p_ = save; return std::nullopt; }
        // Each arm ends in a Jump landing past the whole match.
        size_t total = 1;
        for(auto& a : arms) total += a.second.size() + 1;
        Block out = std::move(*scrutinee);
        MatchToken token;
        for(auto& a : arms) token.arms.push_back(MatchArm{std::move(a.first), a.second.size() + 1});
        out.push_back(Token{std::move(token)});
        size_t pos = 1;
        for(auto& a : arms){
            pos += a.second.size();
            append(out, std::move(a.second));
            out.push_back(Token{JumpToken{total - pos}});
            ++pos;
        }
        return out;
    }

    std::optional<Block> for_statement(size_t indent){
        size_t save = p_;
        if(!match<grammar::kw_for>() || !space1()){ p_ = save; return std::nullopt; }
        size_t var_at = p_;
        if(!match<grammar::identifier>()){ expected("loop variable"); p_ = save; return std::nullopt; }
        std::string var(d_.substr(var_at, p_ - var_at));
        if(!multispace1() || !match<grammar::kw_in>() || !space1()){ expected("`in`"); p_ = save; return std::nullopt; }
        auto iter = expr(indent + 1, true, 0);
        if(!iter || !body_separator(false)){ p_ = save; return std::nullopt; }
        auto body = expr(indent + 1, true, 0);
        if(!body){ p_ = save; return std::nullopt; }
        Block out = std::move(*iter);
        out.push_back(Token{ForToken{std::move(var), body->size() + 1}});
        append(out, std::move(*body));
        return out;
    }

    std::optional<Block> loop_statement(size_t indent){
        size_t save = p_;
        if(!match<grammar::kw_loop>() || !space1()){ p_ = save; return std::nullopt; }
        auto count = expr(indent + 1, true, 0);
        if(!count || !body_separator(false)){ p_ = save; return std::nullopt; }
        auto body = expr(indent + 1, true, 0);
        if(!body){ p_ = save; return std::nullopt; }
        Block out = std::move(*count);
        out.push_back(Token{LoopToken{body->size() + 1}});
        append(out, std::move(*body));
        return out;
    }
};

} // namespace

Tree parse(std::string_view source){
    BlockParser parser(source);
    return parser.parse_tree();
}

ParseResult try_parse(std::string_view source){
    ParseResult r;
    try {
        r.tree = parse(source);
        r.success = true;
    } catch (const parse_error& e) {
        r.error_message = e.what();
        r.line = e.line;
        r.column = e.col;
    }
    return r;
}

} // namespace xylo
