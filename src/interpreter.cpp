#include "xylo/interpreter.hpp"
#include "xylo/builtins.hpp"
#include "xylo/env.hpp"
#include "xylo/error.hpp"
#include <cstdio>
#include <functional>
#include <mutex>
#include <random>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace xylo {

namespace {

struct Plan;
using PlanPtr = std::shared_ptr<const Plan>;

// Tokens [begin, end) of one expression; root is the token that produces it.
struct Span { std::size_t begin = 0, end = 0, root = 0; };

// Operand spans of a token, plus compiled let definitions for Let tokens.
struct Slot {
    std::vector<Span> operands;
    std::vector<PlanPtr> defs;
};

struct Plan {
    const Block* block = nullptr;
    std::vector<Slot> slots;
    Span root;
};

// Recovers expression structure from a flat block in one forward pass per
// nesting level. Control tokens delimit their sub-blocks by skip lengths.
class Planner {
public:
    explicit Planner(const Block& block) : b_(block), plan_(std::make_shared<Plan>()) {
        plan_->block = &block;
        plan_->slots.resize(block.size());
    }

    PlanPtr build(){
        plan_->root = scan(0, b_.size());
        return plan_;
    }

private:
    [[noreturn]] static void malformed(const char* what){ throw std::logic_error(std::string("malformed block: ") + what); }

    static Span pop(std::vector<Span>& st){
        if(st.empty()) malformed("missing operand");
        Span s = st.back();
        st.pop_back();
        return s;
    }

    const JumpToken& jump_at(std::size_t i, std::size_t end) const {
        if(i >= end) malformed("skip past end");
        auto* j = std::get_if<JumpToken>(&b_[i].data);
        if(!j) malformed("expected jump");
        return *j;
    }

    Span scan(std::size_t begin, std::size_t end){
        if(end > b_.size() || begin >= end) malformed("empty sub-block");
        std::vector<Span> st;
        std::size_t i = begin;
        while(i < end){
            const token_data& t = b_[i].data;
            Slot& slot = plan_->slots[i];
            if(std::holds_alternative<Literal>(t)){
                st.push_back(Span{i, i + 1, i});
                ++i;
            } else if(std::holds_alternative<BinaryOperator>(t)){
                Span rhs = pop(st), lhs = pop(st);
                slot.operands = {lhs, rhs};
                st.push_back(Span{lhs.begin, i + 1, i});
                ++i;
            } else if(auto* call = std::get_if<CallToken>(&t)){
                if(st.size() < call->argc) malformed("missing argument");
                slot.operands.assign(st.end() - call->argc, st.end());
                st.resize(st.size() - call->argc);
                std::size_t first = call->argc ? slot.operands.front().begin : i;
                st.push_back(Span{first, i + 1, i});
                ++i;
            } else if(auto* tok = std::get_if<IfToken>(&t)){
                Span cond = pop(st);
                std::size_t jump = i + tok->skip;
                std::size_t stop = jump + jump_at(jump, end).skip;
                if(stop > end) malformed("else past end");
                Span then_span = scan(i + 1, jump);
                Span else_span = scan(jump + 1, stop);
                plan_->slots[i].operands = {cond, then_span, else_span};
                st.push_back(Span{cond.begin, stop, i});
                i = stop;
            } else if(auto* tok = std::get_if<MatchToken>(&t)){
                Span scrutinee = pop(st);
                std::vector<Span> operands{scrutinee};
                std::size_t pos = i + 1;
                for(auto& arm : tok->arms){
                    if(arm.skip == 0) malformed("empty arm");
                    std::size_t jump = pos + arm.skip - 1;
                    jump_at(jump, end);
                    operands.push_back(scan(pos, jump));
                    pos = jump + 1;
                }
                plan_->slots[i].operands = std::move(operands);
                st.push_back(Span{scrutinee.begin, pos, i});
                i = pos;
            } else if(auto* tok = std::get_if<LetToken>(&t)){
                std::size_t stop = i + tok->skip;
                Span body = scan(i + 1, stop);
                std::vector<PlanPtr> defs;
                for(auto& def : tok->defs) defs.push_back(Planner(def.block).build());
                plan_->slots[i].operands = {body};
                plan_->slots[i].defs = std::move(defs);
                st.push_back(Span{i, stop, i});
                i = stop;
            } else if(auto* tok = std::get_if<ForToken>(&t)){
                Span iter = pop(st);
                std::size_t stop = i + tok->skip;
                Span body = scan(i + 1, stop);
                plan_->slots[i].operands = {iter, body};
                st.push_back(Span{iter.begin, stop, i});
                i = stop;
            } else if(auto* tok = std::get_if<LoopToken>(&t)){
                Span count = pop(st);
                std::size_t stop = i + tok->skip;
                Span body = scan(i + 1, stop);
                plan_->slots[i].operands = {count, body};
                st.push_back(Span{count.begin, stop, i});
                i = stop;
            } else {
                malformed("unexpected jump");
            }
        }
        if(st.size() != 1) malformed("expected a single expression");
        return st.back();
    }

    const Block& b_;
    std::shared_ptr<Plan> plan_;
};

struct Function;
using FunctionPtr = std::shared_ptr<const Function>;

struct Frame {
    std::unordered_map<std::string, FunctionPtr> functions;
    std::shared_ptr<const Frame> parent;

    const Function* find(const std::string& name) const {
        for(const Frame* f = this; f; f = f->parent.get()){
            auto it = f->functions.find(name);
            if(it != f->functions.end()) return it->second.get();
        }
        return nullptr;
    }
};
using FramePtr = std::shared_ptr<const Frame>;

// A body is either a compiled definition or an already reduced value
// (parameter and loop variable bindings).
struct Body {
    Value value;
    PlanPtr plan;
};

struct Function {
    std::string name;
    std::vector<std::string> params;
    bool weighted = false;
    std::vector<std::pair<Body, float>> bodies;
    bool global = false;
    bool pure = false;
    std::weak_ptr<const Frame> env; // defining frame of let functions
};

struct Stack {
    FramePtr frame;
    std::optional<Scope> scope; // innermost global body, part of every cache key
    std::size_t depth = 0;
};

FunctionPtr bound_value(const std::string& name, Value v){
    auto fn = std::make_shared<Function>();
    fn->name = name;
    fn->bodies.push_back({Body{std::move(v), nullptr}, 1.0f});
    return fn;
}

// Groups same-named definitions into weighted functions, in first-seen order.
std::vector<std::shared_ptr<Function>> group_definitions(const std::vector<Definition>& defs, const std::vector<PlanPtr>& plans){
    std::vector<std::shared_ptr<Function>> out;
    std::unordered_map<std::string, std::size_t> index;
    for(std::size_t i = 0; i < defs.size(); ++i){
        const Definition& d = defs[i];
        std::unordered_set<std::string> seen;
        for(auto& p : d.params) if(!seen.insert(p).second) throw invalid_definition(d.name);
        if(d.weight < 0.0f) throw invalid_definition(d.name);
        auto it = index.find(d.name);
        if(it == index.end()){
            auto fn = std::make_shared<Function>();
            fn->name = d.name;
            fn->params = d.params;
            index.emplace(d.name, out.size());
            out.push_back(fn);
            it = index.find(d.name);
        }
        Function& fn = *out[it->second];
        if(fn.params != d.params) throw invalid_definition(d.name);
        fn.bodies.push_back({Body{Value(), plans[i]}, d.weight});
    }
    for(auto& fn : out){
        fn->weighted = fn->bodies.size() > 1;
        if(fn->weighted){
            float total = 0.0f;
            for(auto& b : fn->bodies) total += b.second;
            if(total <= 0.0f) throw invalid_definition(fn->name);
        }
    }
    return out;
}

void collect_names(const Block& block, std::unordered_set<std::string>& out){
    for(auto& t : block){
        if(auto* call = std::get_if<CallToken>(&t.data)) out.insert(call->name);
        else if(auto* op = std::get_if<BinaryOperator>(&t.data)) out.insert(symbol(*op));
        else if(auto* let = std::get_if<LetToken>(&t.data)) for(auto& d : let->defs) collect_names(d.block, out);
    }
}

bool is_literal(const Plan& plan, const Span& s){
    return s.end - s.begin == 1 && std::holds_alternative<Literal>((*plan.block)[s.root].data);
}

std::mutex trace_mutex;

void trace_call(const std::string& name, std::size_t branch, std::size_t depth, bool cached){
    std::lock_guard<std::mutex> lk(trace_mutex);
    std::fprintf(stderr, "[xylo][call] %s branch=%zu depth=%zu%s\n", name.c_str(), branch, depth, cached ? " cached" : "");
}

} // namespace

// State of one run: globals, cache and generator.
class Evaluation {
public:
    Evaluation(Interpreter& in, const Tree& tree) : in_(in), cache_(in.options_.seed) {
        std::vector<PlanPtr> plans;
        plans.reserve(tree.size());
        for(auto& def : tree) plans.push_back(Planner(def.block).build());
        std::vector<std::shared_ptr<Function>> fns = group_definitions(tree, plans);
        for(auto& fn : fns) fn->global = true;
        mark_purity(tree, fns);
        for(auto& fn : fns) globals_.emplace(fn->name, fn);
    }

    Value call_entry(const std::string& name){ return call(name, {}, Stack{}); }

private:
    // A global is pure unless it is weighted or reaches a builtin or global
    // that is not. Locals sharing a global's name are treated conservatively.
    static void mark_purity(const Tree& tree, std::vector<std::shared_ptr<Function>>& fns){
        std::unordered_map<std::string, std::unordered_set<std::string>> names;
        for(auto& def : tree) collect_names(def.block, names[def.name]);
        std::unordered_map<std::string, Function*> by_name;
        for(auto& fn : fns){
            by_name.emplace(fn->name, fn.get());
            fn->pure = !fn->weighted;
            for(auto& n : names[fn->name]){
                const Builtin* b = find_builtin(n);
                if(b && !b->pure) fn->pure = false;
            }
        }
        for(bool changed = true; changed;){
            changed = false;
            for(auto& fn : fns){
                if(!fn->pure) continue;
                for(auto& n : names[fn->name]){
                    if(find_builtin(n)) continue;
                    auto it = by_name.find(n);
                    if(it != by_name.end() && !it->second->pure){
                        fn->pure = false;
                        changed = true;
                        break;
                    }
                }
            }
        }
    }

    std::vector<Value> eval_all(const Plan& plan, const std::vector<Span>& spans, std::size_t from, const Stack& st, bool fork){
        std::vector<Value> out(spans.size() - from);
        if(!fork || out.size() < 2){
            for(std::size_t i = 0; i < out.size(); ++i) out[i] = eval(plan, spans[from + i], st);
            return out;
        }
        std::vector<std::function<void()>> jobs;
        jobs.reserve(out.size());
        for(std::size_t i = 0; i < out.size(); ++i)
            jobs.emplace_back([&, i]{ out[i] = eval(plan, spans[from + i], st); });
        in_.pool_.run(jobs);
        return out;
    }

    Value eval(const Plan& plan, const Span& span, const Stack& st){
        const token_data& t = (*plan.block)[span.root].data;
        const Slot& slot = plan.slots[span.root];
        if(auto* lit = std::get_if<Literal>(&t)) return from_literal(*lit);
        if(auto* op = std::get_if<BinaryOperator>(&t)){
            bool fork = !is_literal(plan, slot.operands[0]) && !is_literal(plan, slot.operands[1]);
            return call(symbol(*op), eval_all(plan, slot.operands, 0, st, fork), st);
        }
        if(auto* c = std::get_if<CallToken>(&t)){
            bool fork = false;
            for(auto& s : slot.operands) if(!is_literal(plan, s)) fork = true;
            return call(c->name, eval_all(plan, slot.operands, 0, st, fork), st);
        }
        if(std::holds_alternative<IfToken>(t)){
            Value cond = eval(plan, slot.operands[0], st);
            if(!cond.is_boolean()) throw make_error(ErrorKind::InvalidCondition);
            return eval(plan, slot.operands[cond.as_boolean() ? 1 : 2], st);
        }
        if(auto* m = std::get_if<MatchToken>(&t)){
            Value scrutinee = eval(plan, slot.operands[0], st);
            for(std::size_t k = 0; k < m->arms.size(); ++k)
                if(pattern_matches(m->arms[k].pattern, scrutinee)) return eval(plan, slot.operands[k + 1], st);
            throw make_error(ErrorKind::MatchNotFound);
        }
        if(auto* let = std::get_if<LetToken>(&t)){
            auto frame = std::make_shared<Frame>();
            frame->parent = st.frame;
            for(auto& fn : group_definitions(let->defs, slot.defs)){
                fn->env = frame;
                frame->functions[fn->name] = fn;
            }
            Stack inner{frame, st.scope, st.depth};
            return eval(plan, slot.operands[0], inner);
        }
        if(auto* f = std::get_if<ForToken>(&t)) return iterate_for(plan, slot, f->var, st);
        if(std::holds_alternative<LoopToken>(t)) return iterate_loop(plan, slot, st);
        throw std::logic_error("malformed block: jump evaluated");
    }

    static bool scalar_matches(const Value& pattern, const Value& v){
        if(pattern.is_integer() && v.is_integer()) return pattern.as_integer() == v.as_integer();
        if(pattern.is_number() && v.is_number()) return pattern.number() == v.number();
        if(pattern.is_boolean() && v.is_boolean()) return pattern.as_boolean() == v.as_boolean();
        throw make_error(ErrorKind::InvalidMatch);
    }

    // Membership needs list items of the scrutinee's own kind.
    static bool member_matches(const Value& item, const Value& v){
        bool same = (item.is_integer() && v.is_integer()) || (item.is_float() && v.is_float()) ||
                    (item.is_boolean() && v.is_boolean());
        if(!same) throw make_error(ErrorKind::InvalidMatch);
        return item == v;
    }

    static bool literal_matches(const Literal& lit, const Value& v){
        Value p = from_literal(lit);
        if(p.is_shape() || v.is_shape() || v.is_list()) throw make_error(ErrorKind::InvalidMatch);
        if(p.is_list()){
            bool found = false;
            for(auto& item : p.as_list()) if(member_matches(item, v)) found = true;
            return found;
        }
        return scalar_matches(p, v);
    }

    static bool pattern_matches(const Pattern& pattern, const Value& v){
        if(std::holds_alternative<PatternWildcard>(pattern)) return true;
        for(auto& lit : std::get<PatternMatches>(pattern).literals) if(literal_matches(lit, v)) return true;
        return false;
    }

    static std::size_t iteration_count(const Value& v){
        if(v.is_integer()){
            if(v.as_integer() < 0) throw make_error(ErrorKind::NegativeNumber);
            return static_cast<std::size_t>(v.as_integer());
        }
        if(v.is_float()){
            if(v.as_float() < 0.0f) throw make_error(ErrorKind::NegativeNumber);
            if(!(v.as_float() < 2147483648.0f)) throw make_error(ErrorKind::NotIterable);
            return static_cast<std::size_t>(v.as_float());
        }
        throw make_error(ErrorKind::NotIterable);
    }

    Value collect_iterations(std::size_t n, const std::function<Value(std::size_t)>& body){
        std::vector<Value> out(n);
        if(n < 2 || in_.pool_.threads() == 1){
            for(std::size_t i = 0; i < n; ++i) out[i] = body(i);
        } else {
            std::vector<std::function<void()>> jobs;
            jobs.reserve(n);
            for(std::size_t i = 0; i < n; ++i) jobs.emplace_back([&, i]{ out[i] = body(i); });
            in_.pool_.run(jobs);
        }
        return checked_list(std::move(out));
    }

    Value iterate_for(const Plan& plan, const Slot& slot, const std::string& var, const Stack& st){
        Value iter = eval(plan, slot.operands[0], st);
        std::vector<Value> items;
        if(iter.is_list()) items = iter.as_list();
        else {
            std::size_t n = iteration_count(iter);
            items.reserve(n);
            for(std::size_t i = 0; i < n; ++i) items.emplace_back(static_cast<std::int32_t>(i));
        }
        return collect_iterations(items.size(), [&](std::size_t i){
            auto frame = std::make_shared<Frame>();
            frame->parent = st.frame;
            frame->functions[var] = bound_value(var, items[i]);
            Stack inner{frame, st.scope, st.depth};
            return eval(plan, slot.operands[1], inner);
        });
    }

    Value iterate_loop(const Plan& plan, const Slot& slot, const Stack& st){
        std::size_t n = iteration_count(eval(plan, slot.operands[0], st));
        return collect_iterations(n, [&](std::size_t){ return eval(plan, slot.operands[1], st); });
    }

    static bool all_scalar(const std::vector<Value>& args){
        for(auto& a : args) if(a.is_shape() || a.is_list()) return false;
        return true;
    }

    // Builtins shadow locals, locals shadow globals.
    Value call(const std::string& name, std::vector<Value> args, const Stack& st){
        in_.counters_.calls++;
        if(const Builtin* b = find_builtin(name)){
            CallContext ctx{name, cache_, in_.options_.width, in_.options_.height};
            if(!in_.options_.cache || !b->pure || !all_scalar(args)) return call_builtin(*b, ctx, args);
            std::uint64_t key = Cache::hash_call(name, 0, args, st.scope);
            if(auto hit = cache_.get(key)){ in_.counters_.hits++; return *hit; }
            in_.counters_.misses++;
            Value v = call_builtin(*b, ctx, args);
            cache_.insert(key, v);
            return v;
        }
        if(st.frame){
            if(const Function* fn = st.frame->find(name)) return invoke(*fn, args, st);
        }
        auto it = globals_.find(name);
        if(it == globals_.end()) throw unknown_function(name);
        return invoke(*it->second, args, st);
    }

    std::size_t choose_branch(const Function& fn){
        if(!fn.weighted) return 0;
        std::vector<double> weights;
        for(auto& b : fn.bodies) weights.push_back(b.second);
        return cache_.with_rng([&](Cache::Rng& rng){
            return std::discrete_distribution<std::size_t>(weights.begin(), weights.end())(rng);
        });
    }

    Value invoke(const Function& fn, const std::vector<Value>& args, const Stack& st){
        if(args.size() != fn.params.size()) throw arity_mismatch(fn.name, fn.params.size(), args.size());
        std::size_t depth = st.depth + 1;
        if(depth > in_.options_.maxDepth) throw make_error(ErrorKind::MaxDepthReached);
        std::size_t branch = choose_branch(fn);
        const Body& body = fn.bodies[branch].first;
        if(!body.plan) return body.value;

        bool cacheable = in_.options_.cache && fn.global && fn.pure;
        std::uint64_t key = 0;
        if(cacheable){
            key = Cache::hash_call(fn.name, branch, args, st.scope);
            if(auto hit = cache_.get(key)){
                in_.counters_.hits++;
                if(in_.options_.trace) trace_call(fn.name, branch, depth, true);
                return *hit;
            }
            in_.counters_.misses++;
        }
        if(in_.options_.trace) trace_call(fn.name, branch, depth, false);

        // Global bodies see only their parameters and the globals.
        FramePtr parent;
        if(!fn.global){
            parent = fn.env.lock();
            if(!parent) throw std::logic_error("let function outlived its frame");
        }
        FramePtr frame = parent;
        if(!fn.params.empty()){
            auto f = std::make_shared<Frame>();
            f->parent = parent;
            for(std::size_t i = 0; i < args.size(); ++i) f->functions[fn.params[i]] = bound_value(fn.params[i], args[i]);
            frame = f;
        }
        Stack inner{frame, fn.global ? std::optional<Scope>(Scope{fn.name, branch}) : st.scope, depth};
        in_.counters_.bodies++;
        Value v = eval(*body.plan, body.plan->root, inner);
        if(cacheable) cache_.insert(key, v);
        return v;
    }

    Interpreter& in_;
    Cache cache_;
    std::unordered_map<std::string, FunctionPtr> globals_;
};

ReduceOptions ReduceOptions::from_env(){
    ReduceOptions o;
    const auto env = detect_env();
    if(env.maxDepth) o.maxDepth = *env.maxDepth;
    if(env.threads) o.threads = *env.threads;
    if(env.width) o.width = *env.width;
    if(env.height) o.height = *env.height;
    o.cache = !env.noCache;
    o.trace = env.trace;
    return o;
}

Interpreter::Interpreter(ReduceOptions options) : options_(std::move(options)), pool_(options_.threads) {}

Value Interpreter::run(const Tree& tree, const std::string& entry){
    counters_.calls = 0; counters_.bodies = 0; counters_.hits = 0; counters_.misses = 0;
    Evaluation ev(*this, tree);
    return ev.call_entry(entry);
}

ShapePtr Interpreter::reduce(const Tree& tree){
    Value v = run(tree, "root");
    if(!v.is_shape()) throw make_error(ErrorKind::InvalidRoot);
    return v.as_shape();
}

ReduceStats Interpreter::stats() const {
    ReduceStats s;
    s.calls = counters_.calls.load();
    s.bodyEvaluations = counters_.bodies.load();
    s.cacheHits = counters_.hits.load();
    s.cacheMisses = counters_.misses.load();
    return s;
}

ShapePtr reduce(const Tree& tree, std::optional<Seed> seed){
    ReduceOptions options;
    options.seed = seed;
    Interpreter in(std::move(options));
    return in.reduce(tree);
}

} // namespace xylo
