#include "xylo/block.hpp"
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <type_traits>

namespace xylo {

const char* symbol(BinaryOperator op){
    switch(op){
        case BinaryOperator::Addition: return "+";
        case BinaryOperator::Subtraction: return "-";
        case BinaryOperator::Multiplication: return "*";
        case BinaryOperator::Division: return "/";
        case BinaryOperator::Modulo: return "%";
        case BinaryOperator::Exponentiation: return "**";
        case BinaryOperator::Equal: return "==";
        case BinaryOperator::NotEqual: return "!=";
        case BinaryOperator::LessThan: return "<";
        case BinaryOperator::LessThanOrEqual: return "<=";
        case BinaryOperator::GreaterThan: return ">";
        case BinaryOperator::GreaterThanOrEqual: return ">=";
        case BinaryOperator::And: return "&&";
        case BinaryOperator::Or: return "||";
        case BinaryOperator::Range: return "..";
        case BinaryOperator::RangeInclusive: return "..=";
        case BinaryOperator::Composition: return ":";
    }
    return "?";
}

int precedence(BinaryOperator op){
    switch(op){
        case BinaryOperator::Or: return 1;
        case BinaryOperator::And: return 2;
        case BinaryOperator::Range: case BinaryOperator::RangeInclusive: return 3;
        case BinaryOperator::Addition: case BinaryOperator::Subtraction: return 4;
        case BinaryOperator::Multiplication: case BinaryOperator::Division: case BinaryOperator::Modulo: return 5;
        case BinaryOperator::Exponentiation: return 6;
        default: return 0; // composition and comparisons
    }
}

static bool literals_equal(const LiteralList& a, const LiteralList& b){
    if(a.items.size()!=b.items.size()) return false;
    for(size_t i=0;i<a.items.size();++i) if(!(a.items[i]==b.items[i])) return false;
    return true;
}

bool operator==(const Literal& a, const Literal& b){
    if(a.data.index()!=b.data.index()) return false;
    return std::visit([&](const auto& x)->bool{
        using T = std::decay_t<decltype(x)>;
        const auto& y = std::get<T>(b.data);
        if constexpr(std::is_same_v<T,LiteralList>) return literals_equal(x,y);
        else if constexpr(std::is_same_v<T,HexColor>) return x.r==y.r && x.g==y.g && x.b==y.b;
        else return x==y;
    }, a.data);
}

static bool pattern_equal(const Pattern& a, const Pattern& b){
    if(a.index()!=b.index()) return false;
    if(auto* m = std::get_if<PatternMatches>(&a)){
        const auto& n = std::get<PatternMatches>(b);
        return literals_equal(LiteralList{m->literals}, LiteralList{n.literals});
    }
    return true;
}

bool operator==(const Definition& a, const Definition& b){
    return a.name==b.name && a.weight==b.weight && a.params==b.params && a.block==b.block;
}

bool operator==(const Token& a, const Token& b){
    if(a.data.index()!=b.data.index()) return false;
    return std::visit([&](const auto& x)->bool{
        using T = std::decay_t<decltype(x)>;
        const auto& y = std::get<T>(b.data);
        if constexpr(std::is_same_v<T,Literal> || std::is_same_v<T,BinaryOperator>) return x==y;
        else if constexpr(std::is_same_v<T,CallToken>) return x.name==y.name && x.argc==y.argc;
        else if constexpr(std::is_same_v<T,LetToken>) return x.skip==y.skip && x.defs==y.defs;
        else if constexpr(std::is_same_v<T,ForToken>) return x.var==y.var && x.skip==y.skip;
        else if constexpr(std::is_same_v<T,MatchToken>){
            if(x.arms.size()!=y.arms.size()) return false;
            for(size_t i=0;i<x.arms.size();++i)
                if(x.arms[i].skip!=y.arms[i].skip || !pattern_equal(x.arms[i].pattern, y.arms[i].pattern)) return false;
            return true;
        }
        else return x.skip==y.skip;
    }, a.data);
}

std::string format_float(float f){
    // Shortest fixed-notation text that reads back to the same float.
    char buf[64];
    for(int prec=1; prec<=60; ++prec){
        std::snprintf(buf, sizeof(buf), "%.*f", prec, static_cast<double>(f));
        if(std::strtof(buf, nullptr)==f) break;
    }
    return buf;
}

const char* shape_keyword(ShapeKind k){
    switch(k){
        case ShapeKind::Square: return "SQUARE";
        case ShapeKind::Circle: return "CIRCLE";
        case ShapeKind::Triangle: return "TRIANGLE";
        case ShapeKind::Fill: return "FILL";
        case ShapeKind::Empty: return "EMPTY";
    }
    return "EMPTY";
}

std::string to_string(const Literal& lit){
    return std::visit([](const auto& x)->std::string{
        using T = std::decay_t<decltype(x)>;
        if constexpr(std::is_same_v<T,std::int32_t>) return std::to_string(x);
        else if constexpr(std::is_same_v<T,float>) return format_float(x);
        else if constexpr(std::is_same_v<T,bool>) return x? "true" : "false";
        else if constexpr(std::is_same_v<T,HexColor>){ char buf[8]; std::snprintf(buf,sizeof(buf),"#%02x%02x%02x",x.r,x.g,x.b); return buf; }
        else if constexpr(std::is_same_v<T,ShapeKind>) return shape_keyword(x);
        else {
            std::string out="[";
            for(size_t i=0;i<x.items.size();++i){ if(i) out+=","; out+=to_string(x.items[i]); }
            return out+"]";
        }
    }, lit.data);
}

std::string to_string(BinaryOperator op){ return symbol(op); }

std::string dump(const Block& block, int indent){
    std::ostringstream os;
    std::string pad(static_cast<size_t>(indent)*2, ' ');
    for(size_t i=0;i<block.size();++i){
        os<<pad<<i<<": ";
        std::visit([&](const auto& t){
            using T = std::decay_t<decltype(t)>;
            if constexpr(std::is_same_v<T,Literal>) os<<"Literal "<<to_string(t);
            else if constexpr(std::is_same_v<T,BinaryOperator>) os<<"BinaryOperator "<<symbol(t);
            else if constexpr(std::is_same_v<T,CallToken>) os<<"Call "<<t.name<<" "<<t.argc;
            else if constexpr(std::is_same_v<T,LetToken>){
                os<<"Let "<<t.skip<<"\n";
                for(auto& d : t.defs){ os<<pad<<"  def "<<d.name<<"\n"<<dump(d.block, indent+2); }
                return;
            }
            else if constexpr(std::is_same_v<T,IfToken>) os<<"If "<<t.skip;
            else if constexpr(std::is_same_v<T,JumpToken>) os<<"Jump "<<t.skip;
            else if constexpr(std::is_same_v<T,MatchToken>){ os<<"Match"; for(auto& a : t.arms) os<<" "<<a.skip; }
            else if constexpr(std::is_same_v<T,ForToken>) os<<"For "<<t.var<<" "<<t.skip;
            else os<<"Loop "<<t.skip;
            os<<"\n";
        }, block[i].data);
    }
    return os.str();
}

} // namespace xylo
