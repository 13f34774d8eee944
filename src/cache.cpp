#include "xylo/cache.hpp"
#include "xylo/error.hpp"
#include <cstring>
#include <functional>
#include <type_traits>
#include <unordered_map>

namespace xylo {

namespace {

void put_u64(std::string& out, std::uint64_t v){
    for(int shift = 56; shift >= 0; shift -= 8) out.push_back(static_cast<char>((v >> shift) & 0xff));
}

void put_float(std::string& out, float f){
    std::uint32_t bits;
    std::memcpy(&bits, &f, sizeof(bits));
    put_u64(out, bits);
}

void put_string(std::string& out, std::string_view s){
    put_u64(out, s.size());
    out.append(s.data(), s.size());
}

void put_transform(std::string& out, const Transform& t){
    put_float(out, t.sx); put_float(out, t.kx); put_float(out, t.ky);
    put_float(out, t.sy); put_float(out, t.tx); put_float(out, t.ty);
}

void put_optional(std::string& out, const std::optional<float>& v){
    out.push_back(v ? 1 : 0);
    if(v) put_float(out, *v);
}

void put_change(std::string& out, const HslaChange& c){
    for(auto* part : {&c.h, &c.s, &c.l, &c.a}) put_optional(out, *part);
}

using DigestMemo = std::unordered_map<const Shape*, std::uint64_t>;

// Structural digest; shared children are hashed once.
std::uint64_t shape_digest(const Shape& s, DigestMemo& memo){
    auto it = memo.find(&s);
    if(it != memo.end()) return it->second;
    std::string out;
    if(auto* b = std::get_if<BasicShape>(&s.data)){
        out.push_back('b');
        out.push_back(static_cast<char>(b->kind));
        for(float g : b->geometry) put_float(out, g);
        put_transform(out, b->transform);
        put_float(out, b->color.h); put_float(out, b->color.s); put_float(out, b->color.l); put_float(out, b->color.a);
        put_optional(out, b->zindex);
    } else {
        put_transform(out, s.transform);
        put_change(out, s.overwrite);
        put_change(out, s.shift);
        put_optional(out, s.zindex_overwrite);
        put_optional(out, s.zindex_shift);
        if(auto* c = std::get_if<Composite>(&s.data)){
            out.push_back('c');
            put_u64(out, shape_digest(*c->a, memo));
            put_u64(out, shape_digest(*c->b, memo));
        } else {
            const auto& shapes = std::get<Collection>(s.data).shapes;
            out.push_back('C');
            put_u64(out, shapes.size());
            for(auto& child : shapes) put_u64(out, shape_digest(*child, memo));
        }
    }
    std::uint64_t d = std::hash<std::string>{}(out);
    memo.emplace(&s, d);
    return d;
}

void serialize_into(const Value& v, std::string& out, DigestMemo& memo){
    std::visit([&](const auto& x){
        using T = std::decay_t<decltype(x)>;
        if constexpr(std::is_same_v<T,std::int32_t>){ out.push_back('i'); put_u64(out, static_cast<std::uint32_t>(x)); }
        else if constexpr(std::is_same_v<T,float>){ out.push_back('f'); put_float(out, x); }
        else if constexpr(std::is_same_v<T,bool>){ out.push_back('B'); out.push_back(x ? 1 : 0); }
        else if constexpr(std::is_same_v<T,ShapePtr>){ out.push_back('s'); put_u64(out, shape_digest(*x, memo)); }
        else {
            out.push_back('l');
            put_u64(out, x.items.size());
            for(auto& item : x.items) serialize_into(item, out, memo);
        }
    }, v.data);
}

} // namespace

void serialize_value(const Value& v, std::string& out){
    DigestMemo memo;
    serialize_into(v, out, memo);
}

Seed seed_from_string(std::string_view text){
    // splitmix64 stream keyed by the FNV-1a hash of the text
    std::uint64_t state = 0xcbf29ce484222325ULL;
    for(unsigned char ch : text){
        state ^= ch;
        state *= 0x100000001b3ULL;
    }
    Seed seed{};
    for(size_t i = 0; i < seed.size(); i += 8){
        state += 0x9e3779b97f4a7c15ULL;
        std::uint64_t z = state;
        z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
        z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
        z ^= z >> 31;
        for(size_t b = 0; b < 8; ++b) seed[i + b] = static_cast<std::uint8_t>(z >> (8 * b));
    }
    return seed;
}

Cache::Cache(std::optional<Seed> seed){
    std::vector<std::uint32_t> words;
    if(seed){
        for(size_t i = 0; i < seed->size(); i += 4)
            words.push_back(static_cast<std::uint32_t>((*seed)[i]) << 24 | static_cast<std::uint32_t>((*seed)[i+1]) << 16 |
                            static_cast<std::uint32_t>((*seed)[i+2]) << 8 | static_cast<std::uint32_t>((*seed)[i+3]));
    } else {
        try {
            std::random_device rd;
            for(int i = 0; i < 8; ++i) words.push_back(rd());
        } catch (const std::exception&) {
            throw make_error(ErrorKind::MissingSeed);
        }
    }
    std::seed_seq seq(words.begin(), words.end());
    rng_.seed(seq);
}

std::uint64_t Cache::hash_call(std::string_view name, std::size_t branch, const std::vector<Value>& args, const std::optional<Scope>& scope){
    std::string buf;
    buf.append(name.data(), name.size());
    put_u64(buf, branch);
    put_u64(buf, args.size());
    DigestMemo memo;
    for(auto& a : args) serialize_into(a, buf, memo);
    if(scope){
        buf.push_back(1);
        put_string(buf, scope->name);
        put_u64(buf, scope->branch);
    } else {
        buf.push_back(0);
    }
    return static_cast<std::uint64_t>(std::hash<std::string>{}(buf));
}

std::optional<Value> Cache::get(std::uint64_t key) const {
    const Shard& s = shard(key);
    std::lock_guard<std::mutex> lk(s.m);
    auto it = s.entries.find(key);
    if(it == s.entries.end()) return std::nullopt;
    return it->second;
}

void Cache::insert(std::uint64_t key, const Value& value){
    Shard& s = shard(key);
    std::lock_guard<std::mutex> lk(s.m);
    s.entries.emplace(key, value);
}

std::size_t Cache::size() const {
    std::size_t n = 0;
    for(auto& s : shards_){
        std::lock_guard<std::mutex> lk(s.m);
        n += s.entries.size();
    }
    return n;
}

} // namespace xylo
