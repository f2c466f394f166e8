// Test-only builder for small, valid class files. Independent of the library's
// writer so that reader/writer tests have a fixed reference encoding.
#pragma once
#include <algorithm>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace fixture {

struct MethodSpec { std::string name; std::string descriptor; uint16_t access = 0x0001; };

struct ClassSpec {
    std::string name = "demo/Sample";
    std::string superName = "java/lang/Object";
    uint16_t major = 49;
    uint16_t minor = 0;
    uint16_t access = 0x0021; // public super
    std::vector<std::string> interfaces;
    std::vector<std::string> strings;       // CONSTANT_String values, in table order
    std::vector<MethodSpec> methods = { { "<init>", "()V" } };
    std::vector<std::string> fields;        // int fields
    bool withLong = false;                  // adds a CONSTANT_Long after the strings
};

class Bytes {
public:
    std::vector<uint8_t> out;
    void u1(uint8_t v){ out.push_back(v); }
    void u2(uint16_t v){ u1(uint8_t(v >> 8)); u1(uint8_t(v & 0xFF)); }
    void u4(uint32_t v){ u2(uint16_t(v >> 16)); u2(uint16_t(v & 0xFFFF)); }
    void str(const std::string& s){ out.insert(out.end(), s.begin(), s.end()); }
};

inline std::vector<uint8_t> make_class(const ClassSpec& spec){
    Bytes pool;
    uint16_t next = 1;
    std::map<std::string, uint16_t> utf8s;
    std::map<std::string, uint16_t> classes;
    auto utf8 = [&](const std::string& s)->uint16_t{
        auto it = utf8s.find(s); if(it != utf8s.end()) return it->second;
        pool.u1(1); pool.u2(uint16_t(s.size())); pool.str(s);
        utf8s[s] = next; return next++;
    };
    auto cls = [&](const std::string& s)->uint16_t{
        auto it = classes.find(s); if(it != classes.end()) return it->second;
        uint16_t n = utf8(s); pool.u1(7); pool.u2(n);
        classes[s] = next; return next++;
    };

    uint16_t thisClass = cls(spec.name);
    uint16_t superClass = spec.superName.empty() ? 0 : cls(spec.superName);
    std::vector<uint16_t> interfaces;
    for(const auto& i : spec.interfaces) interfaces.push_back(cls(i));
    for(const auto& s : spec.strings){ uint16_t n = utf8(s); pool.u1(8); pool.u2(n); next++; }
    if(spec.withLong){ pool.u1(5); pool.u4(0x01234567); pool.u4(0x89ABCDEF); next += 2; }
    uint16_t code = utf8("Code");
    struct M { uint16_t access, name, desc; };
    std::vector<M> methods, fields;
    for(const auto& m : spec.methods) methods.push_back({ m.access, utf8(m.name), utf8(m.descriptor) });
    for(const auto& f : spec.fields) fields.push_back({ 0x0001, utf8(f), utf8("I") });

    Bytes b;
    b.u4(0xCAFEBABE);
    b.u2(spec.minor);
    b.u2(spec.major);
    b.u2(next);
    b.out.insert(b.out.end(), pool.out.begin(), pool.out.end());
    b.u2(spec.access);
    b.u2(thisClass);
    b.u2(superClass);
    b.u2(uint16_t(interfaces.size()));
    for(auto i : interfaces) b.u2(i);
    b.u2(uint16_t(fields.size()));
    for(const auto& f : fields){ b.u2(f.access); b.u2(f.name); b.u2(f.desc); b.u2(0); }
    b.u2(uint16_t(methods.size()));
    for(const auto& m : methods){
        b.u2(m.access); b.u2(m.name); b.u2(m.desc);
        b.u2(1);            // attributes_count
        b.u2(code);
        b.u4(13);           // attribute_length
        b.u2(1); b.u2(1);   // max_stack, max_locals
        b.u4(1); b.u1(0xB1); // return
        b.u2(0); b.u2(0);
    }
    b.u2(0); // class attributes
    return b.out;
}

inline std::vector<uint8_t> sample_class(){
    ClassSpec s;
    s.strings = { "alpha", "beta", "alpha" };
    s.fields = { "counter" };
    s.methods = { { "<init>", "()V" }, { "run", "()V" } };
    return make_class(s);
}

// Number of non-overlapping occurrences of `needle` in `hay`.
inline int count_occurrences(const std::vector<uint8_t>& hay, const std::string& needle){
    int n = 0;
    if(needle.empty() || hay.size() < needle.size()) return 0;
    for(size_t i = 0; i + needle.size() <= hay.size();){
        if(std::equal(needle.begin(), needle.end(), hay.begin() + i, [](char a, uint8_t b){ return uint8_t(a) == b; })){ ++n; i += needle.size(); }
        else ++i;
    }
    return n;
}

} // namespace fixture
