#include "classforge/class_writer.hpp"

#include <llvm/Support/Endian.h>

namespace classforge {

uint16_t SymbolTable::addRaw(Tag tag, std::string bytes){
    if(uint16_t existing = pool_.find(tag, bytes)) return existing;
    Constant c; c.tag = static_cast<uint8_t>(tag); c.bytes = std::move(bytes);
    return pool_.append(std::move(c));
}

uint16_t SymbolTable::addUtf8Raw(const std::string& modified){
    if(modified.size() > 0xFFFF) throw format_error("Utf8 constant longer than 65535 bytes");
    return addRaw(Tag::Utf8, modified);
}

uint16_t SymbolTable::addUtf8(const std::string& text){ return addUtf8Raw(encode_modified_utf8(text)); }
uint16_t SymbolTable::addClass(const std::string& internalName){ return addRaw(Tag::Class, pack_u2(addUtf8(internalName))); }
uint16_t SymbolTable::addString(const std::string& value){ return addRaw(Tag::String, pack_u2(addUtf8(value))); }

uint16_t SymbolTable::addNameAndType(const std::string& name, const std::string& descriptor){
    uint16_t n = addUtf8(name); uint16_t d = addUtf8(descriptor);
    return addRaw(Tag::NameAndType, pack_u2(n) + pack_u2(d));
}

uint16_t SymbolTable::addMethodref(const std::string& owner, const std::string& name, const std::string& descriptor){
    uint16_t c = addClass(owner); uint16_t nt = addNameAndType(name, descriptor);
    return addRaw(Tag::Methodref, pack_u2(c) + pack_u2(nt));
}

int SymbolTable::replaceString(const std::string& from, const std::string& to){
    std::vector<uint16_t> hits;
    const auto& entries = pool_.entries();
    for(size_t i = 1; i < entries.size(); ++i){
        if(entries[i].kind() != Tag::String) continue;
        if(decode_modified_utf8(pool_.utf8(unpack_u2(entries[i].bytes))) == from) hits.push_back(static_cast<uint16_t>(i));
    }
    if(hits.empty() || from == to) return 0;
    std::string ref = pack_u2(addUtf8(to));
    for(uint16_t i : hits) pool_.at(i).bytes = ref;
    return static_cast<int>(hits.size());
}

namespace {

struct ByteSink {
    std::vector<uint8_t> out;
    void u1(uint8_t v){ out.push_back(v); }
    void u2(uint16_t v){ size_t at = out.size(); out.resize(at + 2); llvm::support::endian::write16be(out.data() + at, v); }
    void u4(uint32_t v){ size_t at = out.size(); out.resize(at + 4); llvm::support::endian::write32be(out.data() + at, v); }
    void raw(const std::string& s){ out.insert(out.end(), s.begin(), s.end()); }
    void raw(const std::vector<uint8_t>& b){ out.insert(out.end(), b.begin(), b.end()); }
};

// Table lengths are u2 on disk.
uint16_t u2_count(size_t n, const char* what){
    if(n > 0xFFFF) throw format_error(std::string("too many ") + what + ": " + std::to_string(n));
    return static_cast<uint16_t>(n);
}

struct Resolved {
    uint16_t access, name, descriptor;
    std::vector<std::pair<uint16_t, const Attribute*>> attributes;
};

} // namespace

std::vector<uint8_t> ClassWriter::toByteArray(){
    if(!header_ || !ended_) throw std::logic_error("ClassWriter: class was not fully visited");
    const ClassHeader& h = *header_;

    // Intern every name before serializing; the pool precedes the members on disk.
    auto utf8 = [&](const std::string& onDisk){
        if(uint16_t i = symbols_.pool().find(Tag::Utf8, onDisk)) return i;
        return symbols_.addUtf8(decode_modified_utf8(onDisk));
    };
    auto cls = [&](const std::string& internalName){
        uint16_t u = utf8(internalName);
        if(uint16_t i = symbols_.pool().find(Tag::Class, pack_u2(u))) return i;
        return symbols_.addClass(decode_modified_utf8(internalName));
    };
    uint16_t thisClass = cls(h.name);
    uint16_t superClass = h.superName.empty() ? 0 : cls(h.superName);
    std::vector<uint16_t> interfaces;
    for(const auto& i : h.interfaces) interfaces.push_back(cls(i));

    auto resolveAttrs = [&](const std::vector<Attribute>& attrs){
        std::vector<std::pair<uint16_t, const Attribute*>> out;
        for(const auto& a : attrs) out.emplace_back(utf8(a.name), &a);
        return out;
    };
    auto resolveMembers = [&](const std::vector<MemberInfo>& members){
        std::vector<Resolved> out;
        for(const auto& m : members) out.push_back(Resolved{ m.access, utf8(m.name), utf8(m.descriptor), resolveAttrs(m.attributes) });
        return out;
    };
    auto fields = resolveMembers(fields_);
    auto methods = resolveMembers(methods_);
    auto classAttrs = resolveAttrs(attributes_);

    ByteSink s;
    s.u4(kClassMagic);
    s.u2(h.minorVersion);
    s.u2(h.majorVersion);
    const ConstantPool& pool = symbols_.pool();
    s.u2(pool.count());
    for(const auto& c : pool.entries()){
        if(!c.usable()) continue;
        s.u1(c.tag);
        if(c.kind() == Tag::Utf8) s.u2(static_cast<uint16_t>(c.bytes.size()));
        s.raw(c.bytes);
    }
    s.u2(h.access);
    s.u2(thisClass);
    s.u2(superClass);
    s.u2(u2_count(interfaces.size(), "interfaces"));
    for(uint16_t i : interfaces) s.u2(i);

    auto writeAttrs = [&](const std::vector<std::pair<uint16_t, const Attribute*>>& attrs){
        s.u2(u2_count(attrs.size(), "attributes"));
        for(const auto& [name, a] : attrs){ s.u2(name); s.u4(static_cast<uint32_t>(a->data.size())); s.raw(a->data); }
    };
    auto writeMembers = [&](const std::vector<Resolved>& members, const char* what){
        s.u2(u2_count(members.size(), what));
        for(const auto& m : members){ s.u2(m.access); s.u2(m.name); s.u2(m.descriptor); writeAttrs(m.attributes); }
    };
    writeMembers(fields, "fields");
    writeMembers(methods, "methods");
    writeAttrs(classAttrs);
    return std::move(s.out);
}

} // namespace classforge
