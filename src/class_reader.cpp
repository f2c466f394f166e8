#include "classforge/class_reader.hpp"

#include <llvm/Support/BinaryStreamReader.h>
#include <llvm/Support/Error.h>

namespace classforge {

namespace {

struct Cursor {
    llvm::BinaryStreamReader r;
    explicit Cursor(llvm::ArrayRef<uint8_t> bytes) : r(bytes, llvm::support::big) {}

    template <typename T> T read(const char* what){
        T v{};
        if(auto err = r.readInteger(v))
            throw format_error(std::string("truncated class file reading ") + what + ": " + llvm::toString(std::move(err)));
        return v;
    }
    llvm::ArrayRef<uint8_t> bytes(uint32_t n, const char* what){
        llvm::ArrayRef<uint8_t> out;
        if(auto err = r.readBytes(out, n))
            throw format_error(std::string("truncated class file reading ") + what + ": " + llvm::toString(std::move(err)));
        return out;
    }
    std::string text(uint32_t n, const char* what){
        auto b = bytes(n, what);
        return std::string(reinterpret_cast<const char*>(b.data()), b.size());
    }
};

uint32_t payload_size(Tag t){
    switch(t){
        case Tag::Class: case Tag::String: case Tag::MethodType: case Tag::Module: case Tag::Package: return 2;
        case Tag::MethodHandle: return 3;
        case Tag::Integer: case Tag::Float: case Tag::Fieldref: case Tag::Methodref: case Tag::InterfaceMethodref:
        case Tag::NameAndType: case Tag::Dynamic: case Tag::InvokeDynamic: return 4;
        case Tag::Long: case Tag::Double: return 8;
        case Tag::Utf8: break;
    }
    return 0;
}

bool known_tag(uint8_t t){
    switch(static_cast<Tag>(t)){
        case Tag::Utf8: case Tag::Integer: case Tag::Float: case Tag::Long: case Tag::Double: case Tag::Class:
        case Tag::String: case Tag::Fieldref: case Tag::Methodref: case Tag::InterfaceMethodref: case Tag::NameAndType:
        case Tag::MethodHandle: case Tag::MethodType: case Tag::Dynamic: case Tag::InvokeDynamic: case Tag::Module:
        case Tag::Package: return true;
    }
    return false;
}

std::vector<Attribute> read_attributes(Cursor& c, const ConstantPool& pool){
    uint16_t n = c.read<uint16_t>("attributes_count");
    std::vector<Attribute> out; out.reserve(n);
    for(uint16_t i = 0; i < n; ++i){
        Attribute a;
        a.name = pool.utf8(c.read<uint16_t>("attribute_name_index"));
        uint32_t len = c.read<uint32_t>("attribute_length");
        auto data = c.bytes(len, "attribute payload");
        a.data.assign(data.begin(), data.end());
        out.push_back(std::move(a));
    }
    return out;
}

std::vector<MemberInfo> read_members(Cursor& c, const ConstantPool& pool, const char* what){
    uint16_t n = c.read<uint16_t>(what);
    std::vector<MemberInfo> out; out.reserve(n);
    for(uint16_t i = 0; i < n; ++i){
        MemberInfo m;
        m.access = c.read<uint16_t>("member access_flags");
        m.name = pool.utf8(c.read<uint16_t>("member name_index"));
        m.descriptor = pool.utf8(c.read<uint16_t>("member descriptor_index"));
        m.attributes = read_attributes(c, pool);
        out.push_back(std::move(m));
    }
    return out;
}

} // namespace

ClassReader::ClassReader(llvm::ArrayRef<uint8_t> bytes){
    Cursor c(bytes);
    if(c.read<uint32_t>("magic") != kClassMagic) throw format_error("bad class file magic");
    header_.minorVersion = c.read<uint16_t>("minor_version");
    header_.majorVersion = c.read<uint16_t>("major_version");

    uint16_t count = c.read<uint16_t>("constant_pool_count");
    if(count == 0) throw format_error("constant_pool_count must be at least 1");
    while(pool_.count() < count){
        uint8_t tag = c.read<uint8_t>("constant tag");
        if(!known_tag(tag)) throw format_error("unknown constant tag " + std::to_string(tag) + " at index " + std::to_string(pool_.count()));
        Constant k; k.tag = tag;
        if(k.kind() == Tag::Utf8){
            uint16_t len = c.read<uint16_t>("Utf8 length");
            k.bytes = c.text(len, "Utf8 bytes");
        } else {
            k.bytes = c.text(payload_size(k.kind()), "constant payload");
        }
        if(slot_width(k.kind()) == 2 && pool_.count() + 1 >= count) throw format_error("wide constant overruns constant pool");
        pool_.append(std::move(k));
    }

    header_.access = c.read<uint16_t>("access_flags");
    header_.name = pool_.className(c.read<uint16_t>("this_class"));
    if(uint16_t super = c.read<uint16_t>("super_class")) header_.superName = pool_.className(super);
    uint16_t nInterfaces = c.read<uint16_t>("interfaces_count");
    for(uint16_t i = 0; i < nInterfaces; ++i) header_.interfaces.push_back(pool_.className(c.read<uint16_t>("interface index")));

    fields_ = read_members(c, pool_, "fields_count");
    methods_ = read_members(c, pool_, "methods_count");
    attributes_ = read_attributes(c, pool_);
    if(!c.r.empty()) throw format_error("trailing bytes after class attributes");
}

std::vector<std::string> ClassReader::stringConstants() const {
    std::vector<std::string> out;
    const auto& entries = pool_.entries();
    for(size_t i = 1; i < entries.size(); ++i){
        if(entries[i].kind() != Tag::String) continue;
        out.push_back(decode_modified_utf8(pool_.utf8(unpack_u2(entries[i].bytes))));
    }
    return out;
}

void ClassReader::accept(ClassVisitor& visitor) const {
    visitor.visitConstantPool(pool_);
    visitor.visit(header_);
    for(const auto& f : fields_) visitor.visitField(f);
    for(const auto& m : methods_) visitor.visitMethod(m);
    for(const auto& a : attributes_) visitor.visitAttribute(a);
    visitor.visitEnd();
}

} // namespace classforge
