// JVM class-file model shared by the reader, the writer and the rewrite stages.
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace classforge {

struct format_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

constexpr uint32_t kClassMagic = 0xCAFEBABE;

// Constant pool tags (JVMS 4.4).
enum class Tag : uint8_t {
    Utf8 = 1,
    Integer = 3,
    Float = 4,
    Long = 5,
    Double = 6,
    Class = 7,
    String = 8,
    Fieldref = 9,
    Methodref = 10,
    InterfaceMethodref = 11,
    NameAndType = 12,
    MethodHandle = 15,
    MethodType = 16,
    Dynamic = 17,
    InvokeDynamic = 18,
    Module = 19,
    Package = 20,
};

namespace acc {
constexpr uint16_t Public = 0x0001;
constexpr uint16_t Private = 0x0002;
constexpr uint16_t Protected = 0x0004;
constexpr uint16_t Static = 0x0008;
constexpr uint16_t Final = 0x0010;
constexpr uint16_t Super = 0x0020;
constexpr uint16_t Interface = 0x0200;
constexpr uint16_t Abstract = 0x0400;
constexpr uint16_t Synthetic = 0x1000;
constexpr uint16_t Annotation = 0x2000;
constexpr uint16_t Enum = 0x4000;
} // namespace acc

// Method handle reference kinds (JVMS 5.4.3.5).
constexpr uint8_t kRefInvokeStatic = 6;

// One constant pool slot. Index 0 and the slot after a Long/Double are unusable
// and carry tag 0. `bytes` holds the raw entry payload (without the tag byte)
// for every tag; Utf8 entries keep the on-disk modified UTF-8 form.
struct Constant {
    uint8_t tag = 0;
    std::string bytes;

    bool usable() const { return tag != 0; }
    Tag kind() const { return static_cast<Tag>(tag); }
};

// Size in slots of an entry with the given tag.
inline int slot_width(Tag t){ return (t == Tag::Long || t == Tag::Double) ? 2 : 1; }

class ConstantPool {
public:
    ConstantPool() : entries_(1) {}

    // Number of slots including the reserved slot 0 (the on-disk constant_pool_count).
    uint16_t count() const { return static_cast<uint16_t>(entries_.size()); }
    const Constant& at(uint16_t index) const;
    Constant& at(uint16_t index);

    uint16_t append(Constant c);

    // Resolves a Utf8 entry to its on-disk (modified UTF-8) text.
    const std::string& utf8(uint16_t index) const;
    // Resolves a Class entry to its internal name.
    const std::string& className(uint16_t index) const;
    // Returns the Utf8 index referenced by a String/Class/MethodType entry.
    uint16_t refIndex(uint16_t index) const;

    // First index whose entry equals (tag, bytes), or 0.
    uint16_t find(Tag tag, const std::string& bytes) const;

    const std::vector<Constant>& entries() const { return entries_; }

private:
    std::vector<Constant> entries_;
};

struct Attribute {
    std::string name;
    std::vector<uint8_t> data;
};

// Field or method. Attribute payloads are opaque and may reference
// constant pool indices of the class they were read from.
struct MemberInfo {
    uint16_t access = 0;
    std::string name;
    std::string descriptor;
    std::vector<Attribute> attributes;
};

struct ClassHeader {
    uint16_t minorVersion = 0;
    uint16_t majorVersion = 0;
    uint16_t access = 0;
    std::string name;
    std::string superName; // empty for java/lang/Object
    std::vector<std::string> interfaces;
};

// Conversions between standard UTF-8 and the JVM's modified UTF-8
// (NUL as C0 80, supplementary characters as surrogate pairs).
std::string decode_modified_utf8(const std::string& in);
std::string encode_modified_utf8(const std::string& in);

// Big-endian u2 packing helpers for constant payloads.
std::string pack_u2(uint16_t v);
uint16_t unpack_u2(const std::string& bytes, size_t offset = 0);

} // namespace classforge
