#pragma once
#include "classforge/classfile.hpp"
#include "classforge/class_visitor.hpp"

#include <optional>

namespace classforge {

// Output constant table of a ClassWriter. Starts as a verbatim copy of the
// source pool so that indices inside opaque attribute payloads stay valid;
// new entries are only ever appended. Lookups return the first matching entry.
class SymbolTable {
public:
    void reset(const ConstantPool& source){ pool_ = source; }
    const ConstantPool& pool() const { return pool_; }

    // `text` is standard UTF-8; it is stored in modified UTF-8.
    uint16_t addUtf8(const std::string& text);
    uint16_t addClass(const std::string& internalName);
    uint16_t addString(const std::string& value);
    uint16_t addNameAndType(const std::string& name, const std::string& descriptor);
    uint16_t addMethodref(const std::string& owner, const std::string& name, const std::string& descriptor);

    // Repoints every CONSTANT_String whose text equals `from` to a Utf8 entry
    // holding `to`. The old Utf8 entry is left in place since other entries may
    // share it. Returns the number of String entries changed.
    int replaceString(const std::string& from, const std::string& to);

private:
    uint16_t addRaw(Tag tag, std::string bytes);
    uint16_t addUtf8Raw(const std::string& modified);

    ConstantPool pool_;
};

// Terminal sink of a rewrite chain: collects the visited structure and
// serializes it with toByteArray().
class ClassWriter : public ClassVisitor {
public:
    ClassWriter() : ClassVisitor(nullptr) {}

    void visitConstantPool(const ConstantPool& pool) override { symbols_.reset(pool); }
    void visit(const ClassHeader& header) override { header_ = header; }
    void visitField(const MemberInfo& field) override { fields_.push_back(field); }
    void visitMethod(const MemberInfo& method) override { methods_.push_back(method); }
    void visitAttribute(const Attribute& attr) override { attributes_.push_back(attr); }
    void visitEnd() override { ended_ = true; }

    SymbolTable* symbols() override { return &symbols_; }

    // Throws std::logic_error when called before the header and visitEnd were seen.
    std::vector<uint8_t> toByteArray();

private:
    SymbolTable symbols_;
    std::optional<ClassHeader> header_;
    std::vector<MemberInfo> fields_;
    std::vector<MemberInfo> methods_;
    std::vector<Attribute> attributes_;
    bool ended_ = false;
};

} // namespace classforge
