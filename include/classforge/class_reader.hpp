#pragma once
#include "classforge/classfile.hpp"
#include "classforge/class_visitor.hpp"

#include <llvm/ADT/ArrayRef.h>

namespace classforge {

// Parses a class file eagerly on construction and replays it as visitor events.
// Throws format_error on malformed input.
class ClassReader {
public:
    explicit ClassReader(llvm::ArrayRef<uint8_t> bytes);

    uint16_t access() const { return header_.access; }
    uint16_t majorVersion() const { return header_.majorVersion; }
    const ClassHeader& header() const { return header_; }
    const ConstantPool& pool() const { return pool_; }
    const std::vector<MemberInfo>& fields() const { return fields_; }
    const std::vector<MemberInfo>& methods() const { return methods_; }
    const std::vector<Attribute>& attributes() const { return attributes_; }

    bool isInterface() const { return (header_.access & acc::Interface) != 0; }

    // Text of every CONSTANT_String entry in table order, duplicates kept.
    std::vector<std::string> stringConstants() const;

    void accept(ClassVisitor& visitor) const;

private:
    ConstantPool pool_;
    ClassHeader header_;
    std::vector<MemberInfo> fields_;
    std::vector<MemberInfo> methods_;
    std::vector<Attribute> attributes_;
};

} // namespace classforge
