#pragma once
#include "classforge/classfile.hpp"

namespace classforge {

class SymbolTable;

// One stage of a structural rewrite chain. Every event is forwarded to `next`
// unchanged unless a subclass overrides it. A ClassReader drives events in this
// order: visitConstantPool, visit, visitField*, visitMethod*, visitAttribute*,
// visitEnd.
class ClassVisitor {
public:
    explicit ClassVisitor(ClassVisitor* next = nullptr) : next_(next) {}
    virtual ~ClassVisitor() = default;

    virtual void visitConstantPool(const ConstantPool& pool){ if(next_) next_->visitConstantPool(pool); }
    virtual void visit(const ClassHeader& header){ if(next_) next_->visit(header); }
    virtual void visitField(const MemberInfo& field){ if(next_) next_->visitField(field); }
    virtual void visitMethod(const MemberInfo& method){ if(next_) next_->visitMethod(method); }
    virtual void visitAttribute(const Attribute& attr){ if(next_) next_->visitAttribute(attr); }
    virtual void visitEnd(){ if(next_) next_->visitEnd(); }

    // Constant table of the terminal writer, available once visitConstantPool
    // has reached it. Null when the chain has no writer.
    virtual SymbolTable* symbols(){ return next_ ? next_->symbols() : nullptr; }

protected:
    ClassVisitor* next() const { return next_; }

private:
    ClassVisitor* next_;
};

} // namespace classforge
