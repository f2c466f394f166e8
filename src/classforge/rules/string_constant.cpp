#include "classforge/rules/string_constant.hpp"
#include "classforge/class_writer.hpp"

#include <algorithm>

namespace classforge::rules {

namespace {

class StringConstantStage : public ClassVisitor {
public:
    StringConstantStage(ClassVisitor& next, TransformContext& ctx, const std::string& from, const std::string& to)
        : ClassVisitor(&next), ctx_(ctx), from_(from), to_(to) {}

    void visitConstantPool(const ConstantPool& pool) override {
        ClassVisitor::visitConstantPool(pool);
        SymbolTable* syms = symbols();
        if(!syms) throw std::logic_error("StringConstantRule: chain has no class writer");
        if(syms->replaceString(from_, to_) > 0) ctx_.markModified();
    }

private:
    TransformContext& ctx_;
    const std::string& from_;
    const std::string& to_;
};

} // namespace

std::unique_ptr<ClassVisitor> StringConstantRule::transform(LoaderHandle, const std::string&, ClassVisitor& next, TransformContext& ctx){
    const auto& constants = ctx.stringConstants();
    if(from_ == to_ || std::find(constants.begin(), constants.end(), from_) == constants.end()) return nullptr;
    return std::make_unique<StringConstantStage>(next, ctx, from_, to_);
}

} // namespace classforge::rules
