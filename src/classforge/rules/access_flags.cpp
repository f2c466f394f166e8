#include "classforge/rules/access_flags.hpp"

#include <llvm/Support/Format.h>
#include <llvm/Support/raw_ostream.h>

namespace classforge::rules {

namespace {

class AccessFlagsStage : public ClassVisitor {
public:
    AccessFlagsStage(ClassVisitor& next, TransformContext& ctx, uint16_t set, uint16_t clear)
        : ClassVisitor(&next), ctx_(ctx), set_(set), clear_(clear) {}

    void visit(const ClassHeader& header) override {
        ClassHeader h = header;
        h.access = static_cast<uint16_t>((h.access | set_) & ~clear_);
        if(h.access != header.access) ctx_.markModified();
        ClassVisitor::visit(h);
    }

private:
    TransformContext& ctx_;
    uint16_t set_;
    uint16_t clear_;
};

} // namespace

std::unique_ptr<ClassVisitor> AccessFlagsRule::transform(LoaderHandle, const std::string& className, ClassVisitor& next, TransformContext& ctx){
    if(className != className_) return nullptr;
    return std::make_unique<AccessFlagsStage>(next, ctx, set_, clear_);
}

std::string AccessFlagsRule::name() const {
    std::string s; llvm::raw_string_ostream os(s);
    os << "AccessFlagsRule(" << className_ << ", set=" << llvm::format_hex(set_, 6) << ", clear=" << llvm::format_hex(clear_, 6) << ")";
    return os.str();
}

} // namespace classforge::rules
