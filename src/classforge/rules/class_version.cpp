#include "classforge/rules/class_version.hpp"

#include <algorithm>

#include <llvm/Support/raw_ostream.h>

namespace classforge::rules {

char VersionPolicyError::ID = 0;

void VersionPolicyError::log(llvm::raw_ostream& os) const {
    os << "class version " << floor_ << " is required but at most " << ceiling_ << " is supported";
}

namespace {

class VersionStage : public ClassVisitor {
public:
    VersionStage(ClassVisitor& next, TransformContext& ctx, int version) : ClassVisitor(&next), ctx_(ctx), version_(version) {}

    void visit(const ClassHeader& header) override {
        if(header.majorVersion >= version_){ ClassVisitor::visit(header); return; }
        ClassHeader h = header;
        h.majorVersion = static_cast<uint16_t>(version_);
        h.minorVersion = 0;
        ctx_.markModified();
        ClassVisitor::visit(h);
    }

private:
    TransformContext& ctx_;
    int version_;
};

} // namespace

llvm::Expected<std::shared_ptr<ClassVersionRule>> ClassVersionRule::create(int floor, int target, int ceiling){
    if(floor > ceiling) return llvm::make_error<VersionPolicyError>(floor, ceiling);
    return std::shared_ptr<ClassVersionRule>(new ClassVersionRule(floor, std::min(target, ceiling)));
}

std::unique_ptr<ClassVisitor> ClassVersionRule::transform(LoaderHandle, const std::string&, ClassVisitor& next, TransformContext& ctx){
    int version = std::max(floor_, target_);
    if(version < 0) return nullptr;
    return std::make_unique<VersionStage>(next, ctx, version);
}

std::string ClassVersionRule::name() const {
    return "ClassVersionRule(floor=" + std::to_string(floor_) + ", target=" + std::to_string(target_) + ")";
}

} // namespace classforge::rules
