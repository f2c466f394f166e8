#pragma once
#include "classforge/transform.hpp"

#include <llvm/Support/Error.h>

namespace classforge::rules {

// A rule needs a class-file version above what this process may write.
class VersionPolicyError : public llvm::ErrorInfo<VersionPolicyError> {
public:
    static char ID;

    VersionPolicyError(int floor, int ceiling) : floor_(floor), ceiling_(ceiling) {}

    int floor() const { return floor_; }
    int ceiling() const { return ceiling_; }

    void log(llvm::raw_ostream& os) const override;
    std::error_code convertToErrorCode() const override { return llvm::inconvertibleErrorCode(); }

private:
    int floor_;
    int ceiling_;
};

// Rewrites the major version to max(current, floor, min(target, ceiling)).
// -1 means "not requested" for both floor and target.
class ClassVersionRule : public TransformRule {
public:
    // Fails with VersionPolicyError when floor > ceiling.
    static llvm::Expected<std::shared_ptr<ClassVersionRule>> create(int floor, int target, int ceiling);

    std::unique_ptr<ClassVisitor> transform(LoaderHandle loader, const std::string& className,
                                            ClassVisitor& next, TransformContext& ctx) override;
    std::string name() const override;

    int floor() const { return floor_; }
    int target() const { return target_; }

private:
    ClassVersionRule(int floor, int target) : floor_(floor), target_(target) {}

    int floor_;
    int target_;
};

} // namespace classforge::rules
