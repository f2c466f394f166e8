#pragma once
#include "classforge/transform.hpp"

namespace classforge::rules {

// Replaces the value of every string literal equal to `from` with `to`.
// Declines classes whose constant table does not contain `from`.
class StringConstantRule : public TransformRule {
public:
    StringConstantRule(std::string from, std::string to) : from_(std::move(from)), to_(std::move(to)) {}

    std::unique_ptr<ClassVisitor> transform(LoaderHandle loader, const std::string& className,
                                            ClassVisitor& next, TransformContext& ctx) override;
    std::string name() const override { return "StringConstantRule(" + from_ + " -> " + to_ + ")"; }

private:
    std::string from_;
    std::string to_;
};

} // namespace classforge::rules
