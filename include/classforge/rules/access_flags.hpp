#pragma once
#include "classforge/transform.hpp"

namespace classforge::rules {

// Sets and clears class access flags of one class (dot-separated name).
class AccessFlagsRule : public TransformRule {
public:
    AccessFlagsRule(std::string className, uint16_t set, uint16_t clear)
        : className_(std::move(className)), set_(set), clear_(clear) {}

    std::unique_ptr<ClassVisitor> transform(LoaderHandle loader, const std::string& className,
                                            ClassVisitor& next, TransformContext& ctx) override;
    std::string name() const override;

private:
    std::string className_;
    uint16_t set_;
    uint16_t clear_;
};

} // namespace classforge::rules
