#pragma once
#include "classforge/class_visitor.hpp"

#include <memory>
#include <string>
#include <vector>

namespace classforge {

// Opaque identity of the host class loader (e.g. a JNI global ref). Null for the
// bootstrap loader.
using LoaderHandle = const void*;

// Method handle a rule embeds in an invokedynamic call site to reach the
// synthetic bootstrap method injected into the class being transformed.
struct BootstrapHandle {
    uint8_t referenceKind = kRefInvokeStatic;
    std::string owner; // internal name, slash separated
    std::string name;
    std::string descriptor;
    bool isInterface = false;
};

// Side-effect record handed to one rule for one pass.
class TransformContext {
public:
    virtual ~TransformContext() = default;

    virtual void markModified() = 0;
    // Keeps the running maximum.
    virtual void requireMinimumClassVersion(int version) = 0;
    // Keeps the running maximum.
    virtual void upgradeClassVersion(int version) = 0;
    // Requests injection of the synthetic bootstrap method and returns its handle.
    virtual BootstrapHandle acquireBootstrap() = 0;

    virtual bool isInterface() = 0;
    virtual const std::vector<std::string>& stringConstants() = 0;
};

class TransformRule {
public:
    virtual ~TransformRule() = default;

    // Returns a stage wrapping `next`, or null to sit this pass out. The
    // returned stage must forward to `next`. `className` is dot separated.
    virtual std::unique_ptr<ClassVisitor> transform(LoaderHandle loader, const std::string& className,
                                                    ClassVisitor& next, TransformContext& ctx) = 0;

    virtual std::string name() const = 0;
};

using RulePtr = std::shared_ptr<TransformRule>;

} // namespace classforge
