#pragma once
#include "classforge/transform.hpp"

namespace classforge::rules {

// Synthetic bootstrap method injected into classes whose rules requested one:
//   public static synthetic CallSite classforge$bootstrap(Lookup, String, MethodType, MethodHandle)
// returning new ConstantCallSite(target.asType(type)).
inline constexpr const char* kBootstrapName = "classforge$bootstrap";
inline constexpr const char* kBootstrapDescriptor =
    "(Ljava/lang/invoke/MethodHandles$Lookup;Ljava/lang/String;Ljava/lang/invoke/MethodType;"
    "Ljava/lang/invoke/MethodHandle;)Ljava/lang/invoke/CallSite;";

// invokedynamic needs 51; static interface methods need 52.
constexpr int kBootstrapClassVersion = 51;
constexpr int kBootstrapInterfaceVersion = 52;

// Adds the bootstrap method once. Classes that already declare it are left alone.
// Run only by the reconciliation controller.
class BootstrapRule : public TransformRule {
public:
    std::unique_ptr<ClassVisitor> transform(LoaderHandle loader, const std::string& className,
                                            ClassVisitor& next, TransformContext& ctx) override;
    std::string name() const override { return "BootstrapRule"; }
};

// Body of the bootstrap method as a Code attribute payload, with constants
// interned into `symbols`.
std::vector<uint8_t> build_bootstrap_code(SymbolTable& symbols);

} // namespace classforge::rules
