// Example: a custom rule that tags every class of one package with a
// Deprecated attribute, then reports the outcome through a listener.
#include <fstream>
#include <iostream>
#include <iterator>

#include "classforge/transformer.hpp"

using namespace classforge;

namespace {

class DeprecateStage : public ClassVisitor {
public:
    DeprecateStage(ClassVisitor& next, TransformContext& ctx) : ClassVisitor(&next), ctx_(ctx) {}
    void visitAttribute(const Attribute& attr) override {
        if(attr.name == "Deprecated") present_ = true;
        ClassVisitor::visitAttribute(attr);
    }
    void visitEnd() override {
        if(!present_){
            ClassVisitor::visitAttribute(Attribute{ "Deprecated", {} });
            ctx_.markModified();
        }
        ClassVisitor::visitEnd();
    }
private:
    TransformContext& ctx_;
    bool present_ = false;
};

class DeprecatePackageRule : public TransformRule {
public:
    explicit DeprecatePackageRule(std::string prefix) : prefix_(std::move(prefix)) {}
    std::unique_ptr<ClassVisitor> transform(LoaderHandle, const std::string& className, ClassVisitor& next, TransformContext& ctx) override {
        if(className.compare(0, prefix_.size(), prefix_) != 0) return nullptr;
        return std::make_unique<DeprecateStage>(next, ctx);
    }
    std::string name() const override { return "DeprecatePackageRule(" + prefix_ + ")"; }
private:
    std::string prefix_;
};

class PrintingListener : public ClassLoadingListener {
public:
    void onClassLoading(LoaderHandle, const std::string& className, llvm::ArrayRef<uint8_t> finalBytes,
                        const std::vector<RulePtr>& appliedRules) override {
        std::cout << className << ": " << finalBytes.size() << " bytes";
        for(const auto& r : appliedRules) std::cout << " [" << r->name() << "]";
        std::cout << "\n";
    }
};

} // namespace

int main(int argc, char** argv){
    if(argc < 3){ std::cerr << "usage: deprecate_package_example <package.prefix.> <file.class> <internal/Name>\n"; return 1; }
    std::ifstream ifs(argv[2], std::ios::binary);
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    const char* internalName = argc > 3 ? argv[3] : "example/Unknown";

    ClassTransformer t;
    t.rules.add(std::make_shared<DeprecatePackageRule>(argv[1]));
    t.listeners.add(std::make_shared<PrintingListener>());
    auto out = t.transform(nullptr, internalName, bytes);
    std::cout << (out ? "rewritten" : "unchanged") << "\n";
    return 0;
}
