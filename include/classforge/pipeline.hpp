// Single-pass machinery: per-rule contexts, the visitor chain and the dispatcher.
#pragma once
#include "classforge/artifact.hpp"
#include "classforge/class_writer.hpp"
#include "classforge/metrics.hpp"
#include "classforge/transform.hpp"

#include <llvm/ADT/ArrayRef.h>

namespace classforge {

// Everything one load event accumulates across its passes. Owned by the
// dispatching thread and never shared.
struct PipelineState {
    PipelineState(LoaderHandle loader, std::string className, std::vector<uint8_t> bytes)
        : loader(loader), className(std::move(className)), artifact(std::move(bytes)) {}

    LoaderHandle loader;
    std::string className; // dot separated
    Artifact artifact;

    // Ordinary rules that reported a modification, in the order they did.
    std::vector<RulePtr> appliedRules;
    int minVersion = -1;      // -1 = nobody asked
    int upgradedVersion = -1; // -1 = nobody asked
    bool addBootstrap = false;
};

// Context given to one rule for one pass.
class PassContext : public TransformContext {
public:
    explicit PassContext(PipelineState& state) : state_(state) {}

    void markModified() override { modified = true; }
    void requireMinimumClassVersion(int version) override { if(minVersion < version) minVersion = version; }
    void upgradeClassVersion(int version) override { if(upgradedVersion < version) upgradedVersion = version; }
    BootstrapHandle acquireBootstrap() override;

    bool isInterface() override { return state_.artifact.isInterface(); }
    const std::vector<std::string>& stringConstants() override { return state_.artifact.stringConstants(); }

    bool modified = false;
    int minVersion = -1;
    int upgradedVersion = -1;
    bool bootstrapRequested = false;

private:
    PipelineState& state_;
};

// Rules composed in front of a fresh ClassWriter. Built back to front so that
// events reach the rules in list order; declining rules are left out.
class VisitorChain {
public:
    VisitorChain(PipelineState& state, llvm::ArrayRef<RulePtr> rules);
    VisitorChain(const VisitorChain&) = delete;
    VisitorChain& operator=(const VisitorChain&) = delete;

    ClassVisitor& head(){ return *head_; }
    ClassWriter& writer(){ return writer_; }
    // No rule participates.
    bool trivial() const { return head_ == &writer_; }
    // Context of rule i, or null if it declined.
    PassContext* context(size_t i) const { return contexts_[i].get(); }

private:
    ClassWriter writer_;
    std::vector<std::unique_ptr<ClassVisitor>> stages_;
    std::vector<std::unique_ptr<PassContext>> contexts_;
    ClassVisitor* head_;
};

enum class PassKind {
    Ordinary,   // modifying rules join the applied set
    Corrective, // bootstrap / version passes run by the reconciliation controller
};

// Runs one pass of `rules` over the artifact. Folds every modifying rule's
// requests into `state` and replaces the artifact bytes when anything changed.
// Returns true if the bytes were replaced.
bool run_pass(PipelineState& state, llvm::ArrayRef<RulePtr> rules, PerformanceMetrics& metrics,
              PassKind kind = PassKind::Ordinary);

} // namespace classforge
