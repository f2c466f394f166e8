#pragma once
#include "classforge/metrics.hpp"
#include "classforge/options.hpp"
#include "classforge/registry.hpp"
#include "classforge/transform.hpp"

#include <optional>

#include <llvm/ADT/ArrayRef.h>

namespace classforge {

// Notified once per load event after reconciliation, on the dispatching thread.
// Not notified when the load event fails.
// `finalBytes` equal the input when nothing was committed; `appliedRules` is
// then empty.
class ClassLoadingListener {
public:
    virtual ~ClassLoadingListener() = default;
    virtual void onClassLoading(LoaderHandle loader, const std::string& className,
                                llvm::ArrayRef<uint8_t> finalBytes, const std::vector<RulePtr>& appliedRules) = 0;
};

// Entry point for the host's class-load hook. Thread-safe; each call works on
// its own PipelineState and a snapshot of the rule and listener registries.
class ClassTransformer {
public:
    // Reads detectOptions() and applies its logLevel to the process-wide log
    // threshold.
    ClassTransformer();
    // Leaves the log threshold alone.
    explicit ClassTransformer(Options options) : options_(options) {}

    SnapshotRegistry<TransformRule> rules;
    SnapshotRegistry<ClassLoadingListener> listeners;

    // `internalName` is slash separated. Returns the rewritten class, or
    // nothing when the original bytes should be used. Never throws: failures
    // are logged and reported as "unchanged".
    std::optional<std::vector<uint8_t>> transform(LoaderHandle loader, const char* internalName,
                                                  llvm::ArrayRef<uint8_t> classBytes);

    PerformanceMetrics& metrics(){ return metrics_; }
    const Options& options() const { return options_; }

private:
    Options options_;
    PerformanceMetrics metrics_;
};

} // namespace classforge
