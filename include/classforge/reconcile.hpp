#pragma once
#include "classforge/pipeline.hpp"

#include <optional>

namespace classforge {

enum class ReconcileState {
    Primary,
    BootstrapInjection,
    VersionReconciliation,
    Committed,
    Abandoned,
};

const char* to_string(ReconcileState s);

struct ReconcileOutcome {
    ReconcileState state = ReconcileState::Abandoned; // Committed or Abandoned
    std::optional<std::vector<uint8_t>> bytes;        // set only when Committed
    std::string reason;                               // why it was abandoned
};

// Drives one load event: the primary pass over the rule snapshot, then at most
// a bootstrap-injection pass and a version-reconciliation pass. Either every
// pass's modifications are committed together or none are.
class ReconciliationController {
public:
    ReconciliationController(PerformanceMetrics& metrics, int maxClassVersion)
        : metrics_(metrics), maxClassVersion_(maxClassVersion) {}

    // Unexpected failures (malformed input, throwing rules) propagate as exceptions.
    ReconcileOutcome run(PipelineState& state, llvm::ArrayRef<RulePtr> rules);

private:
    PerformanceMetrics& metrics_;
    int maxClassVersion_;
};

} // namespace classforge
