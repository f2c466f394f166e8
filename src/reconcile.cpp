#include "classforge/reconcile.hpp"
#include "classforge/log.hpp"
#include "classforge/rules/bootstrap.hpp"
#include "classforge/rules/class_version.hpp"

#include <stdexcept>

namespace classforge {

const char* to_string(ReconcileState s){
    switch(s){
        case ReconcileState::Primary: return "primary";
        case ReconcileState::BootstrapInjection: return "bootstrap-injection";
        case ReconcileState::VersionReconciliation: return "version-reconciliation";
        case ReconcileState::Committed: return "committed";
        case ReconcileState::Abandoned: return "abandoned";
    }
    return "unknown";
}

ReconcileOutcome ReconciliationController::run(PipelineState& state, llvm::ArrayRef<RulePtr> rules){
    ReconcileOutcome out;
    auto abandon = [&](std::string reason){
        state.appliedRules.clear();
        out.reason = std::move(reason);
        return ReconcileState::Abandoned;
    };
    auto versionOrCommit = [&]{
        return (state.minVersion == -1 && state.upgradedVersion == -1) ? ReconcileState::Committed
                                                                       : ReconcileState::VersionReconciliation;
    };

    ReconcileState s = ReconcileState::Primary;
    for(;;){
        switch(s){
        case ReconcileState::Primary:
            run_pass(state, rules, metrics_);
            if(state.appliedRules.empty()) s = abandon("no rule applied");
            else if(state.addBootstrap) s = ReconcileState::BootstrapInjection;
            else s = versionOrCommit();
            break;

        case ReconcileState::BootstrapInjection: {
            RulePtr bootstrap = std::make_shared<rules::BootstrapRule>();
            run_pass(state, bootstrap, metrics_, PassKind::Corrective);
            s = versionOrCommit();
            break;
        }

        case ReconcileState::VersionReconciliation: {
            auto rule = rules::ClassVersionRule::create(state.minVersion, state.upgradedVersion, maxClassVersion_);
            if(!rule){
                std::string reason;
                llvm::Error rest = llvm::handleErrors(rule.takeError(), [&](const rules::VersionPolicyError& e){ reason = e.message(); });
                if(rest) throw std::runtime_error("version reconciliation failed: " + llvm::toString(std::move(rest)));
                log::warning("Skipping [" + state.className + "], " + reason);
                s = abandon(reason);
                break;
            }
            RulePtr version = std::move(*rule);
            run_pass(state, version, metrics_, PassKind::Corrective);
            s = ReconcileState::Committed;
            break;
        }

        case ReconcileState::Committed:
            out.state = ReconcileState::Committed;
            out.bytes = state.artifact.bytes();
            return out;

        case ReconcileState::Abandoned:
            out.state = ReconcileState::Abandoned;
            return out;
        }
    }
}

} // namespace classforge
