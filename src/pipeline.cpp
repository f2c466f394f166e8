#include "classforge/pipeline.hpp"
#include "classforge/log.hpp"
#include "classforge/rules/bootstrap.hpp"

#include <algorithm>
#include <chrono>

namespace classforge {

using Clock = std::chrono::steady_clock;

static uint64_t elapsed_ns(Clock::time_point a, Clock::time_point b){
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(b - a).count());
}

BootstrapHandle PassContext::acquireBootstrap(){
    bootstrapRequested = true;
    BootstrapHandle h;
    h.owner = state_.className;
    std::replace(h.owner.begin(), h.owner.end(), '.', '/');
    h.name = rules::kBootstrapName;
    h.descriptor = rules::kBootstrapDescriptor;
    h.isInterface = state_.artifact.isInterface();
    return h;
}

VisitorChain::VisitorChain(PipelineState& state, llvm::ArrayRef<RulePtr> rules)
    : contexts_(rules.size()), head_(&writer_) {
    for(size_t i = rules.size(); i-- > 0;){
        auto ctx = std::make_unique<PassContext>(state);
        auto stage = rules[i]->transform(state.loader, state.className, *head_, *ctx);
        if(!stage) continue;
        head_ = stage.get();
        stages_.push_back(std::move(stage));
        contexts_[i] = std::move(ctx);
    }
}

bool run_pass(PipelineState& state, llvm::ArrayRef<RulePtr> rules, PerformanceMetrics& metrics, PassKind kind){
    auto t0 = Clock::now();
    VisitorChain chain(state, rules);
    auto t1 = Clock::now();
    metrics.addScanTime(elapsed_ns(t0, t1));

    if(chain.trivial()) return false;

    t0 = Clock::now();
    state.artifact.reader().accept(chain.head());
    t1 = Clock::now();
    metrics.addAnalysisTime(elapsed_ns(t0, t1));

    bool modified = false;
    for(size_t i = 0; i < rules.size(); ++i){
        PassContext* ctx = chain.context(i);
        if(!ctx || !ctx->modified) continue;

        log::info("Transformed [" + state.className + "] with [" + rules[i]->name() + "]");

        if(kind == PassKind::Ordinary) state.appliedRules.push_back(rules[i]);
        state.minVersion = std::max(state.minVersion, ctx->minVersion);
        state.upgradedVersion = std::max(state.upgradedVersion, ctx->upgradedVersion);
        state.addBootstrap |= ctx->bootstrapRequested;
        modified = true;
    }

    if(modified) state.artifact.replace(chain.writer().toByteArray());
    return modified;
}

} // namespace classforge
