#include "classforge/transformer.hpp"
#include "classforge/log.hpp"
#include "classforge/reconcile.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

namespace classforge {

using Clock = std::chrono::steady_clock;

ClassTransformer::ClassTransformer() : ClassTransformer(detectOptions()) {
    log::setThreshold(options_.logLevel);
}

std::optional<std::vector<uint8_t>> ClassTransformer::transform(LoaderHandle loader, const char* internalName,
                                                                llvm::ArrayRef<uint8_t> classBytes){
    if(!internalName) return std::nullopt;
    try {
        auto t0 = Clock::now();

        std::string className = internalName;
        std::replace(className.begin(), className.end(), '/', '.');

        auto t1 = Clock::now();

        auto ruleSnapshot = rules.snapshot();
        auto listenerSnapshot = listeners.snapshot();

        PipelineState state(loader, className, classBytes.vec());
        ReconciliationController controller(metrics_, options_.maxSupportedClassVersion);
        ReconcileOutcome outcome = controller.run(state, *ruleSnapshot);

        if(options_.printUntransformedClass && !outcome.bytes)
            log::debug("No transformation is applied to [" + className + "] (" + outcome.reason + ")");

        llvm::ArrayRef<uint8_t> finalBytes = outcome.bytes ? llvm::ArrayRef<uint8_t>(*outcome.bytes) : classBytes;
        for(const auto& listener : *listenerSnapshot)
            listener->onClassLoading(loader, className, finalBytes, state.appliedRules);

        auto t2 = Clock::now();
        auto ns = [](Clock::duration d){ return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(d).count()); };
        metrics_.addClass(ns(t2 - t0), ns(t1 - t0));

        return std::move(outcome.bytes);
    } catch(const std::exception& e){
        log::warning("Failed to transform [" + std::string(internalName) + "]: " + e.what());
    } catch(...){
        log::warning("Failed to transform [" + std::string(internalName) + "]: unknown exception");
    }
    return std::nullopt;
}

} // namespace classforge
