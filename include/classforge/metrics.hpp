#pragma once
#include <cstdint>
#include <mutex>

namespace llvm { class raw_ostream; }

namespace classforge {

// Process-wide counters shared by every concurrent load event. All updates go
// through the add* members, serialized by one mutex.
class PerformanceMetrics {
public:
    struct Snapshot {
        uint64_t classesScanned = 0;
        // Cumulative nanoseconds per phase.
        uint64_t totalTime = 0;
        uint64_t matchTime = 0;
        uint64_t scanTime = 0;
        uint64_t analysisTime = 0;
    };

    void addScanTime(uint64_t ns);
    void addAnalysisTime(uint64_t ns);
    // Records one finished load event.
    void addClass(uint64_t totalNs, uint64_t matchNs);

    Snapshot snapshot() const;
    void reset();

    void print(llvm::raw_ostream& os) const;

private:
    mutable std::mutex mutex_;
    Snapshot data_;
};

} // namespace classforge
