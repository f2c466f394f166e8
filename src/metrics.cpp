#include "classforge/metrics.hpp"

#include <llvm/Support/Format.h>
#include <llvm/Support/raw_ostream.h>

namespace classforge {

void PerformanceMetrics::addScanTime(uint64_t ns){
    std::lock_guard<std::mutex> lk(mutex_);
    data_.scanTime += ns;
}

void PerformanceMetrics::addAnalysisTime(uint64_t ns){
    std::lock_guard<std::mutex> lk(mutex_);
    data_.analysisTime += ns;
}

void PerformanceMetrics::addClass(uint64_t totalNs, uint64_t matchNs){
    std::lock_guard<std::mutex> lk(mutex_);
    data_.classesScanned++;
    data_.totalTime += totalNs;
    data_.matchTime += matchNs;
}

PerformanceMetrics::Snapshot PerformanceMetrics::snapshot() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return data_;
}

void PerformanceMetrics::reset(){
    std::lock_guard<std::mutex> lk(mutex_);
    data_ = Snapshot{};
}

void PerformanceMetrics::print(llvm::raw_ostream& os) const {
    Snapshot s = snapshot();
    auto ms = [](uint64_t ns){ return static_cast<double>(ns) / 1e6; };
    os << "classes scanned: " << s.classesScanned << "\n";
    os << "total time:      " << llvm::format("%.3f", ms(s.totalTime)) << " ms\n";
    os << "match time:      " << llvm::format("%.3f", ms(s.matchTime)) << " ms\n";
    os << "scan time:       " << llvm::format("%.3f", ms(s.scanTime)) << " ms\n";
    os << "analysis time:   " << llvm::format("%.3f", ms(s.analysisTime)) << " ms\n";
}

} // namespace classforge
