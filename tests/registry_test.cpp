#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <llvm/Support/raw_ostream.h>

#include "classforge/metrics.hpp"
#include "classforge/registry.hpp"

using namespace classforge;

static void test_snapshot_isolation(){
    SnapshotRegistry<std::string> reg;
    auto a = std::make_shared<std::string>("a");
    reg.add(a);
    auto snap = reg.snapshot();
    reg.add(std::make_shared<std::string>("b"));
    assert(snap->size() == 1 && "older snapshots never change");
    assert(reg.size() == 2);
    assert(reg.remove(a));
    assert(!reg.remove(a));
    assert(reg.size() == 1 && *reg.snapshot()->front() == "b");
    assert(snap->front() == a);
    reg.clear();
    assert(reg.size() == 0);
}

static void test_concurrent_adds(){
    SnapshotRegistry<int> reg;
    std::vector<std::thread> ts;
    for(int t = 0; t < 4; ++t) ts.emplace_back([&reg, t]{ for(int i = 0; i < 100; ++i) reg.add(std::make_shared<int>(t * 100 + i)); });
    for(auto& th : ts) th.join();
    assert(reg.size() == 400);
}

static void test_metrics(){
    PerformanceMetrics m;
    std::vector<std::thread> ts;
    for(int t = 0; t < 8; ++t) ts.emplace_back([&m]{ for(int i = 0; i < 1000; ++i){ m.addClass(3, 1); m.addScanTime(2); m.addAnalysisTime(5); } });
    for(auto& th : ts) th.join();
    auto s = m.snapshot();
    assert(s.classesScanned == 8000);
    assert(s.totalTime == 24000 && s.matchTime == 8000 && s.scanTime == 16000 && s.analysisTime == 40000);
    std::string text; llvm::raw_string_ostream os(text);
    m.print(os); os.flush();
    assert(text.find("classes scanned: 8000") != std::string::npos);
    m.reset();
    assert(m.snapshot().classesScanned == 0);
}

void run_registry_tests(){
    std::cout << "[registry] snapshot/metrics tests...\n";
    test_snapshot_isolation();
    test_concurrent_adds();
    test_metrics();
    std::cout << "[registry] snapshot/metrics tests passed\n";
}
