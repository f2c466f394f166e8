#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <thread>
#include <vector>

#include <llvm/Support/raw_ostream.h>

#include "classforge/rules/access_flags.hpp"
#include "classforge/rules/string_constant.hpp"
#include "classforge/transformer.hpp"
#include "class_fixture.hpp"

using Clock = std::chrono::steady_clock;
using namespace classforge;

struct RunResult { double ms; int rewritten; };

static std::vector<std::vector<uint8_t>> make_corpus(int n){
    std::vector<std::vector<uint8_t>> corpus;
    for(int i = 0; i < n; ++i){
        fixture::ClassSpec spec;
        spec.name = "bench/C" + std::to_string(i);
        spec.strings = { "greeting", (i % 3 == 0) ? "legacy.endpoint" : "current.endpoint", "greeting" };
        for(int m = 0; m < 8; ++m) spec.methods.push_back({ "m" + std::to_string(m), "()V" });
        spec.fields = { "a", "b", "c" };
        spec.withLong = (i % 2) == 0;
        corpus.push_back(fixture::make_class(spec));
    }
    return corpus;
}

static RunResult bench_case(ClassTransformer& t, const std::vector<std::vector<uint8_t>>& corpus, int threads){
    std::atomic<int> rewritten{0};
    auto t0 = Clock::now();
    std::vector<std::thread> workers;
    for(int w = 0; w < threads; ++w){
        workers.emplace_back([&, w]{
            for(size_t i = size_t(w); i < corpus.size(); i += size_t(threads)){
                std::string name = "bench/C" + std::to_string(i);
                if(t.transform(nullptr, name.c_str(), corpus[i])) ++rewritten;
            }
        });
    }
    for(auto& th : workers) th.join();
    auto t1 = Clock::now();
    return { std::chrono::duration<double, std::milli>(t1 - t0).count(), rewritten.load() };
}

int main(int argc, char** argv){
    int classes = argc > 1 ? std::atoi(argv[1]) : 2000;
    if(classes <= 0) classes = 2000;
    auto corpus = make_corpus(classes);

    log::setThreshold(log::Level::Off);
    ClassTransformer t(Options{});
    t.rules.add(std::make_shared<rules::StringConstantRule>("legacy.endpoint", "current.endpoint"));
    t.rules.add(std::make_shared<rules::AccessFlagsRule>("bench.C7", acc::Final, 0));

    std::cout << "threads,ms,rewritten\n";
    for(int threads : { 1, 2, 4, 8 }){
        auto r = bench_case(t, corpus, threads);
        std::cout << threads << "," << r.ms << "," << r.rewritten << "\n";
    }
    t.metrics().print(llvm::outs());
    return 0;
}
