// Visitor chain and single-pass dispatcher.
#include <cassert>
#include <iostream>

#include "classforge/pipeline.hpp"
#include "classforge/rules/string_constant.hpp"
#include "class_fixture.hpp"
#include "test_rules.hpp"

using namespace classforge;
using testrules::Script;
using testrules::scripted;

static PipelineState make_state(std::vector<uint8_t> bytes){
    return PipelineState(nullptr, "demo.Sample", std::move(bytes));
}

static void test_chain_order(){
    std::vector<std::string> journal;
    std::vector<RulePtr> rules{
        std::make_shared<testrules::JournalRule>("first", journal),
        std::make_shared<testrules::JournalRule>("second", journal),
        std::make_shared<testrules::JournalRule>("third", journal),
    };
    PerformanceMetrics m;
    auto state = make_state(fixture::sample_class());
    assert(run_pass(state, rules, m));
    std::vector<std::string> expected{ "first:visit", "second:visit", "third:visit", "first:end", "second:end", "third:end" };
    assert(journal == expected && "events flow through rules in declared order");
    assert(state.appliedRules.size() == 3 && state.appliedRules[0] == rules[0] && state.appliedRules[2] == rules[2]);
}

static void test_declining_rule_is_skipped(){
    std::vector<std::string> journal;
    auto decliner = scripted("decliner", Script{ /*decline=*/true });
    std::vector<RulePtr> rules{
        std::make_shared<testrules::JournalRule>("a", journal),
        decliner,
        std::make_shared<testrules::JournalRule>("b", journal),
    };
    auto state = make_state(fixture::sample_class());
    VisitorChain chain(state, rules);
    assert(!chain.trivial());
    assert(chain.context(0) && !chain.context(1) && chain.context(2));
    assert(decliner->offered == 1 && decliner->visited == 0);
}

static void test_all_declining_skips_parse(){
    // Not a class file: any parse attempt would throw.
    auto state = make_state(std::vector<uint8_t>{ 0xDE, 0xAD });
    std::vector<RulePtr> rules{ scripted("x", Script{ true }), scripted("y", Script{ true }) };
    PerformanceMetrics m;
    assert(!run_pass(state, rules, m));
    assert(state.appliedRules.empty());
    assert(m.snapshot().analysisTime == 0);
    assert(!run_pass(state, {}, m) && "empty rule list is a no-op");
}

static void test_aggregation_is_max(){
    auto state = make_state(fixture::sample_class());
    Script a; a.minVersion = 0; a.upgrade = 0;
    Script b; b.minVersion = 50;
    Script c; c.minVersion = 10; c.upgrade = 55;
    Script untouched; untouched.modify = false; untouched.minVersion = 99; untouched.bootstrap = true;
    std::vector<RulePtr> rules{ scripted("a", a), scripted("b", b), scripted("c", c), scripted("u", untouched) };
    PerformanceMetrics m;
    assert(run_pass(state, rules, m));
    assert(state.minVersion == 50);
    assert(state.upgradedVersion == 55);
    assert(!state.addBootstrap && "requests of non-modifying rules are ignored");
    assert(state.appliedRules.size() == 3);
}

static void test_context_keeps_running_max(){
    auto state = make_state(fixture::sample_class());
    PassContext ctx(state);
    ctx.requireMinimumClassVersion(52);
    ctx.requireMinimumClassVersion(50);
    ctx.upgradeClassVersion(60);
    ctx.upgradeClassVersion(55);
    assert(ctx.minVersion == 52 && ctx.upgradedVersion == 60);
    BootstrapHandle h = ctx.acquireBootstrap();
    assert(ctx.bootstrapRequested);
    assert(h.owner == "demo/Sample" && h.referenceKind == kRefInvokeStatic && !h.isInterface);
}

static void test_unmodified_pass_keeps_buffer(){
    auto bytes = fixture::sample_class();
    auto state = make_state(bytes);
    const auto* reader = &state.artifact.reader();
    Script quiet; quiet.modify = false;
    PerformanceMetrics m;
    assert(!run_pass(state, std::vector<RulePtr>{ scripted("quiet", quiet) }, m));
    assert(state.artifact.bytes() == bytes);
    assert(reader == &state.artifact.reader() && "caches survive a pass that changed nothing");
    assert(state.minVersion == -1 && state.upgradedVersion == -1);
}

static void test_corrective_pass_not_recorded(){
    auto state = make_state(fixture::sample_class());
    PerformanceMetrics m;
    Script s; s.minVersion = 51;
    assert(run_pass(state, std::vector<RulePtr>{ scripted("fix", s) }, m, PassKind::Corrective));
    assert(state.appliedRules.empty());
    assert(state.minVersion == 51);
}

static void test_constants_invalidated_by_pass(){
    auto state = make_state(fixture::sample_class());
    auto before = state.artifact.stringConstants();
    assert((before == std::vector<std::string>{ "alpha", "beta", "alpha" }));
    PerformanceMetrics m;
    RulePtr rule = std::make_shared<rules::StringConstantRule>("alpha", "omega");
    assert(run_pass(state, rule, m));
    const auto& after = state.artifact.stringConstants();
    assert((after == std::vector<std::string>{ "omega", "beta", "omega" }));
}

void run_pipeline_tests(){
    std::cout << "[pipeline] chain/dispatcher tests...\n";
    test_chain_order();
    test_declining_rule_is_skipped();
    test_all_declining_skips_parse();
    test_aggregation_is_max();
    test_context_keeps_running_max();
    test_unmodified_pass_keeps_buffer();
    test_corrective_pass_not_recorded();
    test_constants_invalidated_by_pass();
    std::cout << "[pipeline] chain/dispatcher tests passed\n";
}
