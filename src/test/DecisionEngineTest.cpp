#include <cassert>
#include <iostream>

#include "application/DecisionTableEngine.hpp"
#include "domain/DecisionErrors.hpp"
#include "infrastructure/RuleSetLoader.hpp"
#include "test/TestSupport.hpp"

using namespace storagerouter::domain;
using namespace storagerouter::application;
using namespace storagerouter::infrastructure;
using namespace storagerouter::test;

namespace {

Criteria Make(StorageIntent intent, AccessPattern pattern, bool analytic, DataType type, SearchIntensity intensity) {
    return Criteria{intent, pattern, analytic, type, intensity};
}

void TestScenarios(const DecisionTableEngine& engine) {
    std::cout << "[Test] Reference scenarios..." << std::endl;

    auto memory = engine.evaluate(Make(StorageIntent::Memory, AccessPattern::Crud, false,
                                       DataType::Text, SearchIntensity::None));
    assert(memory.storageTargets == TargetSet{StorageTarget::Memory});
    assert(memory.matchedRulePriority && *memory.matchedRulePriority == 0);
    assert(memory.matchedRuleId == "memory-facts");
    assert(memory.ruleSetVersion == "2026.10.0");
    assert(memory.operationHints == std::vector<std::string>{"memory.upsert"});
    assert(memory.rationale.find("memory-facts") != std::string::npos);
    assert(memory.rationale.find("{rule_id}") == std::string::npos);

    auto analytics = engine.evaluate(Make(StorageIntent::Database, AccessPattern::Query, true,
                                          DataType::Structured, SearchIntensity::None));
    assert(analytics.storageTargets == TargetSet{StorageTarget::AnalyticalStore});

    auto vector = engine.evaluate(Make(StorageIntent::Vector, AccessPattern::Search, false,
                                       DataType::Text, SearchIntensity::High));
    assert(vector.storageTargets == TargetSet{StorageTarget::VectorStore});
    assert(vector.rationale.find("text content") != std::string::npos);

    auto tracked = engine.evaluate(Make(StorageIntent::Database, AccessPattern::Crud, true,
                                        DataType::Structured, SearchIntensity::None));
    assert((tracked.storageTargets == TargetSet{StorageTarget::RelationalStore, StorageTarget::AnalyticalStore}));

    // Multi-backend rule placed ahead of narrower single-backend rules.
    auto heavy = engine.evaluate(Make(StorageIntent::Database, AccessPattern::Crud, true,
                                      DataType::Structured, SearchIntensity::High));
    assert(heavy.storageTargets.size() == 3);
    assert(*heavy.matchedRulePriority == 1);

    std::cout << "[PASS] Scenarios 1-4" << std::endl;
}

void TestMalformedCriteria(const DecisionTableEngine& engine) {
    std::cout << "[Test] Malformed criteria..." << std::endl;

    nlohmann::json document = {
        {"storage_intent", "database"},
        {"access_pattern", "crud"},
        {"analytic_intent", false},
        {"data_type", "unrecognized"},
        {"search_intensity", "none"}
    };
    bool threw = false;
    try {
        engine.evaluateDocument(document);
    } catch (const SchemaError& e) {
        threw = true;
        assert(e.field() == "data_type");
        assert(e.value() == "unrecognized");
    }
    assert(threw && "Undeclared data_type must raise SchemaError.");

    document["data_type"] = "text";
    document.erase("search_intensity");
    threw = false;
    try {
        engine.evaluateDocument(document);
    } catch (const SchemaError& e) {
        threw = true;
        assert(e.field() == "search_intensity");
    }
    assert(threw && "Missing field must raise SchemaError.");

    Criteria typed = Make(StorageIntent::File, AccessPattern::Crud, false, DataType::Text, SearchIntensity::None);
    typed.dataType = static_cast<DataType>(42);
    threw = false;
    try {
        engine.evaluate(typed);
    } catch (const SchemaError&) {
        threw = true;
    }
    assert(threw && "Out-of-range enum must raise SchemaError.");

    std::cout << "[PASS] Scenario 5" << std::endl;
}

void TestTotalityAndDeterminism(const DecisionTableEngine& engine) {
    std::cout << "[Test] Totality and determinism over the whole domain..." << std::endl;

    const auto domain = EnumerateCriteriaDomain();
    assert(domain.size() == 384);
    const std::size_t ruleCount = engine.snapshot()->size();

    for (const auto& criteria : domain) {
        DecisionResult first = engine.evaluate(criteria);
        DecisionResult second = engine.evaluate(criteria);
        assert(!first.storageTargets.empty());
        assert(first.matchedRulePriority && *first.matchedRulePriority < ruleCount);
        assert(first == second);
    }
    std::cout << "[PASS] 384 points, each with one stable non-empty result" << std::endl;
}

void TestPriorityPrecedence() {
    std::cout << "[Test] Priority precedence..." << std::endl;

    auto ruleSet = DecisionTableEngine::load(MakeDefinition({
        MakeRule("database", {{"storage_intent", "database"}}, {"relational_store"}),
        MakeRule("query", {{"access_pattern", "query"}}, {"analytical_store"}),
        MakeDefault()
    }), LoadOptions{false, false});
    DecisionTableEngine engine(ruleSet);

    auto both = engine.evaluate(Make(StorageIntent::Database, AccessPattern::Query, false,
                                     DataType::Structured, SearchIntensity::None));
    assert(both.storageTargets == TargetSet{StorageTarget::RelationalStore});
    assert(*both.matchedRulePriority == 0);

    auto onlyLater = engine.evaluate(Make(StorageIntent::File, AccessPattern::Query, false,
                                          DataType::Structured, SearchIntensity::None));
    assert(onlyLater.storageTargets == TargetSet{StorageTarget::AnalyticalStore});
    assert(onlyLater.matchedRuleId == "query");

    std::cout << "[PASS] Earlier rule wins when both match" << std::endl;
}

void TestCollectAll(const RuleSetPtr& ruleSet) {
    std::cout << "[Test] Collect-all hit policy..." << std::endl;

    DecisionTableEngine engine(ruleSet, HitPolicy::CollectAll);
    auto result = engine.evaluate(Make(StorageIntent::Memory, AccessPattern::Crud, false,
                                       DataType::Text, SearchIntensity::None));
    assert((result.storageTargets == TargetSet{StorageTarget::Memory, StorageTarget::FileStore}));
    assert(!result.matchedRulePriority);
    assert((result.matchedRulePriorities == std::vector<std::size_t>{0, ruleSet->size() - 1}));
    assert((result.operationHints == std::vector<std::string>{"memory.upsert", "file.write"}));
    assert(result.rationale.find("; ") != std::string::npos);
    assert(result.hitPolicy == HitPolicy::CollectAll);

    auto json = DecisionResultToJson(result);
    assert(json["hit_policy"] == "collect-all");

    std::cout << "[PASS] Targets unioned, hints deduplicated" << std::endl;
}

void TestNoSnapshot() {
    std::cout << "[Test] Evaluate before publish..." << std::endl;

    DecisionTableEngine engine;
    assert(!engine.snapshot());
    bool threw = false;
    try {
        engine.evaluate(Criteria{});
    } catch (const RuleSetIntegrityError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] RuleSetIntegrityError without a snapshot" << std::endl;
}

void TestRationaleRendering() {
    std::cout << "[Test] Rationale rendering..." << std::endl;

    Rule rule;
    rule.priority = 4;
    Criteria criteria = Make(StorageIntent::Vector, AccessPattern::Search, true, DataType::Numeric, SearchIntensity::Low);
    assert(RenderRationale("{data_type}/{analytic_intent} via {rule_id}", criteria, rule) == "numeric/true via #4");
    assert(RenderRationale("keep {unknown} and {open", criteria, rule) == "keep {unknown} and {open");
    std::cout << "[PASS] Placeholders substituted" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting DecisionTableEngine Test..." << std::endl;

    RuleSetPtr reference = DecisionTableEngine::load(RuleSetLoader::LoadFile(kReferenceRules));
    DecisionTableEngine engine(reference);

    TestScenarios(engine);
    TestMalformedCriteria(engine);
    TestTotalityAndDeterminism(engine);
    TestPriorityPrecedence();
    TestCollectAll(reference);
    TestNoSnapshot();
    TestRationaleRendering();

    std::cout << "[PASS] DecisionTableEngine Test completed." << std::endl;
    return 0;
}
