#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "application/DecisionTableEngine.hpp"
#include "domain/DecisionErrors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/CorpusLoader.hpp"
#include "infrastructure/ReportWriter.hpp"
#include "infrastructure/RuleSetLoader.hpp"
#include "test/TestSupport.hpp"

using namespace storagerouter::domain;
using namespace storagerouter::application;
using namespace storagerouter::infrastructure;
using namespace storagerouter::test;
namespace fs = std::filesystem;

namespace {

fs::path MakeScratchDir() {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path dir = fs::temp_directory_path() / ("storagerouter_loader_" + std::to_string(stamp));
    fs::create_directories(dir);
    return dir;
}

void WriteFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

std::string Artifact(const std::string& version, const std::string& defaultTarget) {
    return R"({"name": "storage-selection", "version": ")" + version + R"(", "rules": [)"
           R"({"id": "memory", "condition": {"storage_intent": "memory"}, "outcome": {"storage_targets": ["memory"]}},)"
           R"({"id": "default", "condition": {}, "outcome": {"storage_targets": [")" + defaultTarget + R"("]}}]})";
}

void TestReferenceArtifact() {
    std::cout << "[Test] Reference artifact..." << std::endl;

    RuleSetDefinition definition = RuleSetLoader::LoadFile(kReferenceRules);
    assert(definition.name == "storage-selection");
    assert(definition.version == "2026.10.0");
    assert(definition.createdAt == "2026-10-01T00:00:00Z");
    assert(definition.rules.size() == 17);
    assert(definition.rules.front().id == "memory-facts");
    assert(definition.rules.front().operationHints == std::vector<std::string>{"memory.upsert"});
    // Boolean literals arrive as their string form.
    assert(definition.rules[1].condition.at("analytic_intent") == "true");
    assert(definition.rules.back().condition.empty());

    RuleSetPtr ruleSet = DecisionTableEngine::load(definition, LoadOptions{false, false});
    assert(ruleSet->createdAt() == "2026-10-01T00:00:00Z");

    std::cout << "[PASS] 17 rules read" << std::endl;
}

void TestMalformedArtifacts(const fs::path& scratch) {
    std::cout << "[Test] Malformed artifacts..." << std::endl;

    auto expectIntegrityError = [](const nlohmann::json& document, const std::string& fragment) {
        try {
            RuleSetLoader::ParseDefinition(document);
        } catch (const RuleSetIntegrityError& e) {
            assert(std::string(e.what()).find(fragment) != std::string::npos);
            return;
        }
        assert(false && "ParseDefinition should have raised.");
    };

    expectIntegrityError(nlohmann::json::array(), "JSON object");
    expectIntegrityError({{"version", "1"}}, "no 'rules' array");
    expectIntegrityError({{"version", 7}, {"rules", nlohmann::json::array()}}, "must be strings");
    expectIntegrityError({{"version", "1"}, {"rules", {{{"id", "orphan"}}}}}, "no 'outcome'");
    expectIntegrityError({{"version", "1"},
                          {"rules", {{{"condition", {{"data_type", 3}}}, {"outcome", {{"storage_targets", {"memory"}}}}}}}},
                         "string or boolean");

    const fs::path broken = scratch / "broken.json";
    WriteFile(broken, "{ \"rules\": [ ");
    bool threw = false;
    try {
        RuleSetLoader::LoadFile(broken);
    } catch (const RuleSetIntegrityError& e) {
        threw = true;
        assert(std::string(e.what()).find("malformed") != std::string::npos);
    }
    assert(threw);

    threw = false;
    try {
        RuleSetLoader::LoadFile(scratch / "absent.json");
    } catch (const RuleSetIntegrityError& e) {
        threw = true;
        assert(std::string(e.what()).find("not found") != std::string::npos);
    }
    assert(threw);

    std::cout << "[PASS] Every defect surfaces as RuleSetIntegrityError" << std::endl;
}

void TestScopeResolution(const fs::path& scratch) {
    std::cout << "[Test] Per-scope rule-set resolution..." << std::endl;

    const fs::path root = scratch / "rules-root";
    WriteFile(root / "rules" / "storage-selection.json", Artifact("shared-1", "file_store"));
    WriteFile(root / "users" / "alice" / "rules" / "storage-selection.json", Artifact("alice-1", "relational_store"));

    auto paths = RuleSetLoader::CandidatePaths(root, "storage-selection", "alice");
    assert(paths.size() == 2);
    assert(paths[0] == root / "users" / "alice" / "rules" / "storage-selection.json");
    assert(RuleSetLoader::CandidatePaths(root, "storage-selection", "").size() == 1);

    assert(RuleSetLoader::LoadNamed(root, "storage-selection", "alice").version == "alice-1");
    // A scope without an override falls back to the shared artifact.
    assert(RuleSetLoader::LoadNamed(root, "storage-selection", "bob").version == "shared-1");
    assert(RuleSetLoader::LoadNamed(root, "storage-selection").version == "shared-1");

    bool threw = false;
    try {
        RuleSetLoader::LoadNamed(root, "missing", "alice");
    } catch (const RuleSetIntegrityError& e) {
        threw = true;
        const std::string message = e.what();
        assert(message.find("users") != std::string::npos);
        assert(message.find("missing.json") != std::string::npos);
    }
    assert(threw);

    std::cout << "[PASS] Scoped override preferred, shared fallback used" << std::endl;
}

void TestCorpusLoader(const fs::path& scratch) {
    std::cout << "[Test] Corpus loading..." << std::endl;

    Corpus pinned = CorpusLoader::LoadFile(kPinnedCorpus);
    assert(pinned.cases.size() == 50);
    assert(pinned.phase == "engine");
    std::size_t memory = 0;
    std::size_t multi = 0;
    for (const auto& vc : pinned.cases) {
        assert(vc.criteriaInput.has_value());
        assert(!vc.expectedTargets.empty());
        if (vc.category == "memory") ++memory;
        if (vc.category == "multi") ++multi;
    }
    assert(memory == 5);
    assert(multi == 5);

    Corpus e2e = CorpusLoader::LoadFile(kDataDir + "/corpus/end_to_end.json");
    assert(e2e.cases.size() == 50);
    assert(e2e.cases[0].requestText.has_value());
    assert(e2e.cases[0].expectedCriteria.has_value());

    bool threw = false;
    try {
        CorpusLoader::Parse({{"cases", {{{"name", "x"}, {"expected_storage", {"blob_store"}}}}}});
    } catch (const CorpusError& e) {
        threw = true;
        assert(std::string(e.what()).find("blob_store") != std::string::npos);
    }
    assert(threw);

    threw = false;
    try {
        CorpusLoader::Parse({{"cases", {{{"name", "x"}, {"expected_storage", {"memory"}},
                                          {"expected_criteria", {{"storage_intent", "memory"}}}}}}});
    } catch (const CorpusError&) {
        threw = true;
    }
    assert(threw);

    // A case with no input still loads; the harness reports it as a defect.
    Corpus bare = CorpusLoader::Parse({{"cases", {{{"expected_storage", {"memory"}}}}}});
    assert(bare.cases[0].name == "case 0");
    assert(!bare.cases[0].criteriaInput && !bare.cases[0].requestText);

    threw = false;
    try {
        CorpusLoader::LoadFile(scratch / "no-corpus.json");
    } catch (const CorpusError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[PASS] Corpora parsed and validated" << std::endl;
}

void TestConfigLoader(const fs::path& scratch) {
    std::cout << "[Test] Settings file..." << std::endl;

    RouterConfig defaults = ConfigLoader::LoadFile((scratch / "nope.json").string());
    assert(defaults.ruleSet == "storage-selection");
    assert(defaults.accuracyThreshold == 0.95);
    assert(defaults.ollama.port == 11434);

    WriteFile(scratch / "partial.json", R"({"workers": 4, "scope": "alice", "ollama": {"model": "llama3.1:8b"}})");
    RouterConfig partial = ConfigLoader::LoadFile((scratch / "partial.json").string());
    assert(partial.workers == 4);
    assert(partial.scope == "alice");
    assert(partial.ollama.model == "llama3.1:8b");
    assert(partial.ollama.host == "localhost");
    assert(partial.consistencyRuns == 3);

    WriteFile(scratch / "broken.json", "{ workers: ");
    RouterConfig broken = ConfigLoader::LoadFile((scratch / "broken.json").string());
    assert(broken.workers == 1);

    WriteFile(scratch / "project" / "settings.json", R"({"strict_shadowing": true})");
    assert(ConfigLoader::Load((scratch / "project").string()).strictShadowing);

    std::cout << "[PASS] Defaults overlaid by present keys" << std::endl;
}

void TestReportWriter(const fs::path& scratch) {
    std::cout << "[Test] Report writing..." << std::endl;

    const fs::path target = scratch / "reports" / "nested" / "out.json";
    assert(ReportWriter::WriteAtomic(target, "{\"ok\": true}\n"));
    std::ifstream in(target);
    nlohmann::json back;
    in >> back;
    assert(back["ok"] == true);

    for (const auto& entry : fs::directory_iterator(target.parent_path())) {
        assert(entry.path().extension() != ".tmp");
    }

    ValidationReport report;
    report.phase = ValidationPhase::ExtractorOnly;
    report.extractorName = "ollama:qwen2.5:7b";
    assert(ReportWriter::DefaultReportPath(scratch, report) == scratch / "extractor-ollama_qwen2.5_7b.json");
    report.phase = ValidationPhase::EngineOnly;
    report.ruleSetVersion = "2026.10.0";
    assert(ReportWriter::DefaultReportPath(scratch, report) == scratch / "engine-2026.10.0.json");

    assert(ReportWriter::WriteJson(report, scratch / "engine.json"));
    assert(fs::exists(scratch / "engine.json"));

    std::cout << "[PASS] Atomic write leaves no temp file" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Loader Test..." << std::endl;

    const fs::path scratch = MakeScratchDir();

    TestReferenceArtifact();
    TestMalformedArtifacts(scratch);
    TestScopeResolution(scratch);
    TestCorpusLoader(scratch);
    TestConfigLoader(scratch);
    TestReportWriter(scratch);

    std::error_code ec;
    fs::remove_all(scratch, ec);

    std::cout << "[PASS] Loader Test completed." << std::endl;
    return 0;
}
