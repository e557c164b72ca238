#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "app/RouterCli.hpp"
#include "test/TestSupport.hpp"

using namespace storagerouter::app;
using namespace storagerouter::test;
namespace fs = std::filesystem;

namespace {

const std::string kNoConfig = "/nonexistent/storagerouter/settings.json";

CliArgs Parse(std::vector<std::string> words) {
    words.insert(words.begin(), "storage-router");
    std::vector<char*> argv;
    for (auto& word : words) argv.push_back(word.data());
    return ParseCli(static_cast<int>(argv.size()), argv.data());
}

int RunCli(const std::vector<std::string>& words) {
    return RouterCli(Parse(words)).Run();
}

bool RejectedByParser(const std::vector<std::string>& words) {
    try {
        Parse(words);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

void TestParsing() {
    std::cout << "[Test] Argument parsing..." << std::endl;

    CliArgs args = Parse({"validate", "--phase", "e2e", "--corpus", "c.json", "--scope", "alice",
                          "--runs", "5", "--workers", "2", "--threshold", "0.9", "--match", "superset"});
    assert(args.command == "validate");
    assert(args.phase == "e2e");
    assert(args.scope && *args.scope == "alice");
    assert(args.runs && *args.runs == 5);
    assert(args.workers && *args.workers == 2);
    assert(args.threshold && *args.threshold == 0.9);
    assert(args.extractor == "keyword");
    assert(args.config == "settings.json");
    assert(args.baseline.empty());
    assert(Parse({"validate", "--phase", "engine", "--corpus", "c.json", "--baseline", "prev.json"}).baseline == "prev.json");
    assert(RejectedByParser({"validate", "--phase", "engine", "--corpus", "c.json", "--baseline"}));

    CliArgs evaluate = Parse({"evaluate", "--criteria", "{}", "--collect-all"});
    assert(evaluate.collectAll);

    assert(RejectedByParser({}));
    assert(RejectedByParser({"route"}));
    assert(RejectedByParser({"check-rules", "--verbose"}));
    assert(RejectedByParser({"validate", "--phase", "engine", "--corpus", "c.json", "--runs", "0"}));
    assert(RejectedByParser({"validate", "--phase", "engine", "--corpus", "c.json", "--threshold", "high"}));
    assert(RejectedByParser({"validate", "--phase", "engine"}));
    assert(RejectedByParser({"evaluate"}));
    assert(RejectedByParser({"evaluate", "--criteria"}));
    assert(RejectedByParser({"validate", "--phase", "engine", "--corpus", "c.json",
                             "--rules", "r.json", "--rule-set", "storage-selection"}));

    std::cout << "[PASS] Flags parsed, bad input rejected" << std::endl;
}

void TestEvaluate() {
    std::cout << "[Test] evaluate command..." << std::endl;

    const std::string good =
        R"({"storage_intent": "database", "access_pattern": "query", "analytic_intent": true, )"
        R"("data_type": "structured", "search_intensity": "none"})";
    assert(RunCli({"evaluate", "--criteria", good, "--rules", kReferenceRules, "--config", kNoConfig}) == kExitOk);
    assert(RunCli({"evaluate", "--criteria", good, "--rules", kReferenceRules, "--config", kNoConfig,
                   "--collect-all"}) == kExitOk);

    assert(RunCli({"evaluate", "--criteria", R"({"storage_intent": "memory"})",
                   "--rules", kReferenceRules, "--config", kNoConfig}) == kExitSchemaError);
    assert(RunCli({"evaluate", "--criteria", "not json",
                   "--rules", kReferenceRules, "--config", kNoConfig}) == kExitSchemaError);
    assert(RunCli({"evaluate", "--criteria", good,
                   "--rules", kDataDir + "/rules/absent.json", "--config", kNoConfig}) == kExitError);

    std::cout << "[PASS] Exit codes 0, 3 and 1" << std::endl;
}

void TestCheckRules() {
    std::cout << "[Test] check-rules command..." << std::endl;

    assert(RunCli({"check-rules", "--rules", kReferenceRules, "--config", kNoConfig}) == kExitOk);
    assert(RunCli({"check-rules", "--rules", kReferenceRules, "--config", kNoConfig, "--strict"}) == kExitOk);

    std::cout << "[PASS] Reference rules pass strict check" << std::endl;
}

void TestValidate(const fs::path& scratch) {
    std::cout << "[Test] validate command..." << std::endl;

    const fs::path report = scratch / "engine-report.json";
    assert(RunCli({"validate", "--phase", "engine", "--corpus", kPinnedCorpus, "--rules", kReferenceRules,
                   "--config", kNoConfig, "--report", report.string(), "--workers", "2"}) == kExitOk);
    assert(fs::exists(report));
    nlohmann::json written;
    std::ifstream in(report);
    in >> written;
    assert(written["metrics"]["accuracy"] == 1.0);
    assert(written["workers"] == 2);

    assert(RunCli({"validate", "--phase", "engine", "--corpus", kPinnedCorpus, "--rules", kReferenceRules,
                   "--config", kNoConfig, "--rule-set-version", "1999.1.0"}) == kExitError);

    // Re-running against the saved report records an unchanged comparison.
    const fs::path compared = scratch / "compared-report.json";
    assert(RunCli({"validate", "--phase", "engine", "--corpus", kPinnedCorpus, "--rules", kReferenceRules,
                   "--config", kNoConfig, "--baseline", report.string(), "--report", compared.string()}) == kExitOk);
    nlohmann::json comparedReport;
    std::ifstream comparedIn(compared);
    comparedIn >> comparedReport;
    assert(comparedReport["comparison"]["accuracy_delta"] == 0.0);
    assert(comparedReport["comparison"]["regressions"].empty());
    assert(comparedReport["comparison"]["fixes"].empty());
    assert(comparedReport["comparison"]["baseline"]["rule_set_version"] == written["rule_set"]["version"]);

    assert(RunCli({"validate", "--phase", "engine", "--corpus", kPinnedCorpus, "--rules", kReferenceRules,
                   "--config", kNoConfig, "--baseline", (scratch / "no-such-report.json").string()}) == kExitError);
    const fs::path notAReport = scratch / "not-a-report.json";
    {
        std::ofstream out(notAReport);
        out << R"({"phase": "engine"})";
    }
    assert(RunCli({"validate", "--phase", "engine", "--corpus", kPinnedCorpus, "--rules", kReferenceRules,
                   "--config", kNoConfig, "--baseline", notAReport.string()}) == kExitError);

    // Keyword extractor end to end; a zero threshold always clears the gate.
    assert(RunCli({"validate", "--phase", "e2e", "--corpus", kDataDir + "/corpus/end_to_end.json",
                   "--rules", kReferenceRules, "--config", kNoConfig, "--threshold", "0", "--runs", "1"}) == kExitOk);
    assert(RunCli({"validate", "--phase", "extractor", "--corpus", kDataDir + "/corpus/extractor_labeled.json",
                   "--config", kNoConfig, "--threshold", "0"}) == kExitOk);

    const fs::path mislabeled = scratch / "mislabeled.json";
    {
        std::ofstream out(mislabeled);
        out << R"({"name": "mislabeled", "cases": [{"name": "fact", "category": "memory", )"
               R"("criteria": {"storage_intent": "memory", "access_pattern": "crud", "analytic_intent": false, )"
               R"("data_type": "structured", "search_intensity": "none"}, "expected_storage": ["vector_store"]}]})";
    }
    assert(RunCli({"validate", "--phase", "engine", "--corpus", mislabeled.string(), "--rules", kReferenceRules,
                   "--config", kNoConfig}) == kExitGateFailed);

    assert(RunCli({"validate", "--phase", "nightly", "--corpus", kPinnedCorpus, "--rules", kReferenceRules,
                   "--config", kNoConfig}) == kExitError);
    assert(RunCli({"validate", "--phase", "e2e", "--corpus", kPinnedCorpus, "--rules", kReferenceRules,
                   "--config", kNoConfig, "--extractor", "oracle"}) == kExitError);
    assert(RunCli({"validate", "--phase", "engine", "--corpus", (scratch / "none.json").string(),
                   "--rules", kReferenceRules, "--config", kNoConfig}) == kExitError);

    std::cout << "[PASS] Gate, version pin, baseline and input errors mapped to exit codes" << std::endl;
}

void TestNamedRuleSetFromConfig(const fs::path& scratch) {
    std::cout << "[Test] Rule set resolved through settings..." << std::endl;

    const fs::path config = scratch / "settings.json";
    {
        std::ofstream out(config);
        out << nlohmann::json{{"rules_root", kDataDir}, {"rule_set", "storage-selection"}, {"scope", "nobody"}}.dump();
    }
    assert(RunCli({"check-rules", "--config", config.string()}) == kExitOk);
    assert(RunCli({"check-rules", "--config", config.string(), "--rule-set", "absent"}) == kExitError);

    std::cout << "[PASS] rules_root and rule_set honoured" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting CLI Test..." << std::endl;

    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const fs::path scratch = fs::temp_directory_path() / ("storagerouter_cli_" + std::to_string(stamp));
    fs::create_directories(scratch);

    TestParsing();
    TestEvaluate();
    TestCheckRules();
    TestValidate(scratch);
    TestNamedRuleSetFromConfig(scratch);

    std::error_code ec;
    fs::remove_all(scratch, ec);

    std::cout << "[PASS] CLI Test completed." << std::endl;
    return 0;
}
