/**
 * @file RouterCli.cpp
 * @brief Implementation of the command-line front end.
 */

#include "app/RouterCli.hpp"

#include "application/DecisionTableEngine.hpp"
#include "application/ValidationHarness.hpp"
#include "domain/DecisionErrors.hpp"
#include "infrastructure/CorpusLoader.hpp"
#include "infrastructure/KeywordCriteriaExtractor.hpp"
#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/OllamaCriteriaExtractor.hpp"
#include "infrastructure/ReportWriter.hpp"
#include "infrastructure/RuleSetLoader.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace storagerouter::app {

using json = nlohmann::json;
using namespace storagerouter::domain;
using namespace storagerouter::application;
using namespace storagerouter::infrastructure;

const char* const kUsage =
"storage-router evaluate    --criteria <json> [--rules <file>] [--collect-all]\n"
"storage-router check-rules [--rules <file>] [--strict]\n"
"storage-router validate    --phase engine|extractor|e2e --corpus <file>\n"
"                           [--rules <file> | --rule-set <name>] [--scope <s>]\n"
"                           [--rule-set-version <v>] [--extractor keyword|ollama]\n"
"                           [--threshold <x>] [--runs <n>] [--workers <n>]\n"
"                           [--match exact|superset] [--report <file>]\n"
"                           [--baseline <previous report>]\n"
"common: [--config <settings.json>]\n";

namespace {

double ParseDouble(const std::string& flag, const std::string& value) {
    const std::string error = "Invalid number for " + flag + ": " + value;
    std::size_t used = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &used);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(error);
    }
    if (used != value.size()) throw std::invalid_argument(error);
    return parsed;
}

int ParseInt(const std::string& flag, const std::string& value) {
    const std::string error = "Invalid positive integer for " + flag + ": " + value;
    std::size_t used = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &used);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(error);
    }
    if (used != value.size() || parsed < 1) throw std::invalid_argument(error);
    return parsed;
}

void PrintAnalysis(const RuleSet& ruleSet) {
    const auto& analysis = ruleSet.analysis();
    std::cout << "Rule set " << ruleSet.name() << "@" << ruleSet.version() << ": "
              << ruleSet.size() << " rules, " << analysis.reachableRules << " reachable" << std::endl;

    for (const auto& rule : ruleSet.rules()) {
        std::cout << "  " << rule.priority << ". " << rule.label() << "  [" << rule.condition.describe()
                  << "] -> " << FormatTargets(rule.outcome.storageTargets) << std::endl;
    }

    if (analysis.shadowed.empty()) {
        std::cout << "No shadowed rules." << std::endl;
    } else {
        for (const auto& warning : analysis.shadowed) {
            std::cout << "ShadowedRuleWarning: " << warning.describe() << std::endl;
        }
    }

    for (const auto& overlap : analysis.overlaps) {
        const Rule& earlier = ruleSet.rules()[overlap.earlier];
        const Rule& later = ruleSet.rules()[overlap.later];
        std::cout << "Overlap: rule " << overlap.earlier << " (" << earlier.label() << ") and rule "
                  << overlap.later << " (" << later.label() << ") both match "
                  << FormatCriteria(overlap.witness) << "; rule " << overlap.earlier << " wins" << std::endl;
    }
    if (!analysis.defaultRuleReachable) {
        std::cout << "Default rule is unreachable." << std::endl;
    }
}

} // namespace

CliArgs ParseCli(int argc, char** argv) {
    if (argc < 2) {
        throw std::invalid_argument("Missing command");
    }

    CliArgs a;
    a.command = argv[1];
    if (a.command != "evaluate" && a.command != "check-rules" && a.command != "validate") {
        throw std::invalid_argument("Unknown command: " + a.command);
    }

    int i = 2;
    while (i < argc) {
        std::string f = argv[i++];
        auto next = [&]() -> std::string {
            if (i >= argc) throw std::invalid_argument("Missing value after " + f);
            return argv[i++];
        };
        if (f == "--criteria") a.criteria = next();
        else if (f == "--rules") a.rulesFile = next();
        else if (f == "--collect-all") a.collectAll = true;
        else if (f == "--strict") a.strict = true;
        else if (f == "--phase") a.phase = next();
        else if (f == "--corpus") a.corpus = next();
        else if (f == "--rule-set") a.ruleSetName = next();
        else if (f == "--scope") a.scope = next();
        else if (f == "--rule-set-version") a.ruleSetVersion = next();
        else if (f == "--extractor") a.extractor = next();
        else if (f == "--threshold") a.threshold = ParseDouble(f, next());
        else if (f == "--runs") a.runs = ParseInt(f, next());
        else if (f == "--workers") a.workers = ParseInt(f, next());
        else if (f == "--match") a.match = next();
        else if (f == "--report") a.report = next();
        else if (f == "--baseline") a.baseline = next();
        else if (f == "--config") a.config = next();
        else throw std::invalid_argument("Unknown flag: " + f);
    }

    if (a.command == "evaluate" && a.criteria.empty()) {
        throw std::invalid_argument("evaluate requires --criteria");
    }
    if (a.command == "validate") {
        if (a.phase.empty()) throw std::invalid_argument("validate requires --phase");
        if (a.corpus.empty()) throw std::invalid_argument("validate requires --corpus");
        if (!a.rulesFile.empty() && !a.ruleSetName.empty()) {
            throw std::invalid_argument("--rules and --rule-set are mutually exclusive");
        }
    }
    return a;
}

RouterCli::RouterCli(CliArgs args)
    : m_args(std::move(args)),
      m_config(ConfigLoader::LoadFile(m_args.config)) {}

int RouterCli::Run() {
    try {
        if (m_args.command == "evaluate") return runEvaluate();
        if (m_args.command == "check-rules") return runCheckRules();
        return runValidate();
    } catch (const RuleSetIntegrityError& e) {
        std::cerr << "[RouterCli] " << e.what() << std::endl;
        return kExitError;
    } catch (const CorpusError& e) {
        std::cerr << "[RouterCli] " << e.what() << std::endl;
        return kExitError;
    } catch (const BaselineError& e) {
        std::cerr << "[RouterCli] " << e.what() << std::endl;
        return kExitError;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[RouterCli] " << e.what() << "\n" << kUsage;
        return kExitError;
    }
}

RuleSetPtr RouterCli::loadRuleSet(bool strictShadowing, bool logFindings) const {
    RuleSetDefinition definition;
    if (!m_args.rulesFile.empty()) {
        definition = RuleSetLoader::LoadFile(m_args.rulesFile);
    } else {
        const std::string name = m_args.ruleSetName.empty() ? m_config.ruleSet : m_args.ruleSetName;
        const std::string scope = m_args.scope ? *m_args.scope : m_config.scope;
        definition = RuleSetLoader::LoadNamed(m_config.rulesRoot, name, scope);
    }

    LoadOptions options;
    options.strictShadowing = strictShadowing;
    options.logFindings = logFindings;
    return DecisionTableEngine::load(definition, options);
}

int RouterCli::runEvaluate() {
    json document;
    try {
        document = json::parse(m_args.criteria);
    } catch (const json::parse_error& e) {
        std::cerr << "[RouterCli] SchemaError: --criteria is not valid JSON: " << e.what() << std::endl;
        return kExitSchemaError;
    }

    RuleSetPtr ruleSet = loadRuleSet(m_config.strictShadowing, false);
    DecisionTableEngine engine(ruleSet, m_args.collectAll ? HitPolicy::CollectAll : HitPolicy::First);

    try {
        DecisionResult result = engine.evaluateDocument(document);
        std::cout << DecisionResultToJson(result).dump(2) << std::endl;
    } catch (const SchemaError& e) {
        std::cerr << "[RouterCli] " << e.what() << std::endl;
        return kExitSchemaError;
    }
    return kExitOk;
}

int RouterCli::runCheckRules() {
    RuleSetPtr ruleSet = loadRuleSet(m_args.strict || m_config.strictShadowing, true);
    PrintAnalysis(*ruleSet);
    return kExitOk;
}

int RouterCli::runValidate() {
    auto phase = PhaseFromString(m_args.phase);
    if (!phase) {
        throw std::invalid_argument("Unknown phase: " + m_args.phase);
    }
    const std::string matchName = m_args.match.empty() ? m_config.matchMode : m_args.match;
    auto matchMode = MatchModeFromString(matchName);
    if (!matchMode) {
        throw std::invalid_argument("Unknown match mode: " + matchName);
    }

    Corpus corpus = CorpusLoader::LoadFile(m_args.corpus);
    std::optional<json> baseline;
    if (!m_args.baseline.empty()) {
        baseline = ReportWriter::ReadReport(m_args.baseline);
    }

    RuleSetPtr ruleSet;
    if (*phase != ValidationPhase::ExtractorOnly) {
        ruleSet = loadRuleSet(m_args.strict || m_config.strictShadowing, true);
        if (!m_args.ruleSetVersion.empty() && ruleSet->version() != m_args.ruleSetVersion) {
            throw RuleSetIntegrityError("requested rule set version " + m_args.ruleSetVersion +
                                        " but resolved artifact carries " + ruleSet->version());
        }
    }

    std::unique_ptr<CriteriaExtractor> extractor;
    if (*phase != ValidationPhase::EngineOnly) {
        if (m_args.extractor == "keyword") {
            extractor = std::make_unique<KeywordCriteriaExtractor>();
        } else if (m_args.extractor == "ollama") {
            auto ollama = std::make_unique<OllamaCriteriaExtractor>(
                OllamaClient(m_config.ollama.host, m_config.ollama.port), m_config.ollama.model);
            if (!ollama->modelAvailable()) {
                std::cerr << "[RouterCli] Model " << m_config.ollama.model << " is not listed by Ollama at "
                          << m_config.ollama.host << ":" << m_config.ollama.port
                          << "; cases will fail as parse errors." << std::endl;
            }
            extractor = std::move(ollama);
        } else {
            throw std::invalid_argument("Unknown extractor: " + m_args.extractor);
        }
    }

    HarnessOptions options;
    options.consistencyRuns = m_args.runs ? *m_args.runs : m_config.consistencyRuns;
    options.workers = m_args.workers ? *m_args.workers : m_config.workers;
    options.matchMode = *matchMode;
    ValidationHarness harness(options);

    std::cout << "[RouterCli] Validating " << corpus.cases.size() << " cases from '" << corpus.name
              << "' (phase " << PhaseToString(*phase) << ")" << std::endl;

    ValidationReport report;
    switch (*phase) {
        case ValidationPhase::EngineOnly:
            report = harness.runPhaseEngineOnly(corpus.cases, ruleSet);
            break;
        case ValidationPhase::ExtractorOnly:
            report = harness.runPhaseExtractorOnly(corpus.cases, *extractor);
            break;
        case ValidationPhase::EndToEnd:
            report = harness.runPhaseEndToEnd(corpus.cases, *extractor, ruleSet);
            break;
    }
    if (baseline) {
        report.comparison = CompareReports(*baseline, report);
    }

    const double threshold = m_args.threshold ? *m_args.threshold : m_config.accuracyThreshold;
    std::cout << FormatSummary(report, threshold);

    if (!writeReport(report)) {
        return kExitError;
    }
    return report.meetsThreshold(threshold) ? kExitOk : kExitGateFailed;
}

bool RouterCli::writeReport(const ValidationReport& report) const {
    if (!m_args.report.empty()) {
        return ReportWriter::WriteJson(report, m_args.report);
    }
    if (!m_config.reportDir.empty()) {
        return ReportWriter::WriteJson(report, ReportWriter::DefaultReportPath(m_config.reportDir, report));
    }
    return true;
}

} // namespace storagerouter::app
