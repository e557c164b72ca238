/**
 * @file ValidationReport.hpp
 * @brief Per-run results of the validation harness and their renderings.
 */

#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "domain/Criteria.hpp"
#include "domain/DecisionResult.hpp"
#include "domain/StorageTarget.hpp"

namespace storagerouter::application {

enum class ValidationPhase {
    EngineOnly,    ///< Labeled Criteria straight into the engine.
    ExtractorOnly, ///< Field-level scoring of the extractor.
    EndToEnd       ///< Extractor chained into the engine.
};

/**
 * @enum FailureKind
 * @brief Why a case did not pass. Hard failures are never mixed with accuracy misses.
 */
enum class FailureKind {
    None,
    AccuracyMiss,
    SchemaError,      ///< Hard failure.
    RuleSetIntegrity, ///< Hard failure.
    CaseDefect,       ///< Hard failure: the case lacks the input its phase needs.
    ParseError        ///< The extractor declined to classify.
};

/**
 * @enum Attribution
 * @brief Which side of the extractor/engine boundary an end-to-end miss belongs to.
 */
enum class Attribution {
    None,
    Extractor,
    RuleSet,
    Unattributed
};

enum class MatchMode {
    Exact,   ///< Predicted targets equal the expected targets.
    Superset ///< Expected targets are contained in the predicted targets.
};

std::string PhaseToString(ValidationPhase phase);
std::optional<ValidationPhase> PhaseFromString(const std::string& value);
std::string FailureKindToString(FailureKind kind);
std::string AttributionToString(Attribution attribution);
std::string MatchModeToString(MatchMode mode);
std::optional<MatchMode> MatchModeFromString(const std::string& value);

inline bool IsHardFailure(FailureKind kind) {
    return kind == FailureKind::SchemaError || kind == FailureKind::RuleSetIntegrity ||
           kind == FailureKind::CaseDefect;
}

/** @brief Compares target sets under a match mode. */
bool TargetsMatch(const domain::TargetSet& predicted, const domain::TargetSet& expected, MatchMode mode);

/**
 * @struct CaseResult
 * @brief Outcome of one validation case.
 */
struct CaseResult {
    std::size_t index = 0;
    std::string name;
    std::string category;
    bool correct = false;
    FailureKind failure = FailureKind::None;
    std::string errorMessage;

    domain::TargetSet expectedTargets;
    std::optional<domain::TargetSet> predictedTargets;
    std::optional<domain::Criteria> expectedCriteria;
    std::optional<domain::Criteria> extractedCriteria;
    std::map<std::string, bool> fieldMatches; ///< Extractor phases: field name -> matched.
    std::optional<std::size_t> matchedRulePriority;
    std::string matchedRuleId;

    bool consistent = true;
    double latencyMicros = 0.0; ///< First run only.
    Attribution attribution = Attribution::None;
};

struct Tally {
    std::size_t correct = 0;
    std::size_t total = 0;

    double accuracy() const {
        return total == 0 ? 0.0 : static_cast<double>(correct) / static_cast<double>(total);
    }
};

struct LatencySummary {
    double meanMicros = 0.0;
    double p50Micros = 0.0;
    double p90Micros = 0.0;
    double p99Micros = 0.0;
    double maxMicros = 0.0;
};

/**
 * @class BaselineError
 * @brief A previous report that cannot serve as a comparison baseline.
 */
class BaselineError : public std::runtime_error {
public:
    explicit BaselineError(const std::string& detail)
        : std::runtime_error("BaselineError: " + detail) {}
};

struct CategoryComparison {
    std::optional<double> baseline; ///< Unset when the category is new.
    std::optional<double> current;  ///< Unset when the category was dropped.
};

/**
 * @struct ReportComparison
 * @brief Differences between a run and a previously saved report.
 *
 * Cases are matched by name. Only the first baseline case of a given name
 * takes part in the comparison.
 */
struct ReportComparison {
    std::string baselinePhase;
    std::string baselineRuleSetVersion;
    std::string baselineExtractor;
    double baselineAccuracy = 0.0;
    double accuracyDelta = 0.0; ///< Current minus baseline; negative means behind.

    std::map<std::string, CategoryComparison> byCategory;
    std::vector<std::string> fixes;       ///< Failed in the baseline, pass now.
    std::vector<std::string> regressions; ///< Passed in the baseline, fail now.
    std::vector<std::string> newCases;    ///< No baseline case of that name.
};

/**
 * @struct ValidationReport
 * @brief Aggregate metrics of one harness run plus its per-case results.
 */
struct ValidationReport {
    ValidationPhase phase = ValidationPhase::EngineOnly;
    std::string ruleSetName;
    std::string ruleSetVersion;
    std::string extractorName;
    domain::HitPolicy hitPolicy = domain::HitPolicy::First;
    MatchMode matchMode = MatchMode::Exact;
    int consistencyRuns = 1;
    int workers = 1;

    std::size_t total = 0;
    std::size_t correct = 0;
    std::size_t accuracyMisses = 0;
    std::size_t hardFailures = 0;
    std::size_t parseFailures = 0;
    std::size_t consistentCases = 0;

    double accuracy = 0.0;
    double consistency = 0.0;

    std::map<std::string, Tally> byCategory;
    std::map<std::string, Tally> byField;
    std::map<std::string, std::size_t> attribution; ///< "extractor" | "rule_set" | "unattributed" -> misses.
    LatencySummary latency;

    std::vector<CaseResult> cases;

    std::optional<ReportComparison> comparison; ///< Set when run against a baseline.

    /**
     * @brief Regression gate: accuracy at or above @p threshold and, for the
     *        engine-only phase, every case consistent.
     */
    bool meetsThreshold(double threshold) const;
};

/**
 * @brief Recomputes every aggregate of @p report from its per-case results.
 */
void ComputeAggregates(ValidationReport& report);

/** @brief Nearest-rank percentile of an unsorted sample (0 for an empty sample). */
double Percentile(std::vector<double> samples, double percentile);

/**
 * @brief Compares @p current with a report previously written by ReportToJson.
 * @throws BaselineError when @p baseline lacks metrics.accuracy or a well-formed cases array.
 */
ReportComparison CompareReports(const nlohmann::json& baseline, const ValidationReport& current);

/** @brief Machine-readable form for CI gating. */
nlohmann::json ReportToJson(const ValidationReport& report);

/** @brief Human-readable summary for rule-set authors. */
std::string FormatSummary(const ValidationReport& report, std::optional<double> threshold = std::nullopt);

} // namespace storagerouter::application
