/**
 * @file ValidationReport.cpp
 * @brief Aggregation and rendering of validation reports.
 */

#include "application/ValidationReport.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numeric>
#include <sstream>

namespace storagerouter::application {

using namespace storagerouter::domain;

namespace {

std::string Percent(double ratio) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << (ratio * 100.0) << "%";
    return ss.str();
}

std::string Micros(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << value << "us";
    return ss.str();
}

std::string SignedPercent(double ratio) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << std::showpos << (ratio * 100.0) << "%";
    return ss.str();
}

std::string JoinNames(const std::vector<std::string>& names) {
    if (names.empty()) return "none";
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) joined += ", ";
        joined += name;
    }
    return joined;
}

std::string StringMember(const nlohmann::json& node, const char* key) {
    if (!node.is_object()) return "";
    auto it = node.find(key);
    return (it != node.end() && it->is_string()) ? it->get<std::string>() : "";
}

nlohmann::json OptionalNumber(const std::optional<double>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json ComparisonToJson(const ReportComparison& comparison) {
    nlohmann::json byCategory = nlohmann::json::object();
    for (const auto& [category, entry] : comparison.byCategory) {
        byCategory[category] = {
            {"baseline", OptionalNumber(entry.baseline)},
            {"current", OptionalNumber(entry.current)},
            {"delta", (entry.baseline && entry.current)
                ? nlohmann::json(*entry.current - *entry.baseline) : nlohmann::json(nullptr)}
        };
    }
    return {
        {"baseline", {
            {"phase", comparison.baselinePhase},
            {"rule_set_version", comparison.baselineRuleSetVersion},
            {"extractor", comparison.baselineExtractor},
            {"accuracy", comparison.baselineAccuracy}
        }},
        {"accuracy_delta", comparison.accuracyDelta},
        {"by_category", byCategory},
        {"fixes", comparison.fixes},
        {"regressions", comparison.regressions},
        {"new_cases", comparison.newCases}
    };
}

} // namespace

std::string PhaseToString(ValidationPhase phase) {
    switch (phase) {
        case ValidationPhase::EngineOnly: return "engine";
        case ValidationPhase::ExtractorOnly: return "extractor";
        case ValidationPhase::EndToEnd: return "e2e";
    }
    return "unknown";
}

std::optional<ValidationPhase> PhaseFromString(const std::string& value) {
    if (value == "engine") return ValidationPhase::EngineOnly;
    if (value == "extractor") return ValidationPhase::ExtractorOnly;
    if (value == "e2e" || value == "end-to-end") return ValidationPhase::EndToEnd;
    return std::nullopt;
}

std::string FailureKindToString(FailureKind kind) {
    switch (kind) {
        case FailureKind::None: return "none";
        case FailureKind::AccuracyMiss: return "accuracy_miss";
        case FailureKind::SchemaError: return "schema_error";
        case FailureKind::RuleSetIntegrity: return "rule_set_integrity_error";
        case FailureKind::CaseDefect: return "case_defect";
        case FailureKind::ParseError: return "parse_error";
    }
    return "unknown";
}

std::string AttributionToString(Attribution attribution) {
    switch (attribution) {
        case Attribution::None: return "none";
        case Attribution::Extractor: return "extractor";
        case Attribution::RuleSet: return "rule_set";
        case Attribution::Unattributed: return "unattributed";
    }
    return "unknown";
}

std::string MatchModeToString(MatchMode mode) {
    switch (mode) {
        case MatchMode::Exact: return "exact";
        case MatchMode::Superset: return "superset";
    }
    return "unknown";
}

std::optional<MatchMode> MatchModeFromString(const std::string& value) {
    if (value == "exact") return MatchMode::Exact;
    if (value == "superset") return MatchMode::Superset;
    return std::nullopt;
}

bool TargetsMatch(const TargetSet& predicted, const TargetSet& expected, MatchMode mode) {
    if (mode == MatchMode::Exact) return predicted == expected;
    return std::includes(predicted.begin(), predicted.end(), expected.begin(), expected.end());
}

double Percentile(std::vector<double> samples, double percentile) {
    if (samples.empty()) return 0.0;
    std::sort(samples.begin(), samples.end());
    const double rank = std::ceil(percentile / 100.0 * static_cast<double>(samples.size()));
    std::size_t index = rank < 1.0 ? 0 : static_cast<std::size_t>(rank) - 1;
    index = std::min(index, samples.size() - 1);
    return samples[index];
}

bool ValidationReport::meetsThreshold(double threshold) const {
    if (accuracy < threshold) return false;
    if (phase == ValidationPhase::EngineOnly && consistentCases != total) return false;
    return true;
}

void ComputeAggregates(ValidationReport& report) {
    report.total = report.cases.size();
    report.correct = 0;
    report.accuracyMisses = 0;
    report.hardFailures = 0;
    report.parseFailures = 0;
    report.consistentCases = 0;
    report.byCategory.clear();
    report.byField.clear();
    report.attribution.clear();

    std::vector<double> latencies;
    latencies.reserve(report.cases.size());

    for (const auto& result : report.cases) {
        Tally& category = report.byCategory[result.category];
        ++category.total;
        if (result.correct) {
            ++report.correct;
            ++category.correct;
        }

        if (result.failure == FailureKind::AccuracyMiss) ++report.accuracyMisses;
        else if (result.failure == FailureKind::ParseError) ++report.parseFailures;
        else if (IsHardFailure(result.failure)) ++report.hardFailures;

        if (result.consistent) ++report.consistentCases;

        for (const auto& [field, matched] : result.fieldMatches) {
            Tally& tally = report.byField[field];
            ++tally.total;
            if (matched) ++tally.correct;
        }

        if (result.attribution != Attribution::None) {
            ++report.attribution[AttributionToString(result.attribution)];
        }

        latencies.push_back(result.latencyMicros);
    }

    const double total = static_cast<double>(report.total);
    report.accuracy = report.total == 0 ? 0.0 : static_cast<double>(report.correct) / total;
    report.consistency = report.total == 0 ? 0.0 : static_cast<double>(report.consistentCases) / total;

    report.latency = LatencySummary{};
    if (!latencies.empty()) {
        report.latency.meanMicros = std::accumulate(latencies.begin(), latencies.end(), 0.0) / total;
        report.latency.p50Micros = Percentile(latencies, 50.0);
        report.latency.p90Micros = Percentile(latencies, 90.0);
        report.latency.p99Micros = Percentile(latencies, 99.0);
        report.latency.maxMicros = *std::max_element(latencies.begin(), latencies.end());
    }
}

ReportComparison CompareReports(const nlohmann::json& baseline, const ValidationReport& current) {
    if (!baseline.is_object()) {
        throw BaselineError("report must be a JSON object");
    }
    auto metrics = baseline.find("metrics");
    if (metrics == baseline.end() || !metrics->is_object() || !metrics->contains("accuracy") ||
        !metrics->at("accuracy").is_number()) {
        throw BaselineError("report has no numeric metrics.accuracy");
    }
    auto cases = baseline.find("cases");
    if (cases == baseline.end() || !cases->is_array()) {
        throw BaselineError("report has no 'cases' array");
    }

    ReportComparison comparison;
    comparison.baselinePhase = StringMember(baseline, "phase");
    comparison.baselineExtractor = StringMember(baseline, "extractor");
    if (baseline.contains("rule_set")) {
        comparison.baselineRuleSetVersion = StringMember(baseline.at("rule_set"), "version");
    }
    comparison.baselineAccuracy = metrics->at("accuracy").get<double>();
    comparison.accuracyDelta = current.accuracy - comparison.baselineAccuracy;

    std::map<std::string, bool> passedBefore;
    for (std::size_t i = 0; i < cases->size(); ++i) {
        const auto& entry = cases->at(i);
        if (!entry.is_object() || !entry.contains("name") || !entry.at("name").is_string() ||
            !entry.contains("correct") || !entry.at("correct").is_boolean()) {
            throw BaselineError("case " + std::to_string(i) + " lacks a string 'name' or boolean 'correct'");
        }
        passedBefore.emplace(entry.at("name").get<std::string>(), entry.at("correct").get<bool>());
    }

    for (const auto& result : current.cases) {
        auto before = passedBefore.find(result.name);
        if (before == passedBefore.end()) {
            comparison.newCases.push_back(result.name);
        } else if (before->second && !result.correct) {
            comparison.regressions.push_back(result.name);
        } else if (!before->second && result.correct) {
            comparison.fixes.push_back(result.name);
        }
    }

    auto categories = baseline.find("by_category");
    if (categories != baseline.end() && categories->is_object()) {
        for (const auto& item : categories->items()) {
            const auto& tally = item.value();
            if (tally.is_object() && tally.contains("accuracy") && tally.at("accuracy").is_number()) {
                comparison.byCategory[item.key()].baseline = tally.at("accuracy").get<double>();
            }
        }
    }
    for (const auto& [category, tally] : current.byCategory) {
        comparison.byCategory[category].current = tally.accuracy();
    }
    return comparison;
}

nlohmann::json ReportToJson(const ValidationReport& report) {
    nlohmann::json byCategory = nlohmann::json::object();
    for (const auto& [category, tally] : report.byCategory) {
        byCategory[category] = {{"correct", tally.correct}, {"total", tally.total}, {"accuracy", tally.accuracy()}};
    }
    nlohmann::json byField = nlohmann::json::object();
    for (const auto& [field, tally] : report.byField) {
        byField[field] = {{"correct", tally.correct}, {"total", tally.total}, {"accuracy", tally.accuracy()}};
    }

    nlohmann::json cases = nlohmann::json::array();
    for (const auto& result : report.cases) {
        nlohmann::json c = {
            {"index", result.index},
            {"name", result.name},
            {"category", result.category},
            {"correct", result.correct},
            {"failure", FailureKindToString(result.failure)},
            {"expected_storage", TargetsToStrings(result.expectedTargets)},
            {"consistent", result.consistent},
            {"latency_us", result.latencyMicros}
        };
        c["predicted_storage"] = result.predictedTargets
            ? nlohmann::json(TargetsToStrings(*result.predictedTargets)) : nlohmann::json(nullptr);
        if (!result.errorMessage.empty()) c["error"] = result.errorMessage;
        if (result.expectedCriteria) c["expected_criteria"] = CriteriaToJson(*result.expectedCriteria);
        if (result.extractedCriteria) c["extracted_criteria"] = CriteriaToJson(*result.extractedCriteria);
        if (!result.fieldMatches.empty()) c["field_matches"] = result.fieldMatches;
        if (result.matchedRulePriority) {
            c["matched_rule_priority"] = *result.matchedRulePriority;
            c["matched_rule_id"] = result.matchedRuleId;
        }
        if (result.attribution != Attribution::None) c["attribution"] = AttributionToString(result.attribution);
        cases.push_back(std::move(c));
    }

    nlohmann::json document = {
        {"phase", PhaseToString(report.phase)},
        {"rule_set", {{"name", report.ruleSetName}, {"version", report.ruleSetVersion}}},
        {"extractor", report.extractorName},
        {"hit_policy", HitPolicyToString(report.hitPolicy)},
        {"match_mode", MatchModeToString(report.matchMode)},
        {"consistency_runs", report.consistencyRuns},
        {"workers", report.workers},
        {"metrics", {
            {"total", report.total},
            {"correct", report.correct},
            {"accuracy", report.accuracy},
            {"accuracy_misses", report.accuracyMisses},
            {"hard_failures", report.hardFailures},
            {"parse_failures", report.parseFailures},
            {"consistency", report.consistency},
            {"latency_us", {
                {"mean", report.latency.meanMicros},
                {"p50", report.latency.p50Micros},
                {"p90", report.latency.p90Micros},
                {"p99", report.latency.p99Micros},
                {"max", report.latency.maxMicros}
            }}
        }},
        {"by_category", byCategory},
        {"by_field", byField},
        {"attribution", report.attribution},
        {"cases", cases}
    };
    if (report.comparison) document["comparison"] = ComparisonToJson(*report.comparison);
    return document;
}

std::string FormatSummary(const ValidationReport& report, std::optional<double> threshold) {
    std::ostringstream out;
    const std::string rule(72, '=');

    out << rule << "\n";
    out << "PHASE " << PhaseToString(report.phase) << " VALIDATION";
    if (!report.ruleSetVersion.empty()) {
        out << "  rule set " << report.ruleSetName << "@" << report.ruleSetVersion;
    }
    if (!report.extractorName.empty()) out << "  extractor " << report.extractorName;
    out << "\n" << rule << "\n";

    for (const auto& result : report.cases) {
        if (result.correct) continue;
        out << "[FAIL] " << std::setw(3) << (result.index + 1) << " " << result.name
            << " (" << FailureKindToString(result.failure) << ")\n";
        out << "       expected: " << FormatTargets(result.expectedTargets) << "\n";
        if (result.predictedTargets) out << "       got:      " << FormatTargets(*result.predictedTargets) << "\n";
        if (result.extractedCriteria) out << "       criteria: " << FormatCriteria(*result.extractedCriteria) << "\n";
        if (!result.errorMessage.empty()) out << "       error:    " << result.errorMessage << "\n";
        if (result.attribution != Attribution::None) {
            out << "       blame:    " << AttributionToString(result.attribution) << "\n";
        }
    }

    out << "\nOverall\n";
    out << "  Accuracy:       " << Percent(report.accuracy) << " (" << report.correct << "/" << report.total << ")\n";
    out << "  Consistency:    " << Percent(report.consistency) << " over " << report.consistencyRuns << " run(s)\n";
    out << "  Accuracy misses " << report.accuracyMisses << ", hard failures " << report.hardFailures
        << ", parse failures " << report.parseFailures << "\n";
    out << "  Latency:        mean " << Micros(report.latency.meanMicros)
        << ", p50 " << Micros(report.latency.p50Micros)
        << ", p90 " << Micros(report.latency.p90Micros)
        << ", p99 " << Micros(report.latency.p99Micros)
        << ", max " << Micros(report.latency.maxMicros) << "\n";

    out << "\nBy category\n";
    for (const auto& [category, tally] : report.byCategory) {
        out << "  " << std::left << std::setw(14) << category << std::right
            << Percent(tally.accuracy()) << " (" << tally.correct << "/" << tally.total << ")\n";
    }

    if (!report.byField.empty()) {
        out << "\nBy field\n";
        for (const auto& [field, tally] : report.byField) {
            out << "  " << std::left << std::setw(18) << field << std::right
                << Percent(tally.accuracy()) << "\n";
        }
    }

    if (!report.attribution.empty()) {
        out << "\nMiss attribution\n";
        for (const auto& [side, count] : report.attribution) {
            out << "  " << std::left << std::setw(14) << side << std::right << count << "\n";
        }
    }

    if (report.comparison) {
        const ReportComparison& comparison = *report.comparison;
        out << "\nAgainst baseline (" << (comparison.baselinePhase.empty() ? "unknown phase" : comparison.baselinePhase);
        if (!comparison.baselineRuleSetVersion.empty()) out << ", rule set " << comparison.baselineRuleSetVersion;
        if (!comparison.baselineExtractor.empty()) out << ", extractor " << comparison.baselineExtractor;
        out << ")\n";
        out << "  Accuracy:       " << Percent(comparison.baselineAccuracy) << " -> " << Percent(report.accuracy)
            << " (" << SignedPercent(comparison.accuracyDelta) << ")\n";
        if (comparison.accuracyDelta < 0.0) {
            out << "  Gap:            " << Percent(-comparison.accuracyDelta) << " behind baseline\n";
        }
        for (const auto& [category, entry] : comparison.byCategory) {
            out << "  " << std::left << std::setw(14) << category << std::right
                << (entry.baseline ? Percent(*entry.baseline) : "-") << " -> "
                << (entry.current ? Percent(*entry.current) : "-") << "\n";
        }
        out << "  Fixed:          " << JoinNames(comparison.fixes) << "\n";
        out << "  Regressed:      " << JoinNames(comparison.regressions) << "\n";
        if (!comparison.newCases.empty()) {
            out << "  New cases:      " << JoinNames(comparison.newCases) << "\n";
        }
    }

    if (threshold) {
        out << "\n" << std::string(72, '-') << "\n";
        const bool passed = report.meetsThreshold(*threshold);
        out << (passed ? "[PASS] " : "[FAIL] ") << "accuracy " << Percent(report.accuracy)
            << " vs threshold " << Percent(*threshold);
        if (report.phase == ValidationPhase::EngineOnly) {
            out << ", consistency " << Percent(report.consistency) << " (must be 100%)";
        }
        out << "\n";
    }
    out << rule << "\n";
    return out.str();
}

} // namespace storagerouter::application
