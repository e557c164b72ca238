/**
 * @file ValidationHarness.cpp
 * @brief Implementation of ValidationHarness.
 */

#include "application/ValidationHarness.hpp"
#include "application/DecisionTableEngine.hpp"
#include "domain/DecisionErrors.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>
#include <optional>
#include <thread>

namespace storagerouter::application {

using namespace storagerouter::domain;

namespace {

/**
 * @struct Attempt
 * @brief What a single execution of a case produced.
 */
struct Attempt {
    FailureKind error = FailureKind::None; ///< Set when the execution raised.
    std::string message;
    std::optional<Criteria> extracted;
    std::optional<DecisionResult> decision;

    /** @brief Identity of the outcome; equal signatures mean identical behaviour. */
    std::string signature() const {
        nlohmann::json j = {{"error", FailureKindToString(error)}, {"message", message}};
        if (extracted) j["criteria"] = CriteriaToJson(*extracted);
        if (decision) j["decision"] = DecisionResultToJson(*decision);
        return j.dump();
    }
};

/**
 * @brief Runs @p once the configured number of times, timing the first execution.
 * @return The first attempt; @p consistent reports whether all attempts agreed.
 */
Attempt RunRepeated(const std::function<Attempt()>& once, int runs, bool& consistent, double& latencyMicros) {
    const auto start = std::chrono::steady_clock::now();
    Attempt first = once();
    const auto end = std::chrono::steady_clock::now();
    latencyMicros = std::chrono::duration<double, std::micro>(end - start).count();

    consistent = true;
    const std::string reference = first.signature();
    for (int r = 1; r < runs; ++r) {
        if (once().signature() != reference) consistent = false;
    }
    return first;
}

CaseResult StartResult(const ValidationCase& vc, std::size_t index) {
    CaseResult result;
    result.index = index;
    result.name = vc.name;
    result.category = vc.category;
    result.expectedTargets = vc.expectedTargets;
    result.expectedCriteria = vc.expectedCriteria;
    return result;
}

void ApplyAttempt(CaseResult& result, const Attempt& attempt) {
    result.failure = attempt.error;
    result.errorMessage = attempt.message;
    result.extractedCriteria = attempt.extracted;
    if (attempt.decision) {
        result.predictedTargets = attempt.decision->storageTargets;
        result.matchedRulePriority = attempt.decision->matchedRulePriority;
        result.matchedRuleId = attempt.decision->matchedRuleId;
    }
}

void CompareFields(CaseResult& result, const Criteria& expected, const Criteria& actual) {
    for (CriteriaField field : kAllCriteriaFields) {
        result.fieldMatches[FieldToString(field)] = FieldValue(expected, field) == FieldValue(actual, field);
    }
}

/**
 * @brief Calls the extractor, mapping its refusals and failures onto failure kinds.
 * @return False when the attempt already carries an error.
 */
bool ExtractInto(Attempt& attempt, CriteriaExtractor& extractor, const std::string& request) {
    try {
        attempt.extracted = extractor.extract(request);
        ValidateCriteria(*attempt.extracted);
        return true;
    } catch (const ParseError& e) {
        attempt.error = FailureKind::ParseError;
        attempt.message = e.what();
    } catch (const SchemaError& e) {
        attempt.extracted.reset();
        attempt.error = FailureKind::SchemaError;
        attempt.message = e.what();
    } catch (const std::exception& e) {
        // Transport and model failures are refusals to classify.
        attempt.error = FailureKind::ParseError;
        attempt.message = std::string("extractor failure: ") + e.what();
    }
    return false;
}

void EvaluateInto(Attempt& attempt, const RuleSet& ruleSet, const Criteria& criteria, HitPolicy policy) {
    try {
        attempt.decision = DecisionTableEngine::Evaluate(ruleSet, criteria, policy);
    } catch (const SchemaError& e) {
        attempt.error = FailureKind::SchemaError;
        attempt.message = e.what();
    } catch (const RuleSetIntegrityError& e) {
        attempt.error = FailureKind::RuleSetIntegrity;
        attempt.message = e.what();
    }
}

Attempt CaseDefect(const std::string& message) {
    Attempt attempt;
    attempt.error = FailureKind::CaseDefect;
    attempt.message = message;
    return attempt;
}

// Result for a case whose execution raised outside the domain error types.
CaseResult DefectiveCase(const ValidationCase& vc, std::size_t index, const std::string& what) {
    std::cerr << "[ValidationHarness] Case " << index << " (" << vc.name << ") raised: " << what << std::endl;
    CaseResult result = StartResult(vc, index);
    result.failure = FailureKind::CaseDefect;
    result.errorMessage = "case raised: " + what;
    return result;
}

void RequireRuleSet(const RuleSetPtr& ruleSet) {
    if (!ruleSet) {
        throw RuleSetIntegrityError("validation run started without a loaded rule set");
    }
}

} // namespace

ValidationHarness::ValidationHarness(HarnessOptions options)
    : m_options(options) {
    m_options.consistencyRuns = std::max(1, m_options.consistencyRuns);
    m_options.workers = std::max(1, m_options.workers);
}

std::vector<CaseResult> ValidationHarness::runCases(const std::vector<ValidationCase>& cases,
                                                    const CaseRunner& runner,
                                                    int workers) const {
    const std::size_t workerCount = std::min<std::size_t>(static_cast<std::size_t>(workers),
                                                          std::max<std::size_t>(cases.size(), 1));
    std::vector<std::vector<CaseResult>> partials(workerCount);
    std::vector<std::exception_ptr> failures(workerCount);

    auto work = [&](std::size_t worker) {
        try {
            for (std::size_t i = worker; i < cases.size(); i += workerCount) {
                try {
                    partials[worker].push_back(runner(cases[i], i));
                } catch (const std::exception& e) {
                    partials[worker].push_back(DefectiveCase(cases[i], i, e.what()));
                }
            }
        } catch (...) {
            failures[worker] = std::current_exception();
        }
    };

    if (workerCount == 1) {
        work(0);
    } else {
        std::vector<std::thread> threads;
        threads.reserve(workerCount);
        for (std::size_t w = 0; w < workerCount; ++w) {
            threads.emplace_back(work, w);
        }
        for (auto& t : threads) {
            if (t.joinable()) t.join();
        }
    }

    for (const auto& failure : failures) {
        if (failure) std::rethrow_exception(failure);
    }

    // Merge only after every worker has finished.
    std::vector<CaseResult> merged;
    merged.reserve(cases.size());
    for (auto& partial : partials) {
        for (auto& result : partial) merged.push_back(std::move(result));
    }
    std::sort(merged.begin(), merged.end(),
              [](const CaseResult& a, const CaseResult& b) { return a.index < b.index; });
    return merged;
}

ValidationReport ValidationHarness::runPhaseEngineOnly(const std::vector<ValidationCase>& cases,
                                                       const RuleSetPtr& ruleSet) const {
    RequireRuleSet(ruleSet);
    const RuleSet& rules = *ruleSet;
    const HarnessOptions options = m_options;

    auto runner = [&rules, options](const ValidationCase& vc, std::size_t index) {
        CaseResult result = StartResult(vc, index);

        auto once = [&]() {
            if (!vc.criteriaInput) return CaseDefect("case has no structured criteria input");
            Attempt attempt;
            Criteria criteria;
            try {
                criteria = ParseCriteria(*vc.criteriaInput);
            } catch (const SchemaError& e) {
                attempt.error = FailureKind::SchemaError;
                attempt.message = e.what();
                return attempt;
            }
            EvaluateInto(attempt, rules, criteria, options.hitPolicy);
            return attempt;
        };

        Attempt first = RunRepeated(once, options.consistencyRuns, result.consistent, result.latencyMicros);
        ApplyAttempt(result, first);
        if (result.failure == FailureKind::None) {
            result.correct = TargetsMatch(*result.predictedTargets, vc.expectedTargets, options.matchMode);
            if (!result.correct) result.failure = FailureKind::AccuracyMiss;
        }
        return result;
    };

    ValidationReport report;
    report.phase = ValidationPhase::EngineOnly;
    report.ruleSetName = rules.name();
    report.ruleSetVersion = rules.version();
    report.hitPolicy = options.hitPolicy;
    report.matchMode = options.matchMode;
    report.consistencyRuns = options.consistencyRuns;
    report.workers = options.workers;
    report.cases = runCases(cases, runner, options.workers);
    ComputeAggregates(report);
    return report;
}

ValidationReport ValidationHarness::runPhaseExtractorOnly(const std::vector<ValidationCase>& cases,
                                                          CriteriaExtractor& extractor) const {
    const HarnessOptions options = m_options;
    int workers = options.workers;
    if (workers > 1 && !extractor.isThreadSafe()) {
        std::cout << "[ValidationHarness] Extractor '" << extractor.name()
                  << "' is not thread-safe; running on one worker." << std::endl;
        workers = 1;
    }

    auto runner = [&extractor, options](const ValidationCase& vc, std::size_t index) {
        CaseResult result = StartResult(vc, index);

        auto once = [&]() {
            if (!vc.requestText) return CaseDefect("case has no request text");
            if (!vc.expectedCriteria) return CaseDefect("case has no expected criteria");
            Attempt attempt;
            ExtractInto(attempt, extractor, *vc.requestText);
            return attempt;
        };

        Attempt first = RunRepeated(once, options.consistencyRuns, result.consistent, result.latencyMicros);
        ApplyAttempt(result, first);
        if (result.failure == FailureKind::None) {
            CompareFields(result, *vc.expectedCriteria, *result.extractedCriteria);
            result.correct = *result.extractedCriteria == *vc.expectedCriteria;
            if (!result.correct) result.failure = FailureKind::AccuracyMiss;
        }
        return result;
    };

    ValidationReport report;
    report.phase = ValidationPhase::ExtractorOnly;
    report.extractorName = extractor.name();
    report.matchMode = options.matchMode;
    report.consistencyRuns = options.consistencyRuns;
    report.workers = workers;
    report.cases = runCases(cases, runner, workers);
    ComputeAggregates(report);
    return report;
}

ValidationReport ValidationHarness::runPhaseEndToEnd(const std::vector<ValidationCase>& cases,
                                                     CriteriaExtractor& extractor,
                                                     const RuleSetPtr& ruleSet) const {
    RequireRuleSet(ruleSet);
    const RuleSet& rules = *ruleSet;
    const HarnessOptions options = m_options;
    int workers = options.workers;
    if (workers > 1 && !extractor.isThreadSafe()) {
        std::cout << "[ValidationHarness] Extractor '" << extractor.name()
                  << "' is not thread-safe; running on one worker." << std::endl;
        workers = 1;
    }

    auto runner = [&extractor, &rules, options](const ValidationCase& vc, std::size_t index) {
        CaseResult result = StartResult(vc, index);

        auto once = [&]() {
            if (!vc.requestText) return CaseDefect("case has no request text");
            Attempt attempt;
            if (ExtractInto(attempt, extractor, *vc.requestText)) {
                EvaluateInto(attempt, rules, *attempt.extracted, options.hitPolicy);
            }
            return attempt;
        };

        Attempt first = RunRepeated(once, options.consistencyRuns, result.consistent, result.latencyMicros);
        ApplyAttempt(result, first);

        if (vc.expectedCriteria && result.extractedCriteria) {
            CompareFields(result, *vc.expectedCriteria, *result.extractedCriteria);
        }

        switch (result.failure) {
            case FailureKind::None:
                result.correct = TargetsMatch(*result.predictedTargets, vc.expectedTargets, options.matchMode);
                if (!result.correct) {
                    result.failure = FailureKind::AccuracyMiss;
                    if (!vc.expectedCriteria) {
                        result.attribution = Attribution::Unattributed;
                    } else if (*result.extractedCriteria != *vc.expectedCriteria) {
                        result.attribution = Attribution::Extractor;
                    } else {
                        result.attribution = Attribution::RuleSet;
                    }
                }
                break;
            case FailureKind::ParseError:
            case FailureKind::SchemaError:
                result.attribution = Attribution::Extractor;
                break;
            case FailureKind::RuleSetIntegrity:
                result.attribution = Attribution::RuleSet;
                break;
            case FailureKind::AccuracyMiss:
            case FailureKind::CaseDefect:
                break;
        }
        return result;
    };

    ValidationReport report;
    report.phase = ValidationPhase::EndToEnd;
    report.ruleSetName = rules.name();
    report.ruleSetVersion = rules.version();
    report.extractorName = extractor.name();
    report.hitPolicy = options.hitPolicy;
    report.matchMode = options.matchMode;
    report.consistencyRuns = options.consistencyRuns;
    report.workers = workers;
    report.cases = runCases(cases, runner, workers);
    ComputeAggregates(report);
    return report;
}

} // namespace storagerouter::application
