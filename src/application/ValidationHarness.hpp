/**
 * @file ValidationHarness.hpp
 * @brief Offline replay of labeled corpora through the engine, the extractor, or both.
 */

#pragma once

#include <functional>
#include <vector>

#include "application/ValidationReport.hpp"
#include "domain/CriteriaExtractor.hpp"
#include "domain/DecisionResult.hpp"
#include "domain/RuleSet.hpp"
#include "domain/ValidationCase.hpp"

namespace storagerouter::application {

/**
 * @struct HarnessOptions
 * @brief Run parameters shared by every phase.
 */
struct HarnessOptions {
    int consistencyRuns = 3;                              ///< Executions per case; 1 disables the check.
    int workers = 1;                                      ///< Threads; cases are independent.
    MatchMode matchMode = MatchMode::Exact;
    domain::HitPolicy hitPolicy = domain::HitPolicy::First;
};

/**
 * @class ValidationHarness
 * @brief Scores each component in isolation and the composed pipeline.
 *
 * A case that raises never aborts the run: schema and integrity errors are
 * recorded as hard failures, extractor refusals as parse failures, and both
 * are kept apart from accuracy misses.
 */
class ValidationHarness {
public:
    explicit ValidationHarness(HarnessOptions options = {});

    /**
     * @brief Feeds hand-labeled Criteria directly into the engine.
     * @throws domain::RuleSetIntegrityError if @p ruleSet is null.
     */
    ValidationReport runPhaseEngineOnly(const std::vector<domain::ValidationCase>& cases,
                                        const domain::RuleSetPtr& ruleSet) const;

    /**
     * @brief Scores the extractor's field-level accuracy against labeled Criteria.
     */
    ValidationReport runPhaseExtractorOnly(const std::vector<domain::ValidationCase>& cases,
                                           domain::CriteriaExtractor& extractor) const;

    /**
     * @brief Chains extractor and engine, attributing each miss to one side when possible.
     * @throws domain::RuleSetIntegrityError if @p ruleSet is null.
     */
    ValidationReport runPhaseEndToEnd(const std::vector<domain::ValidationCase>& cases,
                                      domain::CriteriaExtractor& extractor,
                                      const domain::RuleSetPtr& ruleSet) const;

    const HarnessOptions& options() const { return m_options; }

private:
    using CaseRunner = std::function<CaseResult(const domain::ValidationCase&, std::size_t)>;

    std::vector<CaseResult> runCases(const std::vector<domain::ValidationCase>& cases,
                                     const CaseRunner& runner,
                                     int workers) const;

    HarnessOptions m_options;
};

} // namespace storagerouter::application
