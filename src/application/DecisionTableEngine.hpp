/**
 * @file DecisionTableEngine.hpp
 * @brief Loads decision tables and evaluates Criteria against the published snapshot.
 */

#pragma once

#include <memory>

#include <nlohmann/json.hpp>

#include "domain/Criteria.hpp"
#include "domain/DecisionResult.hpp"
#include "domain/RuleSet.hpp"

namespace storagerouter::application {

/**
 * @struct LoadOptions
 * @brief Controls how strictly load() treats analysis findings.
 */
struct LoadOptions {
    bool strictShadowing = false; ///< Promote ShadowedRuleWarning to RuleSetIntegrityError.
    bool logFindings = true;      ///< Print warnings and overlaps to the standard streams.
};

/**
 * @class DecisionTableEngine
 * @brief Pure evaluator over an immutable RuleSet snapshot.
 *
 * evaluate() takes no locks and performs no I/O; it reads the snapshot pointer
 * once, so a concurrent publish() is observed either entirely or not at all.
 */
class DecisionTableEngine {
public:
    explicit DecisionTableEngine(domain::HitPolicy policy = domain::HitPolicy::First);
    DecisionTableEngine(domain::RuleSetPtr snapshot, domain::HitPolicy policy = domain::HitPolicy::First);

    /**
     * @brief Validates and compiles an authored rule set.
     * @param definition The authored artifact.
     * @param options Strictness and logging.
     * @return A new immutable snapshot.
     * @throws domain::RuleSetIntegrityError for undeclared fields, literals or
     *         targets, empty outcomes, a missing or misplaced default rule, or
     *         (in strict mode) shadowed rules.
     */
    static domain::RuleSetPtr load(const domain::RuleSetDefinition& definition,
                                   const LoadOptions& options = {});

    /** @brief Atomically replaces the snapshot read by subsequent evaluations. */
    void publish(domain::RuleSetPtr snapshot);

    /** @brief The snapshot currently published (may be null before the first publish). */
    domain::RuleSetPtr snapshot() const;

    domain::HitPolicy hitPolicy() const { return m_policy; }

    /**
     * @brief Evaluates typed Criteria against the published snapshot.
     * @throws domain::SchemaError for out-of-range enum values.
     * @throws domain::RuleSetIntegrityError when nothing is published or no rule matches.
     */
    domain::DecisionResult evaluate(const domain::Criteria& criteria) const;

    /**
     * @brief Parses an untyped criteria document, then evaluates it.
     * @throws domain::SchemaError for missing, mistyped or undeclared values.
     */
    domain::DecisionResult evaluateDocument(const nlohmann::json& criteriaDocument) const;

    /** @brief Evaluates against an explicit snapshot. */
    static domain::DecisionResult Evaluate(const domain::RuleSet& ruleSet,
                                           const domain::Criteria& criteria,
                                           domain::HitPolicy policy);

private:
    domain::RuleSetPtr m_snapshot; ///< Only touched through std::atomic_load / std::atomic_store.
    domain::HitPolicy m_policy;
};

/**
 * @brief Expands {field} and {rule_id} placeholders in a rationale template.
 */
std::string RenderRationale(const std::string& rationaleTemplate,
                            const domain::Criteria& criteria,
                            const domain::Rule& rule);

} // namespace storagerouter::application
