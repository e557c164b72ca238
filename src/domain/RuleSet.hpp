/**
 * @file RuleSet.hpp
 * @brief Immutable, versioned snapshot of the decision table.
 */

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "domain/DecisionErrors.hpp"
#include "domain/Rule.hpp"

namespace storagerouter::domain {

/**
 * @struct RuleOverlap
 * @brief Two specific rules whose conditions partially overlap with different targets.
 *
 * Reported for authors only; the earlier rule wins by priority and nothing is resolved.
 */
struct RuleOverlap {
    std::size_t earlier = 0;
    std::size_t later = 0;
    Criteria witness; ///< A Criteria matched by both rules.
};

/**
 * @struct RuleSetAnalysis
 * @brief Load-time findings about reachability and overlap.
 */
struct RuleSetAnalysis {
    std::vector<ShadowedRuleWarning> shadowed;
    std::vector<RuleOverlap> overlaps;
    std::size_t reachableRules = 0;
    bool defaultRuleReachable = true;
};

/**
 * @class RuleSet
 * @brief Ordered rules plus metadata. Never mutated after construction;
 *        a reload builds a new instance.
 *
 * Invariant (established by DecisionTableEngine::load): the last rule is the
 * only all-wildcard rule.
 */
class RuleSet {
public:
    RuleSet(std::string name,
            std::string version,
            std::string createdAt,
            std::vector<Rule> rules,
            RuleSetAnalysis analysis)
        : m_name(std::move(name)),
          m_version(std::move(version)),
          m_createdAt(std::move(createdAt)),
          m_rules(std::move(rules)),
          m_analysis(std::move(analysis)),
          m_loadedAt(std::chrono::system_clock::now()) {}

    RuleSet(const RuleSet&) = delete;
    RuleSet& operator=(const RuleSet&) = delete;

    const std::string& name() const { return m_name; }
    const std::string& version() const { return m_version; }
    const std::string& createdAt() const { return m_createdAt; }
    std::chrono::system_clock::time_point loadedAt() const { return m_loadedAt; }

    const std::vector<Rule>& rules() const { return m_rules; }
    std::size_t size() const { return m_rules.size(); }
    const Rule& defaultRule() const { return m_rules.back(); }

    const RuleSetAnalysis& analysis() const { return m_analysis; }
    const std::vector<ShadowedRuleWarning>& warnings() const { return m_analysis.shadowed; }

private:
    const std::string m_name;
    const std::string m_version;
    const std::string m_createdAt;
    const std::vector<Rule> m_rules;
    const RuleSetAnalysis m_analysis;
    const std::chrono::system_clock::time_point m_loadedAt;
};

using RuleSetPtr = std::shared_ptr<const RuleSet>;

} // namespace storagerouter::domain
