/**
 * @file RuleSetAnalyzer.cpp
 * @brief Implementation of RuleSetAnalyzer.
 */

#include "application/RuleSetAnalyzer.hpp"

#include <optional>
#include <set>

namespace storagerouter::application {

using namespace storagerouter::domain;

namespace {

std::optional<std::size_t> FirstMatch(const std::vector<Rule>& rules, const Criteria& criteria) {
    for (std::size_t i = 0; i < rules.size(); ++i) {
        if (rules[i].condition.matches(criteria)) return i;
    }
    return std::nullopt;
}

} // namespace

RuleSetAnalysis RuleSetAnalyzer::Analyze(const std::vector<Rule>& rules) const {
    RuleSetAnalysis analysis;
    if (rules.empty()) {
        analysis.defaultRuleReachable = false;
        return analysis;
    }

    const std::vector<Criteria> domain = EnumerateCriteriaDomain();
    std::vector<bool> reached(rules.size(), false);
    std::vector<std::size_t> winner(domain.size(), rules.size());

    for (std::size_t p = 0; p < domain.size(); ++p) {
        auto first = FirstMatch(rules, domain[p]);
        if (first) {
            reached[*first] = true;
            winner[p] = *first;
        }
    }

    // Only a trailing all-wildcard rule counts as the default.
    const bool trailingDefault = rules.back().condition.isWildcard();
    const std::size_t specificEnd = trailingDefault ? rules.size() - 1 : rules.size();
    for (std::size_t i = 0; i < rules.size(); ++i) {
        if (reached[i]) ++analysis.reachableRules;
    }
    analysis.defaultRuleReachable = trailingDefault && reached.back();

    // A) Shadowing. The default rule is exempt: it only exists for totality.
    for (std::size_t j = 0; j < specificEnd; ++j) {
        if (reached[j]) continue;

        ShadowedRuleWarning warning;
        warning.ruleIndex = j;
        warning.ruleId = rules[j].id;

        for (std::size_t i = 0; i < j; ++i) {
            if (rules[i].condition.subsumes(rules[j].condition)) {
                warning.shadowedBy = {i};
                warning.subsumedBySingleRule = true;
                break;
            }
        }

        if (!warning.subsumedBySingleRule) {
            std::set<std::size_t> responsible;
            for (std::size_t p = 0; p < domain.size(); ++p) {
                if (rules[j].condition.matches(domain[p]) && winner[p] < j) {
                    responsible.insert(winner[p]);
                }
            }
            warning.shadowedBy.assign(responsible.begin(), responsible.end());
        }

        analysis.shadowed.push_back(std::move(warning));
    }

    // B) Partial overlaps between reachable specific rules with different targets.
    for (std::size_t j = 1; j < specificEnd; ++j) {
        if (!reached[j]) continue;
        const Condition& later = rules[j].condition;
        for (std::size_t i = 0; i < j; ++i) {
            const Condition& earlier = rules[i].condition;
            if (!earlier.intersects(later)) continue;
            if (earlier.subsumes(later) || later.subsumes(earlier)) continue;
            if (rules[i].outcome.storageTargets == rules[j].outcome.storageTargets) continue;

            for (const Criteria& point : domain) {
                if (earlier.matches(point) && later.matches(point)) {
                    analysis.overlaps.push_back(RuleOverlap{i, j, point});
                    break;
                }
            }
        }
    }

    return analysis;
}

} // namespace storagerouter::application
