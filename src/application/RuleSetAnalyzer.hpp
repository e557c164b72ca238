/**
 * @file RuleSetAnalyzer.hpp
 * @brief Load-time reachability and overlap analysis of a compiled decision table.
 */

#pragma once

#include <vector>

#include "domain/Rule.hpp"
#include "domain/RuleSet.hpp"

namespace storagerouter::application {

/**
 * @class RuleSetAnalyzer
 * @brief Finds shadowed rules and partial overlaps.
 *
 * The Criteria domain is finite (384 points), so reachability is computed
 * exactly by replaying every point through first-match order rather than by
 * pairwise subsumption alone. Pairwise subsumption is still reported when a
 * single earlier rule is responsible.
 */
class RuleSetAnalyzer {
public:
    /**
     * @brief Analyzes rules in priority order. A trailing all-wildcard rule is the default
     *        and is never reported as shadowed.
     */
    domain::RuleSetAnalysis Analyze(const std::vector<domain::Rule>& rules) const;
};

} // namespace storagerouter::application
