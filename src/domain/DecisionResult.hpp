/**
 * @file DecisionResult.hpp
 * @brief Per-evaluation output of the decision table.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "domain/StorageTarget.hpp"

namespace storagerouter::domain {

/**
 * @enum HitPolicy
 * @brief How matching rules combine.
 */
enum class HitPolicy {
    First,     ///< Production policy: the first matching rule decides.
    CollectAll ///< Experimental: union of every matching rule's targets.
};

inline std::string HitPolicyToString(HitPolicy policy) {
    switch (policy) {
        case HitPolicy::First: return "first";
        case HitPolicy::CollectAll: return "collect-all";
    }
    return "unknown";
}

/**
 * @struct DecisionResult
 * @brief Storage decision for one Criteria. Ephemeral; not persisted by the core.
 */
struct DecisionResult {
    TargetSet storageTargets;
    std::vector<std::string> operationHints;
    std::string rationale;
    std::optional<std::size_t> matchedRulePriority; ///< Empty under CollectAll.
    std::string matchedRuleId;
    std::vector<std::size_t> matchedRulePriorities; ///< Every contributing rule, in order.
    std::string ruleSetVersion;
    HitPolicy hitPolicy = HitPolicy::First;

    bool operator==(const DecisionResult& other) const {
        return storageTargets == other.storageTargets &&
               operationHints == other.operationHints &&
               rationale == other.rationale &&
               matchedRulePriority == other.matchedRulePriority &&
               matchedRuleId == other.matchedRuleId &&
               matchedRulePriorities == other.matchedRulePriorities &&
               ruleSetVersion == other.ruleSetVersion &&
               hitPolicy == other.hitPolicy;
    }
    bool operator!=(const DecisionResult& other) const { return !(*this == other); }
};

inline nlohmann::json DecisionResultToJson(const DecisionResult& result) {
    nlohmann::json j = {
        {"storage_targets", TargetsToStrings(result.storageTargets)},
        {"operation_hints", result.operationHints},
        {"rationale", result.rationale},
        {"matched_rule_id", result.matchedRuleId},
        {"matched_rule_priorities", result.matchedRulePriorities},
        {"rule_set_version", result.ruleSetVersion},
        {"hit_policy", HitPolicyToString(result.hitPolicy)}
    };
    if (result.matchedRulePriority) {
        j["matched_rule_priority"] = *result.matchedRulePriority;
    } else {
        j["matched_rule_priority"] = nullptr;
    }
    return j;
}

} // namespace storagerouter::domain
