/**
 * @file TestSupport.hpp
 * @brief Fixtures shared by the test executables.
 */

#pragma once

#include <map>
#include <string>
#include <vector>

#include "domain/Rule.hpp"

#ifndef STORAGEROUTER_DATA_DIR
#define STORAGEROUTER_DATA_DIR "data"
#endif

namespace storagerouter::test {

inline const std::string kDataDir = STORAGEROUTER_DATA_DIR;
inline const std::string kReferenceRules = kDataDir + "/rules/storage-selection.json";
inline const std::string kPinnedCorpus = kDataDir + "/corpus/engine_pinned.json";

inline domain::RuleDefinition MakeRule(std::string id,
                                       std::map<std::string, std::string> condition,
                                       std::vector<std::string> targets,
                                       std::string rationale = "") {
    domain::RuleDefinition rule;
    rule.id = std::move(id);
    rule.condition = std::move(condition);
    rule.storageTargets = std::move(targets);
    rule.rationaleTemplate = std::move(rationale);
    return rule;
}

inline domain::RuleDefinition MakeDefault(std::vector<std::string> targets = {"file_store"}) {
    return MakeRule("default", {}, std::move(targets), "fallback ({rule_id})");
}

inline domain::RuleSetDefinition MakeDefinition(std::vector<domain::RuleDefinition> rules,
                                                std::string version = "test-1") {
    domain::RuleSetDefinition definition;
    definition.name = "test-rules";
    definition.version = std::move(version);
    definition.rules = std::move(rules);
    return definition;
}

} // namespace storagerouter::test
