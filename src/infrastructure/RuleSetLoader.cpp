/**
 * @file RuleSetLoader.cpp
 * @brief Implementation of RuleSetLoader.
 */

#include "infrastructure/RuleSetLoader.hpp"
#include "domain/DecisionErrors.hpp"

#include <fstream>
#include <iostream>

namespace storagerouter::infrastructure {

using json = nlohmann::json;
using namespace storagerouter::domain;
namespace fs = std::filesystem;

namespace {

std::vector<std::string> StringList(const json& node, const std::string& key, std::size_t index) {
    std::vector<std::string> out;
    if (!node.contains(key)) return out;
    const json& list = node.at(key);
    if (!list.is_array()) {
        throw RuleSetIntegrityError("'" + key + "' must be an array of strings", index);
    }
    for (const auto& item : list) {
        if (!item.is_string()) {
            throw RuleSetIntegrityError("'" + key + "' must contain only strings", index);
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

RuleDefinition ParseRule(const json& node, std::size_t index) {
    if (!node.is_object()) {
        throw RuleSetIntegrityError("rule must be an object", index);
    }

    RuleDefinition rule;
    if (node.contains("id")) {
        if (!node["id"].is_string()) throw RuleSetIntegrityError("'id' must be a string", index);
        rule.id = node["id"].get<std::string>();
    }

    if (node.contains("condition")) {
        const json& condition = node["condition"];
        if (!condition.is_object()) {
            throw RuleSetIntegrityError("'condition' must be an object", index);
        }
        for (auto it = condition.begin(); it != condition.end(); ++it) {
            if (it.value().is_string()) {
                rule.condition[it.key()] = it.value().get<std::string>();
            } else if (it.value().is_boolean()) {
                rule.condition[it.key()] = it.value().get<bool>() ? "true" : "false";
            } else {
                throw RuleSetIntegrityError("condition literal for '" + it.key() +
                                            "' must be a string or boolean", index);
            }
        }
    }

    if (!node.contains("outcome") || !node["outcome"].is_object()) {
        throw RuleSetIntegrityError("rule has no 'outcome' object", index);
    }
    const json& outcome = node["outcome"];
    rule.storageTargets = StringList(outcome, "storage_targets", index);
    rule.operationHints = StringList(outcome, "operation_hints", index);
    if (outcome.contains("rationale_template")) {
        if (!outcome["rationale_template"].is_string()) {
            throw RuleSetIntegrityError("'rationale_template' must be a string", index);
        }
        rule.rationaleTemplate = outcome["rationale_template"].get<std::string>();
    }
    return rule;
}

} // namespace

RuleSetDefinition RuleSetLoader::ParseDefinition(const json& document) {
    if (!document.is_object()) {
        throw RuleSetIntegrityError("rule-set artifact must be a JSON object");
    }

    RuleSetDefinition definition;
    try {
        definition.name = document.value("name", std::string{});
        definition.version = document.value("version", std::string{});
        definition.createdAt = document.value("created_at", std::string{});
    } catch (const json::type_error& e) {
        throw RuleSetIntegrityError(std::string("artifact header fields must be strings: ") + e.what());
    }

    if (!document.contains("rules") || !document["rules"].is_array()) {
        throw RuleSetIntegrityError("rule-set artifact has no 'rules' array");
    }
    const json& rules = document["rules"];
    for (std::size_t i = 0; i < rules.size(); ++i) {
        definition.rules.push_back(ParseRule(rules[i], i));
    }
    return definition;
}

RuleSetDefinition RuleSetLoader::LoadFile(const fs::path& path) {
    if (!fs::exists(path)) {
        throw RuleSetIntegrityError("rule-set artifact not found: " + path.string());
    }

    json document;
    try {
        std::ifstream f(path);
        if (!f.is_open()) {
            throw RuleSetIntegrityError("cannot open rule-set artifact: " + path.string());
        }
        f >> document;
    } catch (const json::exception& e) {
        throw RuleSetIntegrityError("malformed rule-set artifact " + path.string() + ": " + e.what());
    }

    RuleSetDefinition definition = ParseDefinition(document);
    if (definition.name.empty()) {
        definition.name = path.stem().string();
    }
    std::cout << "[RuleSetLoader] Read " << definition.rules.size() << " rules from " << path.string() << std::endl;
    return definition;
}

std::vector<fs::path> RuleSetLoader::CandidatePaths(const fs::path& rulesRoot,
                                                    const std::string& name,
                                                    const std::string& scope) {
    std::vector<fs::path> paths;
    const std::string file = name + ".json";
    if (!scope.empty()) {
        paths.push_back(rulesRoot / "users" / scope / "rules" / file);
    }
    paths.push_back(rulesRoot / "rules" / file);
    return paths;
}

RuleSetDefinition RuleSetLoader::LoadNamed(const fs::path& rulesRoot,
                                           const std::string& name,
                                           const std::string& scope) {
    const auto candidates = CandidatePaths(rulesRoot, name, scope);
    for (const auto& candidate : candidates) {
        if (fs::exists(candidate)) {
            return LoadFile(candidate);
        }
    }

    std::string searched;
    for (const auto& candidate : candidates) {
        if (!searched.empty()) searched += ", ";
        searched += candidate.string();
    }
    throw RuleSetIntegrityError("rule set '" + name + "' not found (searched: " + searched + ")");
}

} // namespace storagerouter::infrastructure
