/**
 * @file DecisionTableEngine.cpp
 * @brief Implementation of DecisionTableEngine.
 */

#include "application/DecisionTableEngine.hpp"
#include "application/RuleSetAnalyzer.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>

namespace storagerouter::application {

using namespace storagerouter::domain;

namespace {

std::string JoinDeclared(CriteriaField field) {
    std::string out;
    for (const auto& literal : DeclaredValues(field)) {
        if (!out.empty()) out += ", ";
        out += literal;
    }
    return out;
}

template <typename T>
T ParseLiteral(const std::optional<T>& parsed, CriteriaField field, const std::string& literal, std::size_t index) {
    if (!parsed) {
        throw RuleSetIntegrityError("undeclared literal '" + literal + "' for field '" + FieldToString(field) +
                                    "' (declared: " + JoinDeclared(field) + ")", index);
    }
    return *parsed;
}

Condition CompileCondition(const std::map<std::string, std::string>& raw, std::size_t index) {
    Condition condition;
    for (const auto& [name, literal] : raw) {
        auto field = FieldFromString(name);
        if (!field) {
            throw RuleSetIntegrityError("unknown condition field '" + name + "'", index);
        }
        if (literal == kWildcard) continue;

        switch (*field) {
            case CriteriaField::StorageIntent:
                condition.storageIntent = ParseLiteral(StorageIntentFromString(literal), *field, literal, index);
                break;
            case CriteriaField::AccessPattern:
                condition.accessPattern = ParseLiteral(AccessPatternFromString(literal), *field, literal, index);
                break;
            case CriteriaField::AnalyticIntent:
                condition.analyticIntent = ParseLiteral(BoolFromString(literal), *field, literal, index);
                break;
            case CriteriaField::DataType:
                condition.dataType = ParseLiteral(DataTypeFromString(literal), *field, literal, index);
                break;
            case CriteriaField::SearchIntensity:
                condition.searchIntensity = ParseLiteral(SearchIntensityFromString(literal), *field, literal, index);
                break;
        }
    }
    return condition;
}

Outcome CompileOutcome(const RuleDefinition& def, std::size_t index) {
    if (def.storageTargets.empty()) {
        throw RuleSetIntegrityError("outcome has no storage_targets", index);
    }
    Outcome outcome;
    for (const auto& raw : def.storageTargets) {
        auto target = TargetFromString(raw);
        if (!target) {
            throw RuleSetIntegrityError("unknown storage target '" + raw + "'", index);
        }
        outcome.storageTargets.insert(*target);
    }
    outcome.operationHints = def.operationHints;
    outcome.rationaleTemplate = def.rationaleTemplate;
    return outcome;
}

// Logs every shadowed rule and appends it to the rejection detail.
std::string WithShadowedRules(std::string detail, const RuleSetAnalysis& analysis) {
    for (const auto& warning : analysis.shadowed) {
        std::cerr << "[DecisionTableEngine] ShadowedRuleWarning: " << warning.describe() << std::endl;
        detail += "; " + warning.describe();
    }
    return detail;
}

void CheckDefaultRule(const std::vector<Rule>& rules, const RuleSetAnalysis& analysis) {
    std::vector<std::size_t> wildcards;
    for (const auto& rule : rules) {
        if (rule.condition.isWildcard()) wildcards.push_back(rule.priority);
    }
    if (wildcards.empty()) {
        throw RuleSetIntegrityError("missing default rule (an all-wildcard condition must close the table)");
    }
    if (wildcards.size() > 1) {
        throw RuleSetIntegrityError(
            WithShadowedRules("more than one all-wildcard rule; only the trailing default rule may match everything",
                              analysis),
            wildcards.front());
    }
    if (wildcards.front() != rules.size() - 1) {
        throw RuleSetIntegrityError(WithShadowedRules("default rule must be last", analysis), wildcards.front());
    }
}

void LogFindings(const RuleSet& ruleSet) {
    const auto& analysis = ruleSet.analysis();
    for (const auto& warning : analysis.shadowed) {
        std::cerr << "[DecisionTableEngine] ShadowedRuleWarning: " << warning.describe() << std::endl;
    }
    if (!analysis.overlaps.empty()) {
        std::cout << "[DecisionTableEngine] " << analysis.overlaps.size()
                  << " partial overlap(s) resolved by priority order." << std::endl;
    }
    if (!analysis.defaultRuleReachable) {
        std::cout << "[DecisionTableEngine] Default rule is unreachable: specific rules cover the whole domain." << std::endl;
    }
}

} // namespace

std::string RenderRationale(const std::string& rationaleTemplate, const Criteria& criteria, const Rule& rule) {
    std::string out;
    out.reserve(rationaleTemplate.size());
    std::size_t pos = 0;
    while (pos < rationaleTemplate.size()) {
        const std::size_t open = rationaleTemplate.find('{', pos);
        if (open == std::string::npos) {
            out.append(rationaleTemplate, pos, std::string::npos);
            break;
        }
        const std::size_t close = rationaleTemplate.find('}', open);
        if (close == std::string::npos) {
            out.append(rationaleTemplate, pos, std::string::npos);
            break;
        }
        out.append(rationaleTemplate, pos, open - pos);

        const std::string key = rationaleTemplate.substr(open + 1, close - open - 1);
        if (key == "rule_id") {
            out += rule.label();
        } else if (auto field = FieldFromString(key)) {
            out += FieldValue(criteria, *field);
        } else {
            // Unknown placeholders are left verbatim.
            out.append(rationaleTemplate, open, close - open + 1);
        }
        pos = close + 1;
    }
    return out;
}

DecisionTableEngine::DecisionTableEngine(HitPolicy policy)
    : m_policy(policy) {}

DecisionTableEngine::DecisionTableEngine(RuleSetPtr snapshot, HitPolicy policy)
    : m_snapshot(std::move(snapshot)), m_policy(policy) {}

RuleSetPtr DecisionTableEngine::load(const RuleSetDefinition& definition, const LoadOptions& options) {
    if (definition.version.empty()) {
        throw RuleSetIntegrityError("rule set '" + definition.name + "' has no version id");
    }
    if (definition.rules.empty()) {
        throw RuleSetIntegrityError("rule set '" + definition.name + "' has no rules");
    }

    std::vector<Rule> rules;
    rules.reserve(definition.rules.size());
    for (std::size_t i = 0; i < definition.rules.size(); ++i) {
        const auto& def = definition.rules[i];
        Rule rule;
        rule.priority = i;
        rule.id = def.id;
        rule.condition = CompileCondition(def.condition, i);
        rule.outcome = CompileOutcome(def, i);
        rules.push_back(std::move(rule));
    }

    RuleSetAnalyzer analyzer;
    RuleSetAnalysis analysis = analyzer.Analyze(rules);

    CheckDefaultRule(rules, analysis);

    if (options.strictShadowing && !analysis.shadowed.empty()) {
        std::string detail = "strict mode: " + std::to_string(analysis.shadowed.size()) + " shadowed rule(s): ";
        for (std::size_t i = 0; i < analysis.shadowed.size(); ++i) {
            if (i > 0) detail += "; ";
            detail += analysis.shadowed[i].describe();
        }
        throw RuleSetIntegrityError(detail, analysis.shadowed.front().ruleIndex);
    }

    RuleSetPtr ruleSet = std::make_shared<RuleSet>(
        definition.name, definition.version, definition.createdAt, std::move(rules), std::move(analysis));

    if (options.logFindings) {
        std::cout << "[DecisionTableEngine] Loaded rule set '" << ruleSet->name() << "' version "
                  << ruleSet->version() << " (" << ruleSet->size() << " rules)." << std::endl;
        LogFindings(*ruleSet);
    }
    return ruleSet;
}

void DecisionTableEngine::publish(RuleSetPtr snapshot) {
    std::atomic_store(&m_snapshot, std::move(snapshot));
}

RuleSetPtr DecisionTableEngine::snapshot() const {
    return std::atomic_load(&m_snapshot);
}

DecisionResult DecisionTableEngine::evaluate(const Criteria& criteria) const {
    RuleSetPtr current = std::atomic_load(&m_snapshot);
    if (!current) {
        throw RuleSetIntegrityError("no rule set published");
    }
    return Evaluate(*current, criteria, m_policy);
}

DecisionResult DecisionTableEngine::evaluateDocument(const nlohmann::json& criteriaDocument) const {
    return evaluate(ParseCriteria(criteriaDocument));
}

DecisionResult DecisionTableEngine::Evaluate(const RuleSet& ruleSet, const Criteria& criteria, HitPolicy policy) {
    ValidateCriteria(criteria);

    DecisionResult result;
    result.ruleSetVersion = ruleSet.version();
    result.hitPolicy = policy;

    const auto& rules = ruleSet.rules();

    if (policy == HitPolicy::First) {
        for (const auto& rule : rules) {
            if (!rule.condition.matches(criteria)) continue;
            result.storageTargets = rule.outcome.storageTargets;
            result.operationHints = rule.outcome.operationHints;
            result.rationale = RenderRationale(rule.outcome.rationaleTemplate, criteria, rule);
            result.matchedRulePriority = rule.priority;
            result.matchedRuleId = rule.id;
            result.matchedRulePriorities = {rule.priority};
            return result;
        }
        throw RuleSetIntegrityError("no rule matched " + FormatCriteria(criteria) + " in rule set version " +
                                    ruleSet.version());
    }

    // CollectAll: union of every match, hints and rationales in rule order.
    for (const auto& rule : rules) {
        if (!rule.condition.matches(criteria)) continue;
        result.storageTargets.insert(rule.outcome.storageTargets.begin(), rule.outcome.storageTargets.end());
        for (const auto& hint : rule.outcome.operationHints) {
            if (std::find(result.operationHints.begin(), result.operationHints.end(), hint) ==
                result.operationHints.end()) {
                result.operationHints.push_back(hint);
            }
        }
        if (!result.rationale.empty()) result.rationale += "; ";
        result.rationale += RenderRationale(rule.outcome.rationaleTemplate, criteria, rule);
        result.matchedRulePriorities.push_back(rule.priority);
    }
    if (result.matchedRulePriorities.empty()) {
        throw RuleSetIntegrityError("no rule matched " + FormatCriteria(criteria) + " in rule set version " +
                                    ruleSet.version());
    }
    return result;
}

} // namespace storagerouter::application
