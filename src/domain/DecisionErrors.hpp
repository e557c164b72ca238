/**
 * @file DecisionErrors.hpp
 * @brief Error taxonomy shared by the engine, the extractors and the harness.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace storagerouter::domain {

/**
 * @class SchemaError
 * @brief Criteria carry an undeclared, missing or mistyped field value.
 *
 * Raised immediately to the caller; never retried.
 */
class SchemaError : public std::runtime_error {
public:
    SchemaError(std::string field, std::string value, const std::string& detail)
        : std::runtime_error("SchemaError: field '" + field + "' = '" + value + "': " + detail),
          m_field(std::move(field)),
          m_value(std::move(value)) {}

    const std::string& field() const { return m_field; }
    const std::string& value() const { return m_value; }

private:
    std::string m_field;
    std::string m_value;
};

/**
 * @class RuleSetIntegrityError
 * @brief The rule set is defective: malformed artifact, missing default rule,
 *        no snapshot published, or evaluation fell through every rule.
 */
class RuleSetIntegrityError : public std::runtime_error {
public:
    explicit RuleSetIntegrityError(const std::string& detail,
                                   std::optional<std::size_t> ruleIndex = std::nullopt)
        : std::runtime_error(Compose(detail, ruleIndex)),
          m_ruleIndex(ruleIndex) {}

    /** @brief Index of the offending rule, when the defect is local to one rule. */
    std::optional<std::size_t> ruleIndex() const { return m_ruleIndex; }

private:
    static std::string Compose(const std::string& detail, std::optional<std::size_t> ruleIndex) {
        if (ruleIndex) {
            return "RuleSetIntegrityError: rule " + std::to_string(*ruleIndex) + ": " + detail;
        }
        return "RuleSetIntegrityError: " + detail;
    }

    std::optional<std::size_t> m_ruleIndex;
};

/**
 * @class ParseError
 * @brief An extractor could not confidently classify a request.
 */
class ParseError : public std::runtime_error {
public:
    ParseError(std::string request, const std::string& reason)
        : std::runtime_error("ParseError: " + reason),
          m_request(std::move(request)) {}

    const std::string& request() const { return m_request; }

private:
    std::string m_request;
};

/**
 * @struct ShadowedRuleWarning
 * @brief A rule that no Criteria can reach because earlier rules cover it.
 *
 * Non-fatal unless the rule set is loaded in strict mode.
 */
struct ShadowedRuleWarning {
    std::size_t ruleIndex = 0;
    std::string ruleId;
    std::vector<std::size_t> shadowedBy; ///< Earlier rule indices responsible.
    bool subsumedBySingleRule = false;   ///< True when shadowedBy holds one rule that fully subsumes this one.

    std::string describe() const {
        std::string out = "rule " + std::to_string(ruleIndex);
        if (!ruleId.empty()) out += " (" + ruleId + ")";
        out += subsumedBySingleRule ? " is subsumed by rule " : " is jointly covered by rules ";
        for (std::size_t i = 0; i < shadowedBy.size(); ++i) {
            if (i > 0) out += ", ";
            out += std::to_string(shadowedBy[i]);
        }
        return out;
    }
};

} // namespace storagerouter::domain
