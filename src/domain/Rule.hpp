/**
 * @file Rule.hpp
 * @brief Entities for one row of the decision table, in authored and compiled form.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "domain/Criteria.hpp"
#include "domain/StorageTarget.hpp"

namespace storagerouter::domain {

/** @brief Artifact literal meaning "matches anything". */
inline const std::string kWildcard = "*";

/**
 * @struct RuleDefinition
 * @brief A rule as authored: untyped field literals, validated only at load().
 */
struct RuleDefinition {
    std::string id;
    std::map<std::string, std::string> condition; ///< field name -> literal or "*"; omitted fields are wildcards.
    std::vector<std::string> storageTargets;
    std::vector<std::string> operationHints;
    std::string rationaleTemplate;
};

/**
 * @struct RuleSetDefinition
 * @brief The authored artifact: ordered rules plus version metadata.
 */
struct RuleSetDefinition {
    std::string name;
    std::string version;
    std::string createdAt;
    std::vector<RuleDefinition> rules;
};

/**
 * @struct Condition
 * @brief Compiled condition; std::nullopt is a wildcard.
 */
struct Condition {
    std::optional<StorageIntent> storageIntent;
    std::optional<AccessPattern> accessPattern;
    std::optional<bool> analyticIntent;
    std::optional<DataType> dataType;
    std::optional<SearchIntensity> searchIntensity;

    bool matches(const Criteria& c) const {
        return (!storageIntent || *storageIntent == c.storageIntent) &&
               (!accessPattern || *accessPattern == c.accessPattern) &&
               (!analyticIntent || *analyticIntent == c.analyticIntent) &&
               (!dataType || *dataType == c.dataType) &&
               (!searchIntensity || *searchIntensity == c.searchIntensity);
    }

    bool isWildcard() const {
        return !storageIntent && !accessPattern && !analyticIntent && !dataType && !searchIntensity;
    }

    /**
     * @brief True when every Criteria matching @p later also matches this condition.
     */
    bool subsumes(const Condition& later) const {
        return Covers(storageIntent, later.storageIntent) &&
               Covers(accessPattern, later.accessPattern) &&
               Covers(analyticIntent, later.analyticIntent) &&
               Covers(dataType, later.dataType) &&
               Covers(searchIntensity, later.searchIntensity);
    }

    /** @brief True when some Criteria matches both conditions. */
    bool intersects(const Condition& other) const {
        return Compatible(storageIntent, other.storageIntent) &&
               Compatible(accessPattern, other.accessPattern) &&
               Compatible(analyticIntent, other.analyticIntent) &&
               Compatible(dataType, other.dataType) &&
               Compatible(searchIntensity, other.searchIntensity);
    }

    /** @brief "field=value" pairs for the non-wildcard fields, or "*" when all are wildcards. */
    std::string describe() const {
        std::string out;
        auto add = [&out](const std::string& field, const std::string& value) {
            if (!out.empty()) out += ", ";
            out += field + "=" + value;
        };
        if (storageIntent) add("storage_intent", ToString(*storageIntent));
        if (accessPattern) add("access_pattern", ToString(*accessPattern));
        if (analyticIntent) add("analytic_intent", *analyticIntent ? "true" : "false");
        if (dataType) add("data_type", ToString(*dataType));
        if (searchIntensity) add("search_intensity", ToString(*searchIntensity));
        return out.empty() ? kWildcard : out;
    }

private:
    template <typename T>
    static bool Covers(const std::optional<T>& earlier, const std::optional<T>& later) {
        return !earlier || (later && *earlier == *later);
    }

    template <typename T>
    static bool Compatible(const std::optional<T>& a, const std::optional<T>& b) {
        return !a || !b || *a == *b;
    }
};

/**
 * @struct Outcome
 * @brief What a matching rule decides.
 */
struct Outcome {
    TargetSet storageTargets;                ///< Never empty once loaded.
    std::vector<std::string> operationHints; ///< Opaque to the engine, order preserved.
    std::string rationaleTemplate;
};

/**
 * @struct Rule
 * @brief A compiled, validated row of the decision table.
 */
struct Rule {
    std::size_t priority = 0; ///< Position in the ordered list; lower is evaluated first.
    std::string id;
    Condition condition;
    Outcome outcome;

    /** @brief The id when authored, otherwise "#<priority>". */
    std::string label() const {
        return id.empty() ? "#" + std::to_string(priority) : id;
    }
};

} // namespace storagerouter::domain
