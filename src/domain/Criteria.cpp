/**
 * @file Criteria.cpp
 * @brief Literal conversions, schema validation and enumeration of Criteria.
 */

#include "domain/Criteria.hpp"
#include "domain/DecisionErrors.hpp"

namespace storagerouter::domain {

namespace {

template <typename Enum, std::size_t N>
std::optional<Enum> FromLiteral(const std::string& value, const std::array<Enum, N>& all) {
    for (Enum candidate : all) {
        if (ToString(candidate) == value) return candidate;
    }
    return std::nullopt;
}

constexpr std::array<StorageIntent, 4> kIntents = {
    StorageIntent::Memory, StorageIntent::Database, StorageIntent::Vector, StorageIntent::File
};
constexpr std::array<AccessPattern, 4> kPatterns = {
    AccessPattern::Crud, AccessPattern::Query, AccessPattern::Search, AccessPattern::Filter
};
constexpr std::array<DataType, 4> kDataTypes = {
    DataType::Structured, DataType::Numeric, DataType::Text, DataType::Binary
};
constexpr std::array<SearchIntensity, 3> kIntensities = {
    SearchIntensity::None, SearchIntensity::Low, SearchIntensity::High
};

template <typename Enum, std::size_t N>
std::vector<std::string> Literals(const std::array<Enum, N>& all) {
    std::vector<std::string> out;
    for (Enum value : all) out.push_back(ToString(value));
    return out;
}

template <typename Enum, std::size_t N>
bool IsDeclared(Enum value, const std::array<Enum, N>& all) {
    for (Enum candidate : all) {
        if (candidate == value) return true;
    }
    return false;
}

std::string RawValue(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    return value.dump();
}

std::string RequireString(const nlohmann::json& document, CriteriaField field) {
    const std::string name = FieldToString(field);
    if (!document.contains(name) || document[name].is_null()) {
        throw SchemaError(name, "", "missing classification");
    }
    const auto& value = document[name];
    if (!value.is_string()) {
        throw SchemaError(name, RawValue(value), "expected a string literal");
    }
    return value.get<std::string>();
}

} // namespace

std::string FieldToString(CriteriaField field) {
    switch (field) {
        case CriteriaField::StorageIntent: return "storage_intent";
        case CriteriaField::AccessPattern: return "access_pattern";
        case CriteriaField::AnalyticIntent: return "analytic_intent";
        case CriteriaField::DataType: return "data_type";
        case CriteriaField::SearchIntensity: return "search_intensity";
    }
    return "unknown";
}

std::optional<CriteriaField> FieldFromString(const std::string& name) {
    for (CriteriaField field : kAllCriteriaFields) {
        if (FieldToString(field) == name) return field;
    }
    return std::nullopt;
}

std::string ToString(StorageIntent value) {
    switch (value) {
        case StorageIntent::Memory: return "memory";
        case StorageIntent::Database: return "database";
        case StorageIntent::Vector: return "vector";
        case StorageIntent::File: return "file";
    }
    return "unknown";
}

std::string ToString(AccessPattern value) {
    switch (value) {
        case AccessPattern::Crud: return "crud";
        case AccessPattern::Query: return "query";
        case AccessPattern::Search: return "search";
        case AccessPattern::Filter: return "filter";
    }
    return "unknown";
}

std::string ToString(DataType value) {
    switch (value) {
        case DataType::Structured: return "structured";
        case DataType::Numeric: return "numeric";
        case DataType::Text: return "text";
        case DataType::Binary: return "binary";
    }
    return "unknown";
}

std::string ToString(SearchIntensity value) {
    switch (value) {
        case SearchIntensity::None: return "none";
        case SearchIntensity::Low: return "low";
        case SearchIntensity::High: return "high";
    }
    return "unknown";
}

std::optional<StorageIntent> StorageIntentFromString(const std::string& value) {
    return FromLiteral(value, kIntents);
}

std::optional<AccessPattern> AccessPatternFromString(const std::string& value) {
    return FromLiteral(value, kPatterns);
}

std::optional<DataType> DataTypeFromString(const std::string& value) {
    return FromLiteral(value, kDataTypes);
}

std::optional<SearchIntensity> SearchIntensityFromString(const std::string& value) {
    return FromLiteral(value, kIntensities);
}

std::optional<bool> BoolFromString(const std::string& value) {
    if (value == "true") return true;
    if (value == "false") return false;
    return std::nullopt;
}

std::vector<std::string> DeclaredValues(CriteriaField field) {
    switch (field) {
        case CriteriaField::StorageIntent: return Literals(kIntents);
        case CriteriaField::AccessPattern: return Literals(kPatterns);
        case CriteriaField::AnalyticIntent: return {"true", "false"};
        case CriteriaField::DataType: return Literals(kDataTypes);
        case CriteriaField::SearchIntensity: return Literals(kIntensities);
    }
    return {};
}

std::string FieldValue(const Criteria& criteria, CriteriaField field) {
    switch (field) {
        case CriteriaField::StorageIntent: return ToString(criteria.storageIntent);
        case CriteriaField::AccessPattern: return ToString(criteria.accessPattern);
        case CriteriaField::AnalyticIntent: return criteria.analyticIntent ? "true" : "false";
        case CriteriaField::DataType: return ToString(criteria.dataType);
        case CriteriaField::SearchIntensity: return ToString(criteria.searchIntensity);
    }
    return "unknown";
}

void ValidateCriteria(const Criteria& criteria) {
    if (!IsDeclared(criteria.storageIntent, kIntents)) {
        throw SchemaError("storage_intent", std::to_string(static_cast<int>(criteria.storageIntent)),
                          "undeclared enum value");
    }
    if (!IsDeclared(criteria.accessPattern, kPatterns)) {
        throw SchemaError("access_pattern", std::to_string(static_cast<int>(criteria.accessPattern)),
                          "undeclared enum value");
    }
    if (!IsDeclared(criteria.dataType, kDataTypes)) {
        throw SchemaError("data_type", std::to_string(static_cast<int>(criteria.dataType)),
                          "undeclared enum value");
    }
    if (!IsDeclared(criteria.searchIntensity, kIntensities)) {
        throw SchemaError("search_intensity", std::to_string(static_cast<int>(criteria.searchIntensity)),
                          "undeclared enum value");
    }
}

Criteria ParseCriteria(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw SchemaError("<document>", RawValue(document), "criteria must be a JSON object");
    }

    Criteria criteria;

    const std::string intent = RequireString(document, CriteriaField::StorageIntent);
    auto parsedIntent = StorageIntentFromString(intent);
    if (!parsedIntent) throw SchemaError("storage_intent", intent, "undeclared literal");
    criteria.storageIntent = *parsedIntent;

    const std::string pattern = RequireString(document, CriteriaField::AccessPattern);
    auto parsedPattern = AccessPatternFromString(pattern);
    if (!parsedPattern) throw SchemaError("access_pattern", pattern, "undeclared literal");
    criteria.accessPattern = *parsedPattern;

    // analytic_intent is a JSON boolean; "true"/"false" strings are tolerated.
    const std::string analyticName = FieldToString(CriteriaField::AnalyticIntent);
    if (!document.contains(analyticName) || document[analyticName].is_null()) {
        throw SchemaError(analyticName, "", "missing classification");
    }
    const auto& analytic = document[analyticName];
    if (analytic.is_boolean()) {
        criteria.analyticIntent = analytic.get<bool>();
    } else if (analytic.is_string() && BoolFromString(analytic.get<std::string>())) {
        criteria.analyticIntent = *BoolFromString(analytic.get<std::string>());
    } else {
        throw SchemaError(analyticName, RawValue(analytic), "expected a boolean");
    }

    const std::string dataType = RequireString(document, CriteriaField::DataType);
    auto parsedType = DataTypeFromString(dataType);
    if (!parsedType) throw SchemaError("data_type", dataType, "undeclared literal");
    criteria.dataType = *parsedType;

    const std::string intensity = RequireString(document, CriteriaField::SearchIntensity);
    auto parsedIntensity = SearchIntensityFromString(intensity);
    if (!parsedIntensity) throw SchemaError("search_intensity", intensity, "undeclared literal");
    criteria.searchIntensity = *parsedIntensity;

    return criteria;
}

nlohmann::json CriteriaToJson(const Criteria& criteria) {
    return {
        {"storage_intent", ToString(criteria.storageIntent)},
        {"access_pattern", ToString(criteria.accessPattern)},
        {"analytic_intent", criteria.analyticIntent},
        {"data_type", ToString(criteria.dataType)},
        {"search_intensity", ToString(criteria.searchIntensity)}
    };
}

std::string FormatCriteria(const Criteria& criteria) {
    std::string out;
    for (CriteriaField field : kAllCriteriaFields) {
        if (!out.empty()) out += "/";
        out += FieldValue(criteria, field);
    }
    return out;
}

std::vector<Criteria> EnumerateCriteriaDomain() {
    std::vector<Criteria> domain;
    domain.reserve(kIntents.size() * kPatterns.size() * 2 * kDataTypes.size() * kIntensities.size());
    for (StorageIntent intent : kIntents) {
        for (AccessPattern pattern : kPatterns) {
            for (bool analytic : {false, true}) {
                for (DataType type : kDataTypes) {
                    for (SearchIntensity intensity : kIntensities) {
                        domain.push_back(Criteria{intent, pattern, analytic, type, intensity});
                    }
                }
            }
        }
    }
    return domain;
}

} // namespace storagerouter::domain
