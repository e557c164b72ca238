/**
 * @file Criteria.hpp
 * @brief Value Object describing one classified storage request.
 */

#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace storagerouter::domain {

enum class StorageIntent { Memory, Database, Vector, File };
enum class AccessPattern { Crud, Query, Search, Filter };
enum class DataType { Structured, Numeric, Text, Binary };
enum class SearchIntensity { None, Low, High };

/**
 * @enum CriteriaField
 * @brief Names of the five classification fields, in canonical order.
 */
enum class CriteriaField {
    StorageIntent,
    AccessPattern,
    AnalyticIntent,
    DataType,
    SearchIntensity
};

inline constexpr std::array<CriteriaField, 5> kAllCriteriaFields = {
    CriteriaField::StorageIntent,
    CriteriaField::AccessPattern,
    CriteriaField::AnalyticIntent,
    CriteriaField::DataType,
    CriteriaField::SearchIntensity
};

/**
 * @struct Criteria
 * @brief Classification of a storage request. Every field is mandatory.
 */
struct Criteria {
    StorageIntent storageIntent = StorageIntent::File;
    AccessPattern accessPattern = AccessPattern::Crud;
    bool analyticIntent = false;
    DataType dataType = DataType::Text;
    SearchIntensity searchIntensity = SearchIntensity::None;

    bool operator==(const Criteria& other) const {
        return storageIntent == other.storageIntent &&
               accessPattern == other.accessPattern &&
               analyticIntent == other.analyticIntent &&
               dataType == other.dataType &&
               searchIntensity == other.searchIntensity;
    }
    bool operator!=(const Criteria& other) const { return !(*this == other); }
};

std::string FieldToString(CriteriaField field);
std::optional<CriteriaField> FieldFromString(const std::string& name);

std::string ToString(StorageIntent value);
std::string ToString(AccessPattern value);
std::string ToString(DataType value);
std::string ToString(SearchIntensity value);

std::optional<StorageIntent> StorageIntentFromString(const std::string& value);
std::optional<AccessPattern> AccessPatternFromString(const std::string& value);
std::optional<DataType> DataTypeFromString(const std::string& value);
std::optional<SearchIntensity> SearchIntensityFromString(const std::string& value);
std::optional<bool> BoolFromString(const std::string& value);

/** @brief Declared literals of a field, as they appear in artifacts. */
std::vector<std::string> DeclaredValues(CriteriaField field);

/** @brief The value of one field rendered as its literal ("memory", "true", ...). */
std::string FieldValue(const Criteria& criteria, CriteriaField field);

/**
 * @brief Throws SchemaError if any enum field holds a value outside its declaration.
 */
void ValidateCriteria(const Criteria& criteria);

/**
 * @brief Converts an untyped criteria document into Criteria.
 * @throws SchemaError naming the field for a missing, mistyped or undeclared value.
 */
Criteria ParseCriteria(const nlohmann::json& document);

nlohmann::json CriteriaToJson(const Criteria& criteria);

/** @brief Compact one-line rendering for logs: "memory/crud/false/text/none". */
std::string FormatCriteria(const Criteria& criteria);

/**
 * @brief Enumerates the whole finite Criteria domain in a fixed order.
 */
std::vector<Criteria> EnumerateCriteriaDomain();

} // namespace storagerouter::domain
