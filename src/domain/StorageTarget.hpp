/**
 * @file StorageTarget.hpp
 * @brief Value Object naming the backend storage systems a decision can route to.
 */

#pragma once

#include <array>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace storagerouter::domain {

/**
 * @enum StorageTarget
 * @brief Closed set of backend identifiers. Declaration order is the canonical report order.
 */
enum class StorageTarget {
    Memory,          ///< Key-value memory store (preferences, personal facts).
    RelationalStore, ///< Transactional store for CRUD on structured records.
    AnalyticalStore, ///< Columnar store for joins, aggregations, window functions.
    VectorStore,     ///< Similarity search over embedded content.
    FileStore        ///< Flat files: reports, exports, archives.
};

using TargetSet = std::set<StorageTarget>;

inline constexpr std::array<StorageTarget, 5> kAllStorageTargets = {
    StorageTarget::Memory,
    StorageTarget::RelationalStore,
    StorageTarget::AnalyticalStore,
    StorageTarget::VectorStore,
    StorageTarget::FileStore
};

inline std::string TargetToString(StorageTarget target) {
    switch (target) {
        case StorageTarget::Memory: return "memory";
        case StorageTarget::RelationalStore: return "relational_store";
        case StorageTarget::AnalyticalStore: return "analytical_store";
        case StorageTarget::VectorStore: return "vector_store";
        case StorageTarget::FileStore: return "file_store";
    }
    return "unknown";
}

/**
 * @brief Parses a backend identifier as written in rule-set artifacts and corpora.
 * @return std::nullopt for identifiers outside the closed set.
 */
inline std::optional<StorageTarget> TargetFromString(const std::string& value) {
    for (StorageTarget target : kAllStorageTargets) {
        if (TargetToString(target) == value) return target;
    }
    return std::nullopt;
}

inline std::vector<std::string> TargetsToStrings(const TargetSet& targets) {
    std::vector<std::string> out;
    out.reserve(targets.size());
    for (StorageTarget target : targets) {
        out.push_back(TargetToString(target));
    }
    return out;
}

/**
 * @brief Renders a target set as "{a, b}" for logs and summaries.
 */
inline std::string FormatTargets(const TargetSet& targets) {
    std::string out = "{";
    bool first = true;
    for (StorageTarget target : targets) {
        if (!first) out += ", ";
        out += TargetToString(target);
        first = false;
    }
    out += "}";
    return out;
}

} // namespace storagerouter::domain
