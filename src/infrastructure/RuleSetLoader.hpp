/**
 * @file RuleSetLoader.hpp
 * @brief Reads rule-set artifacts (JSON) into RuleSetDefinition values.
 *
 * A named rule set is looked up under a rules root, with per-scope overrides
 * taking precedence over the shared artifact:
 *   <root>/users/<scope>/rules/<name>.json
 *   <root>/rules/<name>.json
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "domain/Rule.hpp"

namespace storagerouter::infrastructure {

class RuleSetLoader {
public:
    /**
     * @brief Converts an artifact document into a definition.
     * @throws domain::RuleSetIntegrityError on any structural defect.
     */
    static domain::RuleSetDefinition ParseDefinition(const nlohmann::json& document);

    /**
     * @brief Reads and parses one artifact file.
     * @throws domain::RuleSetIntegrityError if the file is missing, unreadable or malformed.
     */
    static domain::RuleSetDefinition LoadFile(const std::filesystem::path& path);

    /** @brief Paths searched for @p name, most specific first. */
    static std::vector<std::filesystem::path> CandidatePaths(const std::filesystem::path& rulesRoot,
                                                             const std::string& name,
                                                             const std::string& scope);

    /**
     * @brief Resolves @p name under @p rulesRoot (honouring @p scope) and loads it.
     * @throws domain::RuleSetIntegrityError naming every searched path when none exists.
     */
    static domain::RuleSetDefinition LoadNamed(const std::filesystem::path& rulesRoot,
                                               const std::string& name,
                                               const std::string& scope = "");
};

} // namespace storagerouter::infrastructure
