/**
 * @file ValidationCase.hpp
 * @brief Hand-labeled regression case replayed by the validation harness.
 */

#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "domain/Criteria.hpp"
#include "domain/StorageTarget.hpp"

namespace storagerouter::domain {

/**
 * @struct ValidationCase
 * @brief One labeled input and its expected answer.
 *
 * The structured input is kept untyped so that a malformed case surfaces as a
 * SchemaError inside the run instead of failing the whole corpus at load time.
 */
struct ValidationCase {
    std::string name;
    std::string category;
    std::optional<std::string> notes;

    std::optional<nlohmann::json> criteriaInput; ///< Engine-only phase input.
    std::optional<std::string> requestText;      ///< Extractor and end-to-end input.

    TargetSet expectedTargets;
    std::optional<Criteria> expectedCriteria;    ///< Required by the extractor-only phase.
};

} // namespace storagerouter::domain
