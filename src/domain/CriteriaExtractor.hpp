/**
 * @file CriteriaExtractor.hpp
 * @brief Interface for components that classify free-text requests into Criteria.
 */

#pragma once

#include <string>

#include "domain/Criteria.hpp"

namespace storagerouter::domain {

/**
 * @class CriteriaExtractor
 * @brief Pluggable natural-language classifier.
 *
 * Implementations may be probabilistic and may return different Criteria for
 * identical input across calls. Timeouts, retries and cancellation belong to
 * the caller.
 */
class CriteriaExtractor {
public:
    virtual ~CriteriaExtractor() = default;

    /**
     * @brief Classifies a request.
     * @param request Free-text storage request.
     * @return The classified Criteria.
     * @throws ParseError when the request cannot be classified with confidence.
     */
    virtual Criteria extract(const std::string& request) = 0;

    /** @brief Identifier used in validation reports. */
    virtual std::string name() const = 0;

    /** @brief Whether extract() may be called from several threads at once. */
    virtual bool isThreadSafe() const { return false; }
};

} // namespace storagerouter::domain
