/**
 * @file KeywordCriteriaExtractor.hpp
 * @brief Deterministic CriteriaExtractor built on keyword cues.
 */

#pragma once

#include "domain/CriteriaExtractor.hpp"

#include <string>

namespace storagerouter::infrastructure {

/**
 * @class KeywordCriteriaExtractor
 * @brief Classifies requests by substring cues; no model, no network.
 *
 * Serves as the offline baseline the model-backed extractor is compared
 * against. Stateless, so safe to share between harness workers.
 */
class KeywordCriteriaExtractor : public domain::CriteriaExtractor {
public:
    /** @throws domain::ParseError for empty input or input with no storage cue. */
    domain::Criteria extract(const std::string& request) override;

    std::string name() const override { return "keyword"; }
    bool isThreadSafe() const override { return true; }
};

} // namespace storagerouter::infrastructure
