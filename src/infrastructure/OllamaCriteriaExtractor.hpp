/**
 * @file OllamaCriteriaExtractor.hpp
 * @brief CriteriaExtractor backed by a local Ollama model.
 */

#pragma once

#include "domain/CriteriaExtractor.hpp"
#include "infrastructure/OllamaClient.hpp"

#include <string>

namespace storagerouter::infrastructure {

/**
 * @class OllamaCriteriaExtractor
 * @brief Asks the model for the five criteria fields as a JSON object.
 *
 * Sampling is pinned (temperature 0, fixed seed) so repeated runs of the
 * harness can measure consistency. Timeouts and retries stay with the caller.
 */
class OllamaCriteriaExtractor : public domain::CriteriaExtractor {
public:
    OllamaCriteriaExtractor(OllamaClient client, std::string model);

    domain::Criteria extract(const std::string& request) override;
    std::string name() const override;

    /** @brief Few-shot classification instructions sent as the system part. */
    static const std::string& SystemPrompt();

    /**
     * @brief Turns raw model output into Criteria.
     *
     * Accepts a bare JSON object or one wrapped in a markdown code fence.
     * @throws domain::ParseError for non-JSON output or schema violations.
     */
    static domain::Criteria ParseResponse(const std::string& request, const std::string& raw);

    /** @brief Whether the configured model is pulled on the server. */
    bool modelAvailable() const;

private:
    OllamaClient m_client;
    std::string m_model;
};

} // namespace storagerouter::infrastructure
