/**
 * @file CorpusLoader.hpp
 * @brief Reads labeled validation corpora from JSON files.
 */

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "domain/ValidationCase.hpp"

namespace storagerouter::infrastructure {

/**
 * @class CorpusError
 * @brief A corpus file that cannot be used at all (missing, malformed, bad labels).
 *
 * Cases that merely lack the input of some phase load fine; the harness
 * reports those per case.
 */
class CorpusError : public std::runtime_error {
public:
    explicit CorpusError(const std::string& detail)
        : std::runtime_error("CorpusError: " + detail) {}
};

struct Corpus {
    std::string name;
    std::string phase; ///< Phase the corpus was labeled for; informational.
    std::vector<domain::ValidationCase> cases;
};

class CorpusLoader {
public:
    /** @throws CorpusError */
    static Corpus Parse(const nlohmann::json& document);

    /** @throws CorpusError */
    static Corpus LoadFile(const std::filesystem::path& path);
};

} // namespace storagerouter::infrastructure
