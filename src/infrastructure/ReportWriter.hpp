/**
 * @file ReportWriter.hpp
 * @brief Writes validation reports to disk atomically and reads them back as baselines.
 */

#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "application/ValidationReport.hpp"

namespace storagerouter::infrastructure {

class ReportWriter {
public:
    /**
     * @brief Writes @p content to @p path via a temp file and a rename.
     * @return False when any step failed; the reason is logged.
     */
    static bool WriteAtomic(const std::filesystem::path& path, const std::string& content);

    /**
     * @brief Reads a report written by WriteJson.
     * @throws application::BaselineError when the file is missing or not JSON.
     */
    static nlohmann::json ReadReport(const std::filesystem::path& path);

    /** @brief Writes the JSON form of @p report. */
    static bool WriteJson(const application::ValidationReport& report, const std::filesystem::path& path);

    /**
     * @brief Default report location inside @p reportDir:
     *        <phase>-<rule set version or extractor>.json
     */
    static std::filesystem::path DefaultReportPath(const std::filesystem::path& reportDir,
                                                   const application::ValidationReport& report);
};

} // namespace storagerouter::infrastructure
