/**
 * @file ReportWriter.cpp
 * @brief Implementation of ReportWriter.
 */

#include "infrastructure/ReportWriter.hpp"

#include <chrono>
#include <fstream>
#include <iostream>

namespace storagerouter::infrastructure {

namespace fs = std::filesystem;

bool ReportWriter::WriteAtomic(const fs::path& path, const std::string& content) {
    // filename.<timestamp>.tmp, unique per write
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = path;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    std::error_code ec;
    if (path.has_parent_path() && !fs::exists(path.parent_path())) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            std::cerr << "[ReportWriter] Error creating directories: " << ec.message() << std::endl;
            return false;
        }
    }

    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            std::cerr << "[ReportWriter] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[ReportWriter] Write failed: " << tempPath << std::endl;
            ofs.close();
            fs::remove(tempPath, ec);
            return false;
        }
    }

    fs::rename(tempPath, path, ec);
    if (ec) {
        std::cerr << "[ReportWriter] Rename failed: " << ec.message() << std::endl;
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        return false;
    }
    return true;
}

bool ReportWriter::WriteJson(const application::ValidationReport& report, const fs::path& path) {
    if (!WriteAtomic(path, application::ReportToJson(report).dump(2) + "\n")) {
        return false;
    }
    std::cout << "[ReportWriter] Report written to " << path.string() << std::endl;
    return true;
}

nlohmann::json ReportWriter::ReadReport(const fs::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw application::BaselineError("cannot open " + path.string());
    }
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw application::BaselineError(path.string() + " is not valid JSON: " + e.what());
    }
}

fs::path ReportWriter::DefaultReportPath(const fs::path& reportDir, const application::ValidationReport& report) {
    std::string stem = application::PhaseToString(report.phase);
    if (!report.ruleSetVersion.empty()) {
        stem += "-" + report.ruleSetVersion;
    } else if (!report.extractorName.empty()) {
        stem += "-" + report.extractorName;
    }
    for (char& c : stem) {
        if (c == '/' || c == ':' || c == ' ') c = '_';
    }
    return reportDir / (stem + ".json");
}

} // namespace storagerouter::infrastructure
