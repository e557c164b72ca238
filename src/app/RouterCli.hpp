/**
 * @file RouterCli.hpp
 * @brief Command-line front end: evaluate, check-rules, validate.
 */

#pragma once

#include <optional>
#include <string>

#include "application/ValidationReport.hpp"
#include "domain/RuleSet.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace storagerouter::app {

enum ExitCode {
    kExitOk = 0,
    kExitError = 1,       ///< Usage, configuration or rule-set integrity error.
    kExitGateFailed = 2,  ///< Validation ran but missed the gate.
    kExitSchemaError = 3  ///< evaluate rejected its criteria.
};

extern const char* const kUsage;

/**
 * @struct CliArgs
 * @brief Parsed command line. Unset optionals fall back to settings.json.
 */
struct CliArgs {
    std::string command;
    std::string criteria;
    std::string rulesFile;
    std::string phase;
    std::string corpus;
    std::string ruleSetName;
    std::optional<std::string> scope;
    std::string ruleSetVersion;
    std::string extractor = "keyword";
    std::string match;
    std::string report;
    std::string baseline;
    std::string config = "settings.json";
    bool collectAll = false;
    bool strict = false;
    std::optional<double> threshold;
    std::optional<int> runs;
    std::optional<int> workers;
};

/**
 * @brief Parses argv.
 * @throws std::invalid_argument on unknown commands, unknown flags or bad values.
 */
CliArgs ParseCli(int argc, char** argv);

/**
 * @class RouterCli
 * @brief Runs one parsed command and maps its outcome to an exit code.
 */
class RouterCli {
public:
    explicit RouterCli(CliArgs args);

    int Run();

private:
    int runEvaluate();
    int runCheckRules();
    int runValidate();

    domain::RuleSetPtr loadRuleSet(bool strictShadowing, bool logFindings) const;
    bool writeReport(const application::ValidationReport& report) const;

    CliArgs m_args;
    infrastructure::RouterConfig m_config;
};

} // namespace storagerouter::app
