#pragma once

/**
 * @file cli_runner.h
 * @brief drsid-uuid command execution, decoupled from process streams
 */

#include "cli_options.h"
#include <iosfwd>
#include <string>
#include <vector>

namespace drsid::cli {

/// @brief One built-in reference check
struct SelfTestCase {
    std::string name;
    std::string expected;
    std::string actual;

    bool passed() const {
        return expected == actual;
    }
};

/**
 * @brief Evaluate the built-in reference vectors
 */
std::vector<SelfTestCase> runSelfTestCases();

/**
 * @brief Execute parsed options
 * @param options Parsed command line
 * @param in Input for "--batch -"
 * @param out Result stream (stdout)
 * @param err Error stream (stderr)
 * @return Process exit code
 */
int runCommand(const CliOptions& options, std::istream& in, std::ostream& out, std::ostream& err);

/**
 * @brief Parse args, configure logging, execute, and map errors to exit codes
 * @param prog Program name for usage text
 * @param args Arguments without argv[0]
 */
int runCli(const std::string& prog, const std::vector<std::string>& args,
           std::istream& in, std::ostream& out, std::ostream& err);

} // namespace drsid::cli
