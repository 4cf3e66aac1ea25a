#pragma once

/**
 * @file cli_options.h
 * @brief Command-line parsing for drsid-uuid
 *
 * Usage:
 *   drsid-uuid [options] <path> <sha256> <size>
 *   drsid-uuid --batch <manifest.json|->
 *   drsid-uuid --self-test
 *
 * A token of the form -<digits> is a positional value (negative size),
 * never an option, so "-1" reaches the validator and fails there.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#ifndef DRSID_VERSION
#define DRSID_VERSION "1.0.0"
#endif

namespace drsid::cli {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;   // validation failure, verify mismatch, batch errors
constexpr int EXIT_USAGE = 2;    // malformed command line or configuration

enum class Mode {
    SINGLE,
    BATCH,
    SELF_TEST,
    HELP,
    VERSION
};

struct CliOptions {
    Mode mode = Mode::SINGLE;

    std::string path;
    std::string sha256;
    int64_t size = 0;

    bool showCanonical = false;
    bool showNamespace = false;
    std::optional<std::string> verify;

    std::string batchFile;                  // "-" reads stdin
    std::optional<std::string> logLevel;
};

/**
 * @brief Parse command-line arguments (program name excluded)
 * @throws drsid::common::UsageException on malformed arguments
 * @throws drsid::common::ConfigException on an unknown --log-level value
 */
CliOptions parseCliOptions(const std::vector<std::string>& args);

/**
 * @brief Parse a base-10 size argument ("+5" and "-1" accepted, "1e3" not)
 * @throws drsid::common::UsageException
 */
int64_t parseSize(const std::string& text);

std::string usageLine(const std::string& prog);
std::string helpText(const std::string& prog);

} // namespace drsid::cli
