/**
 * @file cli_options.cpp
 * @brief Command-line parsing for drsid-uuid
 */

#include "cli_options.h"
#include "drsid/common/exceptions.h"
#include "drsid/common/logger.h"
#include "drsid/utils/string_utils.h"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <sstream>
#include <stdexcept>

using drsid::common::ConfigException;
using drsid::common::UsageException;

namespace drsid::cli {

namespace {

bool isDigits(const std::string& str, size_t from) {
    return from < str.length() &&
           std::all_of(str.begin() + static_cast<std::ptrdiff_t>(from), str.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

// "-1" is a negative size, "-" is stdin; everything else led by '-' is an option
bool isOptionToken(const std::string& arg) {
    return arg.length() > 1 && arg[0] == '-' && !isDigits(arg, 1);
}

std::string joinNames(const std::vector<std::string>& names) {
    std::string result;
    for (size_t i = 0; i < names.size(); i++) {
        if (i > 0) result += ", ";
        result += names[i];
    }
    return result;
}

} // anonymous namespace

int64_t parseSize(const std::string& text) {
    size_t digitsFrom = (!text.empty() && (text[0] == '+' || text[0] == '-')) ? 1 : 0;
    if (!isDigits(text, digitsFrom)) {
        throw UsageException("argument size: invalid int value: '" + text + "'");
    }

    try {
        return static_cast<int64_t>(std::stoll(text));
    } catch (const std::out_of_range&) {
        throw UsageException("argument size: value out of range: '" + text + "'");
    }
}

CliOptions parseCliOptions(const std::vector<std::string>& args) {
    CliOptions options;
    if (args.empty()) {
        options.mode = Mode::SELF_TEST;
        return options;
    }

    std::vector<std::string> positional;
    bool batch = false;
    bool selfTest = false;
    bool help = false;
    bool version = false;
    bool endOfOptions = false;

    auto requireValue = [&args](size_t& i, const std::string& flag) -> std::string {
        if (i + 1 >= args.size() || isOptionToken(args[i + 1])) {
            throw UsageException("argument " + flag + ": expected one argument");
        }
        return args[++i];
    };

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (endOfOptions || !isOptionToken(arg)) {
            positional.push_back(arg);
        } else if (arg == "--") {
            endOfOptions = true;
        } else if (arg == "--show-canonical") {
            options.showCanonical = true;
        } else if (arg == "--show-namespace") {
            options.showNamespace = true;
        } else if (arg == "--verify") {
            options.verify = requireValue(i, arg);
        } else if (utils::startsWith(arg, "--verify=")) {
            options.verify = arg.substr(std::string("--verify=").length());
        } else if (arg == "--batch") {
            batch = true;
            options.batchFile = requireValue(i, arg);
        } else if (arg == "--self-test") {
            selfTest = true;
        } else if (arg == "--log-level") {
            options.logLevel = requireValue(i, arg);
        } else if (arg == "--help" || arg == "-h") {
            help = true;
        } else if (arg == "--version") {
            version = true;
        } else {
            throw UsageException("unrecognized argument: " + arg);
        }
    }

    if (options.logLevel && !common::Logger::parseLevel(*options.logLevel)) {
        throw ConfigException("unknown log level '" + *options.logLevel + "'");
    }

    if (help) {
        options.mode = Mode::HELP;
        return options;
    }
    if (version) {
        options.mode = Mode::VERSION;
        return options;
    }

    if (selfTest) {
        if (batch || !positional.empty()) {
            throw UsageException("--self-test does not take other arguments");
        }
        options.mode = Mode::SELF_TEST;
        return options;
    }

    if (batch) {
        if (!positional.empty()) {
            throw UsageException("--batch does not accept positional arguments");
        }
        options.mode = Mode::BATCH;
        return options;
    }

    static const std::vector<std::string> names = {"path", "sha256", "size"};
    if (positional.size() < names.size()) {
        std::vector<std::string> missing(names.begin() + static_cast<std::ptrdiff_t>(positional.size()),
                                         names.end());
        throw UsageException("the following arguments are required: " + joinNames(missing));
    }
    if (positional.size() > names.size()) {
        std::vector<std::string> extra(positional.begin() + static_cast<std::ptrdiff_t>(names.size()),
                                       positional.end());
        throw UsageException("unrecognized arguments: " + joinNames(extra));
    }

    options.mode = Mode::SINGLE;
    options.path = positional[0];
    options.sha256 = positional[1];
    options.size = parseSize(positional[2]);
    return options;
}

std::string usageLine(const std::string& prog) {
    return "usage: " + prog + " [options] <path> <sha256> <size>";
}

std::string helpText(const std::string& prog) {
    std::ostringstream oss;
    oss << usageLine(prog) << "\n"
        << "       " << prog << " --batch <manifest.json|->\n"
        << "       " << prog << " --self-test\n"
        << "\n"
        << "Generate deterministic UUIDs for Git-DRS files\n"
        << "\n"
        << "positional arguments:\n"
        << "  path               File path (will be normalized)\n"
        << "  sha256             SHA256 hash (64-character hex string)\n"
        << "  size               File size in bytes\n"
        << "\n"
        << "options:\n"
        << "  --show-canonical   Show canonical DID string\n"
        << "  --show-namespace   Show namespace UUID\n"
        << "  --verify UUID      Verify against expected UUID (exact, lowercase form)\n"
        << "  --batch FILE       Map every record of a JSON manifest ('-' reads stdin)\n"
        << "  --self-test        Run the built-in reference vectors\n"
        << "  --log-level LEVEL  Diagnostics on stderr: trace, debug, info, warn, error, critical, off\n"
        << "  --version          Show version and exit\n"
        << "  -h, --help         Show this help and exit\n"
        << "\n"
        << "Example: " << prog << " /data/file.bam abc123...def 1024000\n";
    return oss.str();
}

} // namespace drsid::cli
