/**
 * @file cli_runner.cpp
 * @brief drsid-uuid command execution
 */

#include "cli_runner.h"
#include "drsid/batch/manifest.h"
#include "drsid/common/exceptions.h"
#include "drsid/common/logger.h"
#include "drsid/identity/file_identity.h"
#include "drsid/identity/path_normalizer.h"
#include "drsid/identity/types.h"
#include "drsid/identity/uuid.h"

#include <fstream>
#include <istream>
#include <ostream>
#include <spdlog/spdlog.h>

using drsid::common::ConfigException;
using drsid::common::DrsIdException;
using drsid::common::InputValidationException;
using drsid::common::Logger;
using drsid::common::ManifestException;
using drsid::common::UsageException;

namespace drsid::cli {

namespace {

// Reference inputs shared with the other implementations of the scheme
constexpr const char* REFERENCE_PATH = "/projectA/raw/reads/R1.fastq.gz";
constexpr const char* REFERENCE_SHA256 = "4d9670e4c8f3e8b8a6c2d4f9136d7b89e4b9d5e0d2a1c0b9f4c2de0e8c7ac1a0";
constexpr int64_t REFERENCE_SIZE = 382991274;
constexpr const char* REFERENCE_UUID = "d61939fc-2919-511f-88f6-3d2d8566f5a4";

constexpr const char* SAMPLE_SHA256 = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
constexpr const char* SAMPLE_SHA256_UPPER = "E3B0C44298FC1C149AFBF4C8996FB92427AE41E4649B934CA495991B7852B855";
constexpr int64_t SAMPLE_SIZE = 1024000;

int runSingle(const CliOptions& options, std::ostream& out) {
    identity::FileIdentity id =
        identity::computeFileIdentity(options.path, options.sha256, options.size);
    std::string generated = id.uuid.toString();

    if (options.showCanonical) {
        out << "Canonical DID: " << id.canonical << "\n";
    }
    if (options.showNamespace) {
        out << "Namespace UUID: " << identity::namespaceUuid().toString() << "\n";
    }
    out << "Generated UUID: " << generated << "\n";

    // An empty --verify value counts as not given
    if (!options.verify || options.verify->empty()) {
        return EXIT_OK;
    }

    // Exact match against the lowercase hyphenated form
    if (*options.verify == generated) {
        out << "✓ UUID matches expected value\n";
        return EXIT_OK;
    }

    out << "✗ UUID mismatch!\n"
        << "  Expected: " << *options.verify << "\n"
        << "  Got:      " << generated << "\n";
    return EXIT_FAILED;
}

int runBatch(const CliOptions& options, std::istream& in, std::ostream& out) {
    std::vector<batch::ManifestRecord> records;
    if (options.batchFile == "-") {
        records = batch::loadManifest(in);
    } else {
        std::ifstream file(options.batchFile);
        if (!file.is_open()) {
            throw ManifestException("cannot open '" + options.batchFile + "'");
        }
        records = batch::loadManifest(file);
    }

    batch::MappingReport report = batch::buildMappingReport(records);
    out << batch::mappingReportToString(report) << "\n";
    return report.allMapped() ? EXIT_OK : EXIT_FAILED;
}

int runSelfTest(std::ostream& out) {
    out << "Running self-test...\n";

    int failed = 0;
    for (const auto& test : runSelfTestCases()) {
        if (test.passed()) {
            out << "✓ " << test.name << ": " << test.actual << "\n";
        } else {
            out << "✗ " << test.name << ": expected " << test.expected
                << ", got " << test.actual << "\n";
            failed++;
        }
    }

    if (failed > 0) {
        out << "\n" << failed << " self-test(s) failed\n";
        return EXIT_FAILED;
    }
    out << "\nAll self-tests passed\n";
    return EXIT_OK;
}

} // anonymous namespace

std::vector<SelfTestCase> runSelfTestCases() {
    using identity::computeDeterministicUuid;

    std::vector<SelfTestCase> cases;

    cases.push_back({"namespace anchor",
                     identity::NAMESPACE_UUID_ANCHOR,
                     identity::namespaceUuid().toString()});

    identity::FileIdentity reference =
        identity::computeFileIdentity(REFERENCE_PATH, REFERENCE_SHA256, REFERENCE_SIZE);

    cases.push_back({"reference vector", REFERENCE_UUID, reference.uuid.toString()});

    cases.push_back({"version and variant bits",
                     "v5 rfc4122",
                     "v" + std::to_string(reference.uuid.version()) +
                         (reference.uuid.isRfc4122Variant() ? " rfc4122" : " other")});

    cases.push_back({"path normalization",
                     "/data/sample.fastq",
                     identity::normalizeLogicalPath("data\\\\sample.fastq//")});

    cases.push_back({"relative path equivalence",
                     computeDeterministicUuid("/data/sample.fastq", SAMPLE_SHA256, SAMPLE_SIZE),
                     computeDeterministicUuid("data/sample.fastq", SAMPLE_SHA256, SAMPLE_SIZE)});

    cases.push_back({"case-insensitive digest",
                     computeDeterministicUuid("/data/sample.fastq", SAMPLE_SHA256, SAMPLE_SIZE),
                     computeDeterministicUuid("/data/sample.fastq", SAMPLE_SHA256_UPPER, SAMPLE_SIZE)});

    return cases;
}

int runCommand(const CliOptions& options, std::istream& in, std::ostream& out, std::ostream& /*err*/) {
    switch (options.mode) {
        case Mode::HELP:
            out << helpText("drsid-uuid");
            return EXIT_OK;
        case Mode::VERSION:
            out << "drsid-uuid " << DRSID_VERSION << "\n";
            return EXIT_OK;
        case Mode::SELF_TEST:
            return runSelfTest(out);
        case Mode::BATCH:
            return runBatch(options, in, out);
        case Mode::SINGLE:
            return runSingle(options, out);
    }
    return EXIT_USAGE;
}

int runCli(const std::string& prog, const std::vector<std::string>& args,
           std::istream& in, std::ostream& out, std::ostream& err) {
    try {
        CliOptions options = parseCliOptions(args);

        Logger::initialize(prog, options.logLevel.value_or("warn"));

        return runCommand(options, in, out, err);

    } catch (const UsageException& e) {
        err << "Error: " << e.what() << "\n" << usageLine(prog) << "\n";
        return EXIT_USAGE;
    } catch (const ConfigException& e) {
        err << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    } catch (const InputValidationException& e) {
        spdlog::debug("Rejected input: code={}", e.getCode());
        err << "Error: " << e.getMessage() << "\n";
        return EXIT_FAILED;
    } catch (const DrsIdException& e) {
        err << "Error: " << e.what() << "\n";
        return EXIT_FAILED;
    }
}

} // namespace drsid::cli
