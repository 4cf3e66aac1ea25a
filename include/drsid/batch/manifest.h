/**
 * @file manifest.h
 * @brief Batch identifier mapping over a JSON manifest
 *
 * Manifest layout, either a bare array or wrapped in {"files": [...]}:
 *
 *   [
 *     {"path": "data/R1.fastq.gz", "sha256": "4d96...c1a0", "size": 382991274},
 *     ...
 *   ]
 *
 * "file_path" is accepted as an alias of "path". A record that cannot be
 * read is kept and reported as an error entry instead of aborting the batch.
 */

#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <vector>
#include <json/json.h>

namespace drsid::batch {

/// @brief One manifest entry as read from JSON
struct ManifestRecord {
    std::string path;
    std::string sha256;
    int64_t size = 0;
    std::string error;      ///< Non-empty if the record itself is malformed
};

/// @brief Status values of a mapping entry
inline constexpr const char* STATUS_OK = "ok";
inline constexpr const char* STATUS_ERROR = "error";

/// @brief Result for one manifest record
struct MappingEntry {
    std::string filePath;       ///< Path as given in the manifest
    std::string normalizedPath;
    std::string sha256;
    int64_t size = 0;
    std::string canonical;
    std::string uuid;
    std::string status = STATUS_OK;
    std::string error;
};

/// @brief Result for a whole manifest
struct MappingReport {
    int total = 0;
    int mapped = 0;
    int errors = 0;
    std::vector<MappingEntry> mappings;

    bool allMapped() const {
        return errors == 0;
    }
};

/**
 * @brief Parse manifest JSON text
 * @throws drsid::common::ManifestException on malformed JSON or wrong layout
 */
std::vector<ManifestRecord> parseManifest(const std::string& text);

/**
 * @brief Read and parse a manifest from a stream
 * @throws drsid::common::ManifestException
 */
std::vector<ManifestRecord> loadManifest(std::istream& in);

/**
 * @brief Derive the identifier of every record
 */
MappingReport buildMappingReport(const std::vector<ManifestRecord>& records);

/**
 * @brief Convert a report to JSON (namespace, authority, totals, mappings)
 */
Json::Value mappingReportToJson(const MappingReport& report);

/**
 * @brief Serialize a report with two-space indentation
 */
std::string mappingReportToString(const MappingReport& report);

} // namespace drsid::batch
