/**
 * @file manifest.cpp
 * @brief Batch identifier mapping over a JSON manifest
 */

#include "drsid/batch/manifest.h"
#include "drsid/common/exceptions.h"
#include "drsid/identity/file_identity.h"
#include "drsid/identity/types.h"
#include "drsid/identity/uuid.h"

#include <sstream>
#include <spdlog/spdlog.h>

namespace drsid::batch {

namespace {

ManifestRecord readRecord(const Json::Value& item, Json::ArrayIndex index) {
    ManifestRecord record;

    if (!item.isObject()) {
        record.error = "record " + std::to_string(index) + " is not an object";
        return record;
    }

    const Json::Value& path = item.isMember("path") ? item["path"] : item["file_path"];
    if (!path.isString()) {
        record.error = "missing or non-string field 'path'";
        return record;
    }
    record.path = path.asString();

    const Json::Value& sha256 = item["sha256"];
    if (!sha256.isString()) {
        record.error = "missing or non-string field 'sha256'";
        return record;
    }
    record.sha256 = sha256.asString();

    const Json::Value& size = item["size"];
    if (!size.isInt64()) {
        record.error = "missing or non-integer field 'size'";
        return record;
    }
    record.size = size.asInt64();

    return record;
}

MappingEntry errorEntry(const ManifestRecord& record, const std::string& message) {
    MappingEntry entry;
    entry.filePath = record.path;
    entry.sha256 = record.sha256;
    entry.size = record.size;
    entry.status = STATUS_ERROR;
    entry.error = message;
    return entry;
}

} // anonymous namespace

std::vector<ManifestRecord> parseManifest(const std::string& text) {
    std::istringstream iss(text);
    return loadManifest(iss);
}

std::vector<ManifestRecord> loadManifest(std::istream& in) {
    Json::Value root;
    Json::CharReaderBuilder reader;
    std::string errs;

    if (!Json::parseFromStream(reader, in, &root, &errs)) {
        throw common::ManifestException("invalid JSON: " + errs);
    }

    const Json::Value& files = root.isObject() ? root["files"] : root;
    if (!files.isArray()) {
        throw common::ManifestException("expected an array of records or an object with a 'files' array");
    }

    std::vector<ManifestRecord> records;
    records.reserve(files.size());
    for (Json::ArrayIndex i = 0; i < files.size(); ++i) {
        records.push_back(readRecord(files[i], i));
    }

    spdlog::debug("[Manifest] Loaded {} records", records.size());
    return records;
}

MappingReport buildMappingReport(const std::vector<ManifestRecord>& records) {
    MappingReport report;
    report.total = static_cast<int>(records.size());
    report.mappings.reserve(records.size());

    for (const auto& record : records) {
        if (!record.error.empty()) {
            report.mappings.push_back(errorEntry(record, record.error));
            report.errors++;
            continue;
        }

        try {
            identity::FileIdentity id =
                identity::computeFileIdentity(record.path, record.sha256, record.size);

            MappingEntry entry;
            entry.filePath = record.path;
            entry.normalizedPath = id.normalizedPath;
            entry.sha256 = id.digest;
            entry.size = id.size;
            entry.canonical = id.canonical;
            entry.uuid = id.uuid.toString();
            report.mappings.push_back(std::move(entry));
            report.mapped++;
        } catch (const common::InputValidationException& e) {
            spdlog::warn("[Manifest] Skipping '{}': {}", record.path, e.getMessage());
            report.mappings.push_back(errorEntry(record, e.getMessage()));
            report.errors++;
        }
    }

    spdlog::info("[Manifest] Mapped {}/{} records ({} errors)",
                 report.mapped, report.total, report.errors);
    return report;
}

Json::Value mappingReportToJson(const MappingReport& report) {
    Json::Value root;
    root["namespace"] = identity::namespaceUuid().toString();
    root["authority"] = identity::AUTHORITY;
    root["total_files"] = report.total;
    root["mapped"] = report.mapped;
    root["errors"] = report.errors;

    Json::Value mappings(Json::arrayValue);
    for (const auto& entry : report.mappings) {
        Json::Value item;
        item["file_path"] = entry.filePath;
        item["sha256"] = entry.sha256;
        item["size"] = static_cast<Json::Int64>(entry.size);
        item["status"] = entry.status;
        if (entry.status == STATUS_OK) {
            item["normalized_path"] = entry.normalizedPath;
            item["canonical"] = entry.canonical;
            item["uuid"] = entry.uuid;
        } else {
            item["error"] = entry.error;
        }
        mappings.append(item);
    }
    root["mappings"] = mappings;

    return root;
}

std::string mappingReportToString(const MappingReport& report) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    return Json::writeString(writer, mappingReportToJson(report));
}

} // namespace drsid::batch
