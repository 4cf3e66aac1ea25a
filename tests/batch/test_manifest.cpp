/**
 * @file test_manifest.cpp
 * @brief Unit tests for batch manifest mapping
 */

#include <gtest/gtest.h>
#include <drsid/batch/manifest.h>
#include <drsid/common/exceptions.h>
#include <drsid/identity/types.h>

#include <sstream>

using namespace drsid::batch;
using drsid::common::ManifestException;

class ManifestTest : public ::testing::Test {
protected:
    const std::string refSha_ = "4d9670e4c8f3e8b8a6c2d4f9136d7b89e4b9d5e0d2a1c0b9f4c2de0e8c7ac1a0";
    const std::string refUuid_ = "d61939fc-2919-511f-88f6-3d2d8566f5a4";

    std::string record(const std::string& path, const std::string& sha, const std::string& size) const {
        return "{\"path\": \"" + path + "\", \"sha256\": \"" + sha + "\", \"size\": " + size + "}";
    }

    static Json::Value reparse(const std::string& text) {
        Json::Value root;
        Json::CharReaderBuilder reader;
        std::string errs;
        std::istringstream iss(text);
        EXPECT_TRUE(Json::parseFromStream(reader, iss, &root, &errs)) << errs;
        return root;
    }
};

// ============================================================================
// parseManifest
// ============================================================================

TEST_F(ManifestTest, Parse_BareArray) {
    auto records = parseManifest("[" + record("/projectA/raw/reads/R1.fastq.gz", refSha_, "382991274") + "]");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].path, "/projectA/raw/reads/R1.fastq.gz");
    EXPECT_EQ(records[0].sha256, refSha_);
    EXPECT_EQ(records[0].size, 382991274);
    EXPECT_TRUE(records[0].error.empty());
}

TEST_F(ManifestTest, Parse_FilesObject) {
    auto records = parseManifest("{\"files\": [" + record("a", refSha_, "1") + ", " + record("b", refSha_, "2") + "]}");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1].path, "b");
    EXPECT_EQ(records[1].size, 2);
}

TEST_F(ManifestTest, Parse_FilePathAlias) {
    auto records = parseManifest("[{\"file_path\": \"x/y\", \"sha256\": \"" + refSha_ + "\", \"size\": 3}]");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].path, "x/y");
    EXPECT_TRUE(records[0].error.empty());
}

TEST_F(ManifestTest, Parse_EmptyArray) {
    EXPECT_TRUE(parseManifest("[]").empty());
}

TEST_F(ManifestTest, Parse_InvalidJson_Throws) {
    EXPECT_THROW(parseManifest("[{\"path\": "), ManifestException);
}

TEST_F(ManifestTest, Parse_WrongLayout_Throws) {
    EXPECT_THROW(parseManifest("{\"records\": []}"), ManifestException);
    EXPECT_THROW(parseManifest("42"), ManifestException);
}

TEST_F(ManifestTest, Parse_MalformedRecords_KeptWithError) {
    auto records = parseManifest(
        "[\"text\", {\"sha256\": \"" + refSha_ + "\", \"size\": 1},"
        " {\"path\": \"a\", \"size\": 1},"
        " {\"path\": \"a\", \"sha256\": \"" + refSha_ + "\", \"size\": \"10\"}]");

    ASSERT_EQ(records.size(), 4u);
    EXPECT_EQ(records[0].error, "record 0 is not an object");
    EXPECT_EQ(records[1].error, "missing or non-string field 'path'");
    EXPECT_EQ(records[2].error, "missing or non-string field 'sha256'");
    EXPECT_EQ(records[3].error, "missing or non-integer field 'size'");
}

TEST_F(ManifestTest, Load_FromStream) {
    std::istringstream in("[" + record("/a", refSha_, "0") + "]");
    EXPECT_EQ(loadManifest(in).size(), 1u);
}

// ============================================================================
// buildMappingReport
// ============================================================================

TEST_F(ManifestTest, Report_MapsReferenceVector) {
    auto records = parseManifest("[" + record("projectA/raw/reads/R1.fastq.gz", refSha_, "382991274") + "]");
    MappingReport report = buildMappingReport(records);

    EXPECT_EQ(report.total, 1);
    EXPECT_EQ(report.mapped, 1);
    EXPECT_EQ(report.errors, 0);
    EXPECT_TRUE(report.allMapped());

    const MappingEntry& entry = report.mappings[0];
    EXPECT_EQ(entry.status, STATUS_OK);
    EXPECT_EQ(entry.filePath, "projectA/raw/reads/R1.fastq.gz");
    EXPECT_EQ(entry.normalizedPath, "/projectA/raw/reads/R1.fastq.gz");
    EXPECT_EQ(entry.uuid, refUuid_);
}

TEST_F(ManifestTest, Report_InvalidRecordDoesNotAbortBatch) {
    auto records = parseManifest(
        "[" + record("/a", "abc", "1") + ", " +
        record("/b", refSha_, "-1") + ", " +
        record("/projectA/raw/reads/R1.fastq.gz", refSha_, "382991274") + "]");
    MappingReport report = buildMappingReport(records);

    EXPECT_EQ(report.total, 3);
    EXPECT_EQ(report.mapped, 1);
    EXPECT_EQ(report.errors, 2);
    EXPECT_FALSE(report.allMapped());

    EXPECT_EQ(report.mappings[0].status, STATUS_ERROR);
    EXPECT_EQ(report.mappings[0].error, "SHA256 must be 64 characters, got 3");
    EXPECT_EQ(report.mappings[1].error, "Size must be non-negative");
    EXPECT_EQ(report.mappings[2].uuid, refUuid_);
}

TEST_F(ManifestTest, Report_MalformedRecordCountsAsError) {
    MappingReport report = buildMappingReport(parseManifest("[17]"));
    EXPECT_EQ(report.errors, 1);
    EXPECT_EQ(report.mappings[0].error, "record 0 is not an object");
}

// ============================================================================
// JSON output
// ============================================================================

TEST_F(ManifestTest, Json_Header) {
    Json::Value json = mappingReportToJson(buildMappingReport({}));
    EXPECT_EQ(json["namespace"].asString(), drsid::identity::NAMESPACE_UUID_ANCHOR);
    EXPECT_EQ(json["authority"].asString(), "calypr.org");
    EXPECT_EQ(json["total_files"].asInt(), 0);
    EXPECT_TRUE(json["mappings"].isArray());
    EXPECT_EQ(json["mappings"].size(), 0u);
}

TEST_F(ManifestTest, Json_OkAndErrorEntries) {
    auto records = parseManifest("[" + record("/projectA/raw/reads/R1.fastq.gz", refSha_, "382991274") + ", " +
                                 record("/b", refSha_, "-1") + "]");
    Json::Value json = reparse(mappingReportToString(buildMappingReport(records)));

    EXPECT_EQ(json["total_files"].asInt(), 2);
    EXPECT_EQ(json["mapped"].asInt(), 1);
    EXPECT_EQ(json["errors"].asInt(), 1);

    const Json::Value& ok = json["mappings"][0];
    EXPECT_EQ(ok["status"].asString(), "ok");
    EXPECT_EQ(ok["uuid"].asString(), refUuid_);
    EXPECT_EQ(ok["size"].asInt64(), 382991274);
    EXPECT_TRUE(ok["canonical"].isString());
    EXPECT_FALSE(ok.isMember("error"));

    const Json::Value& bad = json["mappings"][1];
    EXPECT_EQ(bad["status"].asString(), "error");
    EXPECT_EQ(bad["error"].asString(), "Size must be non-negative");
    EXPECT_FALSE(bad.isMember("uuid"));
}
