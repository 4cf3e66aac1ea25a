/**
 * @file test_path_normalizer.cpp
 * @brief Unit tests for logical path canonicalization
 */

#include <gtest/gtest.h>
#include <drsid/identity/path_normalizer.h>

#include <vector>

using namespace drsid::identity;

class PathNormalizerTest : public ::testing::Test {
protected:
    const std::vector<std::string> samples_ = {
        "", "/", "//", "a", "/a", "a/", "data/sample.fastq", "data\\\\sample.fastq//",
        "C:\\data\\x", "./a", "../a", "a/./b", "a\\/b", "/a//b///c////", "a b/c"
    };
};

// ============================================================================
// Examples
// ============================================================================

TEST_F(PathNormalizerTest, Relative_GetsLeadingSlash) {
    EXPECT_EQ(normalizeLogicalPath("data/sample.fastq"), "/data/sample.fastq");
}

TEST_F(PathNormalizerTest, Backslashes_AndTrailingSlashes) {
    EXPECT_EQ(normalizeLogicalPath("data\\\\sample.fastq//"), "/data/sample.fastq");
}

TEST_F(PathNormalizerTest, RepeatedSeparators_Collapsed) {
    EXPECT_EQ(normalizeLogicalPath("/a//b///c"), "/a/b/c");
}

TEST_F(PathNormalizerTest, Root_Unchanged) {
    EXPECT_EQ(normalizeLogicalPath("/"), "/");
}

TEST_F(PathNormalizerTest, Empty_BecomesRoot) {
    EXPECT_EQ(normalizeLogicalPath(""), "/");
}

TEST_F(PathNormalizerTest, OnlySeparators_BecomesRoot) {
    EXPECT_EQ(normalizeLogicalPath("///"), "/");
    EXPECT_EQ(normalizeLogicalPath("\\\\"), "/");
}

TEST_F(PathNormalizerTest, MixedSeparators_Collapsed) {
    EXPECT_EQ(normalizeLogicalPath("a\\/b"), "/a/b");
}

TEST_F(PathNormalizerTest, WindowsDrive_KeptAsSegment) {
    EXPECT_EQ(normalizeLogicalPath("C:\\data\\x"), "/C:/data/x");
}

// ============================================================================
// Dot segments are not interpreted
// ============================================================================

TEST_F(PathNormalizerTest, DotSegment_Preserved) {
    EXPECT_EQ(normalizeLogicalPath("./a"), "/./a");
    EXPECT_EQ(normalizeLogicalPath("a/./b"), "/a/./b");
}

TEST_F(PathNormalizerTest, DotDotSegment_Preserved) {
    EXPECT_EQ(normalizeLogicalPath("../a"), "/../a");
}

TEST_F(PathNormalizerTest, Case_Preserved) {
    EXPECT_EQ(normalizeLogicalPath("Data/Sample.FASTQ"), "/Data/Sample.FASTQ");
}

// ============================================================================
// Output properties
// ============================================================================

TEST_F(PathNormalizerTest, Output_NoBackslashOrDoubleSlash) {
    for (const auto& sample : samples_) {
        std::string out = normalizeLogicalPath(sample);
        EXPECT_EQ(out.find('\\'), std::string::npos) << "input: " << sample;
        EXPECT_EQ(out.find("//"), std::string::npos) << "input: " << sample;
    }
}

TEST_F(PathNormalizerTest, Output_LeadingSlashAndNoTrailingSlash) {
    for (const auto& sample : samples_) {
        std::string out = normalizeLogicalPath(sample);
        ASSERT_FALSE(out.empty()) << "input: " << sample;
        EXPECT_EQ(out.front(), '/') << "input: " << sample;
        if (out != "/") {
            EXPECT_NE(out.back(), '/') << "input: " << sample;
        }
    }
}

TEST_F(PathNormalizerTest, Idempotent) {
    for (const auto& sample : samples_) {
        std::string once = normalizeLogicalPath(sample);
        EXPECT_EQ(normalizeLogicalPath(once), once) << "input: " << sample;
    }
}

TEST_F(PathNormalizerTest, RelativeAndAbsolute_Equivalent) {
    EXPECT_EQ(normalizeLogicalPath("x/y"), normalizeLogicalPath("/x/y"));
}
