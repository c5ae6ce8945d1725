//
// Created by Matthew Krueger on 10/22/26.
//

#include <sstream>

#include <gtest/gtest.h>

#include "shared/Errors.hpp"
#include "shared/Issue.hpp"

using featureminer::Issue;
using featureminer::IssueReader;
using featureminer::MalformedRecordError;

namespace {

    std::vector<Issue> readString(const std::string& text) {
        std::istringstream input(text);
        return IssueReader::read(input);
    }

    size_t failingLine(const std::string& text) {
        try {
            (void) readString(text);
        } catch (const MalformedRecordError& error) {
            return error.getLineNumber();
        }
        ADD_FAILURE() << "no MalformedRecordError for:\n" << text;
        return 0;
    }

}

TEST(IssueReaderTests, ReadsRecordsSkippingHeaderAndBlankLines) {
    const auto issues = readString(
        "id\tvotes\tdescription\n"
        "1\t5\tAdd dark mode\n"
        "\n"
        "   \n"
        "2\t0\r\n"
        "3\t7\tTabs\tinside\r\n");

    ASSERT_EQ(issues.size(), 3u);
    EXPECT_EQ(issues[0].id, 1);
    EXPECT_EQ(issues[0].votes, 5u);
    EXPECT_EQ(issues[0].description, "Add dark mode");
    EXPECT_FALSE(issues[0].cluster.has_value());

    EXPECT_EQ(issues[1].id, 2);
    EXPECT_EQ(issues[1].description, "");

    EXPECT_EQ(issues[2].description, "Tabs\tinside");
}

TEST(IssueReaderTests, EmptyInputHasNoIssues) {
    EXPECT_TRUE(readString("").empty());
    EXPECT_TRUE(readString("ID\tvotes\n\n").empty());
}

TEST(IssueReaderTests, MalformedRecordsNameTheirLine) {
    EXPECT_EQ(failingLine("1\tfive\tbad votes\n"), 1u);
    EXPECT_EQ(failingLine("id\tvotes\n1\t2\tfine\nseven\t2\tbad id\n"), 3u);
    EXPECT_EQ(failingLine("1\t-4\tnegative\n"), 1u);
    EXPECT_EQ(failingLine("1\t2\tfine\njust some text\n"), 2u);
    EXPECT_EQ(failingLine("1\t\tmissing votes\n"), 1u);
}

TEST(IssueReaderTests, DuplicateIdsAreRejected) {
    EXPECT_EQ(failingLine("id\tvotes\tdescription\n4\t1\tfirst\n4\t2\tsecond\n"), 3u);
}

TEST(IssueReaderTests, HeaderIsOnlySkippedBeforeTheFirstRecord) {
    EXPECT_EQ(failingLine("1\t2\tfirst\nid\tvotes\n"), 2u);
}

TEST(IssueReaderTests, ErrorMessageNamesTheLine) {
    try {
        (void) readString("1\t2\tok\n2\tx\tbad\n");
        FAIL() << "expected MalformedRecordError";
    } catch (const MalformedRecordError& error) {
        EXPECT_NE(std::string(error.what()).find("line 2"), std::string::npos);
    }
}

TEST(IssueReaderTests, MissingFileThrows) {
    EXPECT_THROW(IssueReader::readFile("/nonexistent/featureminer/issues.tsv"), std::runtime_error);
}

TEST(IssueReaderTests, MissingDescriptionBecomesEmpty) {
    const Issue issue(7, 1, std::nullopt);
    EXPECT_EQ(issue.description, "");
    EXPECT_FALSE(issue.cluster.has_value());
}
