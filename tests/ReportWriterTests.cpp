//
// Created by Matthew Krueger on 10/22/26.
//

#include <sstream>

#include <boost/archive/archive_exception.hpp>
#include <gtest/gtest.h>

#include "pipeline/ReportWriter.hpp"

using featureminer::Cluster;
using featureminer::Report;
using featureminer::ReportWriter;

namespace {

    Report makeReport() {
        Cluster api;
        api.index = 0;
        api.topTerms = {"api", "upgrade"};
        api.issueCount = 2;
        api.voteSum = 8;
        api.issueScore = 1.0;
        api.voteScore = 1.0;
        api.combinedScore = 1.0;

        Cluster darkMode;
        darkMode.index = 1;
        darkMode.topTerms = {"dark mode", "mode"};
        darkMode.issueCount = 1;
        darkMode.voteSum = 0;

        Report report;
        report.issueCount = 3;
        report.clusterCount = 2;
        report.seed = 1234;
        report.iterations = 2;
        report.inertia = 0.5;
        report.converged = true;
        report.clusters = {api, darkMode};
        return report;
    }

}

TEST(ReportWriterTests, WritesOneCsvRowPerClusterInOrder) {
    std::ostringstream output;
    ReportWriter::writeCsv(output, makeReport());

    EXPECT_EQ(output.str(),
              "index,issue_count,vote_sum,issue_score,vote_score,combined_score,top_terms\n"
              "0,2,8,1,1,1,\"api;upgrade\"\n"
              "1,1,0,0,0,0,\"dark mode;mode\"\n");
}

TEST(ReportWriterTests, QuotesAreDoubledInCsvFields) {
    EXPECT_EQ(ReportWriter::quoteCsv("say \"hi\""), "\"say \"\"hi\"\"\"");
    EXPECT_EQ(ReportWriter::joinTerms({}), "");
    EXPECT_EQ(ReportWriter::joinTerms({"a b", "c"}), "a b;c");
}

TEST(ReportWriterTests, XmlReportReadsBack) {
    const Report report = makeReport();

    std::stringstream buffer;
    ReportWriter::writeXml(buffer, report);

    EXPECT_NE(buffer.str().find("<report"), std::string::npos);
    EXPECT_NE(buffer.str().find("dark mode"), std::string::npos);

    const Report readBack = ReportWriter::readXml(buffer);
    EXPECT_EQ(readBack, report);
}

TEST(ReportWriterTests, ReadingSomethingElseThrows) {
    std::istringstream input("index,issue_count\n0,2\n");
    EXPECT_THROW((void) ReportWriter::readXml(input), boost::archive::archive_exception);
}

TEST(ReportWriterTests, UnwritableXmlPathThrows) {
    EXPECT_THROW(ReportWriter::writeXmlFile("/nonexistent/featureminer/report.xml", makeReport()), std::runtime_error);
}
