//
// Created by Matthew Krueger on 10/21/26.
//

#ifndef FEATUREMINER_REPORTWRITER_HPP
#define FEATUREMINER_REPORTWRITER_HPP

#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "Pipeline.hpp"
#include "Report.hpp"

namespace featureminer {

    class ReportWriter {
    public:
        /**
         * @brief Collects the ranked clusters and the training summary of a pipeline.
         */
        static Report buildReport(const Pipeline& pipeline, std::vector<Cluster> rankedClusters);

        /**
         * @brief Writes one CSV row per cluster, in report order, after a header row.
         *
         * Works with anything that takes values through operator<<, so a DualStream can be passed in.
         */
        template<typename Stream>
        static void writeCsv(Stream& output, const Report& report) {
            output << "index,issue_count,vote_sum,issue_score,vote_score,combined_score,top_terms\n";
            for (const auto& cluster : report.clusters) {
                output << cluster.index << ','
                       << cluster.issueCount << ','
                       << cluster.voteSum << ','
                       << cluster.issueScore << ','
                       << cluster.voteScore << ','
                       << cluster.combinedScore << ','
                       << quoteCsv(joinTerms(cluster.topTerms)) << '\n';
            }
        }

        /**
         * @brief Writes the report as a Boost.Serialization XML archive.
         */
        static void writeXml(std::ostream& output, const Report& report);

        /**
         * @brief Reads a report written by writeXml.
         * @throws boost::archive::archive_exception if the document is not a report archive
         */
        static Report readXml(std::istream& input);

        static void writeXmlFile(const std::string& path, const Report& report);

        static std::string joinTerms(const std::vector<std::string>& terms);
        static std::string quoteCsv(const std::string& field);
    };

}

#endif //FEATUREMINER_REPORTWRITER_HPP
