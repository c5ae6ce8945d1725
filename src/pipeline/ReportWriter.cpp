//
// Created by Matthew Krueger on 10/21/26.
//

#include "ReportWriter.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/archive/xml_iarchive.hpp>
#include <boost/archive/xml_oarchive.hpp>

#include "../shared/Instrumentation.hpp"

namespace featureminer {

    Report ReportWriter::buildReport(const Pipeline& pipeline, std::vector<Cluster> rankedClusters) {
        const auto& summary = pipeline.getTrainingSummary();

        Report report;
        report.issueCount = summary.issueCount;
        report.clusterCount = pipeline.getModel().numClusters();
        report.seed = pipeline.getConfig().clustering.seed;
        report.iterations = summary.iterations;
        report.inertia = summary.inertia;
        report.converged = summary.converged;
        report.clusters = std::move(rankedClusters);
        return report;
    }

    void ReportWriter::writeXml(std::ostream& output, const Report& report) {
        PROFILE_FUNCTION();

        // the archive writes its closing tags when it goes out of scope
        {
            boost::archive::xml_oarchive archive(output);
            archive << boost::serialization::make_nvp("report", report);
        }
        output.flush();
    }

    Report ReportWriter::readXml(std::istream& input) {
        Report report;
        boost::archive::xml_iarchive archive(input);
        archive >> boost::serialization::make_nvp("report", report);
        return report;
    }

    void ReportWriter::writeXmlFile(const std::string& path, const Report& report) {
        std::ofstream file(path, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("Could not open XML output file: " + path);
        }
        writeXml(file, report);
        if (!file.good()) {
            throw std::runtime_error("Failed writing XML output file: " + path);
        }
    }

    std::string ReportWriter::joinTerms(const std::vector<std::string>& terms) {
        return boost::algorithm::join(terms, ";");
    }

    std::string ReportWriter::quoteCsv(const std::string& field) {
        return '"' + boost::algorithm::replace_all_copy(field, "\"", "\"\"") + '"';
    }

}
