#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/program_options.hpp>

#include "pipeline/Pipeline.hpp"
#include "pipeline/ReportWriter.hpp"
#include "ranking/Aggregator.hpp"
#include "shared/DualOutputStream.hpp"
#include "shared/Instrumentation.hpp"
#include "shared/Issue.hpp"
#include "shared/Logging.hpp"
#include "shared/Timer.hpp"

namespace po = boost::program_options;

namespace {

    std::vector<featureminer::Issue> readIssues(const std::string& input) {
        if (input == "-") {
            return featureminer::IssueReader::read(std::cin);
        }
        return featureminer::IssueReader::readFile(input);
    }

    void writeAssignments(const std::string& path, const std::vector<featureminer::Issue>& issues) {
        std::ofstream file(path, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("Could not open assignments output file: " + path);
        }
        file << "id,cluster\n";
        for (const auto& issue : issues) {
            file << issue.id << ',' << issue.cluster.value() << '\n';
        }
        if (!file.good()) {
            throw std::runtime_error("Failed writing assignments output file: " + path);
        }
    }

}

int main(int argc, char **argv) {
    featureminer::Pipeline::Config config;
    std::string input;
    std::optional<std::string> output;
    std::optional<std::string> xmlOutput;
    std::optional<std::string> assignmentsOutput;
    std::optional<std::string> profileOutput;
    bool verbose = false;
    bool debug = false;

    try {
        po::options_description desc("Allowed options");
        desc.add_options()
                ("help", "produce help message")
                ("config", po::value<std::string>(),
                 "INI style file with any of the options below. Command line values take precedence")
                ("input", po::value<std::string>(&input)->required(),
                 "Tab separated issue file (id, votes, description). Use - for standard input")
                ("output", po::value<std::string>(),
                 "Also write the ranked CSV to this file")
                ("xml-output", po::value<std::string>(),
                 "Write the ranked report as an XML archive to this file")
                ("assignments-output", po::value<std::string>(),
                 "Write the cluster of every issue as id,cluster CSV to this file")
                ("profile-output", po::value<std::string>(),
                 "Write a Chrome trace to this file. Needs a build with BUILD_WITH_PROFILING")
                ("verbose", po::bool_switch(&verbose), "Log progress and phase timings")
                ("debug", po::bool_switch(&debug), "Log everything, including debug output")
                ("clusters", po::value<size_t>(&config.clustering.numClusters)->default_value(50),
                 "Number of clusters (K)")
                ("max-iterations", po::value<size_t>(&config.clustering.maxIterations)->default_value(100),
                 "Maximum number of iterations per run")
                ("num-inits", po::value<size_t>(&config.clustering.numInits)->default_value(1),
                 "Number of k-means runs; the one with the lowest inertia is kept")
                ("seed", po::value<uint64_t>(&config.clustering.seed)->default_value(1234),
                 "Seed for k-means++ seeding; the seed of every run is derived from it")
                ("convergence-threshold",
                 po::value<double>(&config.clustering.convergenceThreshold)->default_value(0.0),
                 "Also stop once no centroid moves farther than this. 0 disables the check")
                ("num-threads", po::value<size_t>(&config.clustering.numThreads)->default_value(1),
                 "Number of threads to use with openmp")
                ("ngram-min", po::value<size_t>(&config.vectorizer.ngramMin)->default_value(1),
                 "Smallest n-gram length")
                ("ngram-max", po::value<size_t>(&config.vectorizer.ngramMax)->default_value(2),
                 "Largest n-gram length")
                ("extra-stop-words",
                 po::value<std::vector<std::string>>(&config.vectorizer.extraStopWords)
                         ->multitoken()->composing()
                         ->default_value(std::vector<std::string>{"feature", "issue"}, "feature issue"),
                 "Words excluded on top of the English stop list")
                ("min-df", po::value<size_t>(&config.vectorizer.minDocumentFrequency)->default_value(1),
                 "Drop terms found in fewer documents than this")
                ("max-df", po::value<double>(&config.vectorizer.maxDocumentFrequency)->default_value(1.0),
                 "Drop terms found in more than this fraction of documents")
                ("max-features", po::value<size_t>(&config.vectorizer.maxFeatures)->default_value(0),
                 "Keep only this many of the most frequent terms. 0 keeps all")
                ("smooth-idf", po::value<bool>(&config.vectorizer.smoothIdf)->default_value(true),
                 "Add one to document frequencies as if an extra document held every term")
                ("normalize", po::value<bool>(&config.vectorizer.normalize)->default_value(true),
                 "Scale every document vector to unit length")
                ("top-terms", po::value<size_t>(&config.topTermsCount)->default_value(10),
                 "Number of terms used to label a cluster")
                ("issue-multiplier", po::value<double>(&config.scoring.issueMultiplier)->default_value(1.0),
                 "Weight of the issue count in the combined score, in [0, 1]")
                ("vote-multiplier", po::value<double>(&config.scoring.voteMultiplier)->default_value(1.0),
                 "Weight of the vote sum in the combined score, in [0, 1]");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.contains("help")) {
            std::cout << desc << '\n';
            return 0;
        }

        // values already stored from the command line win over the file
        if (vm.contains("config")) {
            const auto& configPath = vm["config"].as<std::string>();
            std::ifstream configFile(configPath);
            if (!configFile.is_open()) {
                std::cerr << "Could not open config file: " << configPath << std::endl;
                return 1;
            }
            po::store(po::parse_config_file(configFile, desc), vm);
        }

        po::notify(vm);

        if (vm.contains("output")) output = vm["output"].as<std::string>();
        if (vm.contains("xml-output")) xmlOutput = vm["xml-output"].as<std::string>();
        if (vm.contains("assignments-output")) assignmentsOutput = vm["assignments-output"].as<std::string>();
        if (vm.contains("profile-output")) profileOutput = vm["profile-output"].as<std::string>();
    } catch (const po::error &e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    config.vectorizer.numThreads = config.clustering.numThreads;

    if (debug) {
        featureminer::logging::setVerbosity(featureminer::logging::Level::Debug);
    } else if (verbose) {
        featureminer::logging::setVerbosity(featureminer::logging::Level::Info);
    }

    try {
        if (profileOutput.has_value()) {
            if constexpr (PROFILING_ENABLED) {
                std::unique_ptr<instrumentation::Writer> writer =
                        std::make_unique<instrumentation::TraceFileWriter>(*profileOutput, 1000);
                PROFILE_BEGIN_SESSION(std::move(writer));
            } else {
                LOG_WARNING("--profile-output ignored: built without BUILD_WITH_PROFILING");
            }
        }

        auto readTime = timer::time([&input] {
            return readIssues(input);
        });
        const std::vector<featureminer::Issue>& issues = readTime.functionResult;
        LOG_INFO("Read " << issues.size() << " issues in " << readTime.getTimeSecondsDouble() << " s");

        auto trainTime = timer::time([&issues, &config] {
            return featureminer::Pipeline::train(issues, config);
        });
        const featureminer::Pipeline& pipeline = trainTime.functionResult;
        LOG_INFO("Vocabulary of " << pipeline.getVectorizer().getVocabulary().size() << " terms, trained in "
                 << trainTime.getTimeSecondsDouble() << " s");

        auto aggregateTime = timer::time([&pipeline, &issues] {
            return pipeline.aggregate(issues);
        });
        const featureminer::AggregationResult& aggregation = aggregateTime.functionResult;
        LOG_INFO("Assigned issues in " << aggregateTime.getTimeSecondsDouble() << " s");

        featureminer::Report report = featureminer::ReportWriter::buildReport(pipeline, pipeline.rank(aggregation));

        // Creating my DualStream
        DualStream ds(std::cout, output);
        featureminer::ReportWriter::writeCsv(ds, report);
        ds << std::flush;
        if (!ds.good()) {
            throw std::runtime_error("Failed writing the ranked report");
        }

        if (xmlOutput.has_value()) {
            featureminer::ReportWriter::writeXmlFile(*xmlOutput, report);
            LOG_INFO("Wrote XML report to " << *xmlOutput);
        }

        if (assignmentsOutput.has_value()) {
            writeAssignments(*assignmentsOutput, featureminer::Aggregator::applyAssignments(issues, aggregation));
            LOG_INFO("Wrote issue assignments to " << *assignmentsOutput);
        }

        PROFILE_END_SESSION();
    } catch (const std::exception &e) {
        PROFILE_END_SESSION();
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
