//
// Created by Matthew Krueger on 10/19/26.
//

#include "Issue.hpp"

#include <fstream>
#include <unordered_set>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

#include "Errors.hpp"
#include "Instrumentation.hpp"
#include "Logging.hpp"

namespace featureminer {

    namespace {

        int64_t parseInteger(const std::string& field, const char* fieldName, size_t lineNumber) {
            const std::string trimmed = boost::algorithm::trim_copy(field);
            if (trimmed.empty()) {
                throw MalformedRecordError(lineNumber, std::string("missing ") + fieldName);
            }
            try {
                return boost::lexical_cast<int64_t>(trimmed);
            } catch (const boost::bad_lexical_cast&) {
                throw MalformedRecordError(lineNumber, std::string(fieldName) + " '" + trimmed + "' is not an integer");
            }
        }

    }

    Issue IssueReader::parseLine(const std::string& line, size_t lineNumber) {
        // the description is everything after the second tab, tabs inside it included
        const size_t firstTab = line.find('\t');
        if (firstTab == std::string::npos) {
            throw MalformedRecordError(lineNumber, "expected at least the id and votes fields");
        }
        const size_t secondTab = line.find('\t', firstTab + 1);

        const int64_t id = parseInteger(line.substr(0, firstTab), "id", lineNumber);
        const int64_t votes = parseInteger(
            line.substr(firstTab + 1, secondTab == std::string::npos ? std::string::npos : secondTab - firstTab - 1),
            "votes", lineNumber);

        if (votes < 0) {
            throw MalformedRecordError(lineNumber, "votes must not be negative, got " + std::to_string(votes));
        }

        std::optional<std::string> description = std::nullopt;
        if (secondTab != std::string::npos) {
            description = line.substr(secondTab + 1);
        }

        return {id, static_cast<uint64_t>(votes), std::move(description)};
    }

    std::vector<Issue> IssueReader::read(std::istream& input) {
        PROFILE_FUNCTION();

        std::vector<Issue> issues;
        std::unordered_set<int64_t> seenIds;

        std::string line;
        size_t lineNumber = 0;
        while (std::getline(input, line)) {
            ++lineNumber;

            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }

            if (boost::algorithm::all(line, boost::algorithm::is_space())) {
                continue;
            }

            if (issues.empty() && boost::algorithm::iequals(boost::algorithm::trim_copy(line.substr(0, line.find('\t'))), "id")) {
                DEBUG_PRINT("Skipping header on line " << lineNumber);
                continue;
            }

            Issue issue = parseLine(line, lineNumber);
            if (!seenIds.insert(issue.id).second) {
                throw MalformedRecordError(lineNumber, "duplicate issue id " + std::to_string(issue.id));
            }
            issues.push_back(std::move(issue));
        }

        if (input.bad()) {
            throw std::runtime_error("I/O error while reading issues after line " + std::to_string(lineNumber));
        }

        return issues;
    }

    std::vector<Issue> IssueReader::readFile(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Could not open file: " + path);
        }
        return read(file);
    }

}
