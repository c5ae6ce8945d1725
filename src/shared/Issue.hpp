//
// Created by Matthew Krueger on 10/19/26.
//

#ifndef FEATUREMINER_ISSUE_HPP
#define FEATUREMINER_ISSUE_HPP

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace featureminer {

    /**
     * @brief A cleaned feature request. Everything but cluster is fixed once created.
     */
    struct Issue {
        int64_t id = 0;
        uint64_t votes = 0;
        std::string description;
        std::optional<size_t> cluster = std::nullopt;

        Issue() = default;
        Issue(int64_t id, uint64_t votes, std::optional<std::string> description)
            : id(id), votes(votes), description(description.value_or("")) {}
    };

    /**
     * @brief Reads issue records in the tab separated form id<TAB>votes<TAB>description.
     *
     * A leading header whose first field is "id" and blank lines are skipped. A line with only two fields
     * has no description, which becomes the empty document. Anything else that does not parse throws
     * MalformedRecordError; no record is ever dropped silently.
     */
    class IssueReader {
    public:
        static std::vector<Issue> read(std::istream& input);
        static std::vector<Issue> readFile(const std::string& path);

        /**
         * @brief Parses one non-blank line.
         * @throws MalformedRecordError
         */
        static Issue parseLine(const std::string& line, size_t lineNumber);
    };

}

#endif //FEATUREMINER_ISSUE_HPP
