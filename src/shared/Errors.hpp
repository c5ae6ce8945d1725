//
// Created by Matthew Krueger on 10/19/26.
//

#ifndef FEATUREMINER_ERRORS_HPP
#define FEATUREMINER_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace featureminer {

    /**
     * @brief Thrown when the pipeline is asked to fit or train on zero documents.
     */
    class EmptyCorpusError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    /**
     * @brief Thrown when K is below one or exceeds the number of distinct non-zero documents.
     */
    class InvalidClusterCount : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    /**
     * @brief Thrown when an input record cannot be turned into an Issue.
     * The message always names the offending line.
     */
    class MalformedRecordError : public std::runtime_error {
    public:
        MalformedRecordError(size_t lineNumber, const std::string& reason)
            : std::runtime_error("Malformed record on line " + std::to_string(lineNumber) + ": " + reason),
              m_LineNumber(lineNumber) {}

        [[nodiscard]] inline size_t getLineNumber() const { return m_LineNumber; }

    private:
        size_t m_LineNumber;
    };

}

#endif //FEATUREMINER_ERRORS_HPP
