//
// Created by Matthew Krueger on 10/19/26.
//

#ifndef FEATUREMINER_VOCABULARY_HPP
#define FEATUREMINER_VOCABULARY_HPP

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace featureminer {

    /**
     * @brief Frozen mapping from term to column. Columns follow the lexicographic order of the terms.
     */
    class Vocabulary {
    public:
        Vocabulary() = default;

        /**
         * @param terms Distinct terms. They are sorted before columns are assigned.
         * @throws std::invalid_argument on a duplicate term
         */
        explicit Vocabulary(std::vector<std::string> terms);

        [[nodiscard]] std::optional<size_t> find(const std::string& term) const;
        [[nodiscard]] const std::string& getTerm(size_t index) const;
        [[nodiscard]] inline const std::vector<std::string>& getTerms() const { return m_Terms; }
        [[nodiscard]] inline size_t size() const { return m_Terms.size(); }
        [[nodiscard]] inline bool empty() const { return m_Terms.empty(); }

    private:
        std::vector<std::string> m_Terms;
        std::unordered_map<std::string, size_t> m_Index;
    };

}

#endif //FEATUREMINER_VOCABULARY_HPP
