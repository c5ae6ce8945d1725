//
// Created by Matthew Krueger on 10/19/26.
//

#include "Vocabulary.hpp"

#include <algorithm>
#include <stdexcept>

namespace featureminer {

    Vocabulary::Vocabulary(std::vector<std::string> terms) : m_Terms(std::move(terms)) {
        std::ranges::sort(m_Terms);

        m_Index.reserve(m_Terms.size());
        for (size_t column = 0; column < m_Terms.size(); ++column) {
            if (!m_Index.emplace(m_Terms[column], column).second) {
                throw std::invalid_argument("Duplicate vocabulary term: " + m_Terms[column]);
            }
        }
    }

    std::optional<size_t> Vocabulary::find(const std::string& term) const {
        if (auto it = m_Index.find(term); it != m_Index.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    const std::string& Vocabulary::getTerm(size_t index) const {
        if (index >= m_Terms.size()) {
            throw std::out_of_range("Vocabulary column " + std::to_string(index) + " out of range");
        }
        return m_Terms[index];
    }

}
