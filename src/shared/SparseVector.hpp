//
// Created by Matthew Krueger on 10/19/26.
// A document row in vocabulary space. Only non-zero weights are stored, sorted by column.

#ifndef FEATUREMINER_SPARSEVECTOR_HPP
#define FEATUREMINER_SPARSEVECTOR_HPP

#include <cstddef>
#include <vector>

namespace featureminer {

    class SparseVector {
    public:
        struct Entry {
            size_t index;
            double value;

            bool operator==(const Entry& other) const = default;
        };

        SparseVector() = default;

        /**
         * @param entries Non-zero entries. Must be sorted by strictly increasing index.
         * @throws std::invalid_argument if the entries are not strictly increasing
         */
        explicit SparseVector(std::vector<Entry> entries);

        [[nodiscard]] inline const std::vector<Entry>& getEntries() const { return m_Entries; }
        [[nodiscard]] inline size_t nonZeroCount() const { return m_Entries.size(); }
        [[nodiscard]] inline bool empty() const { return m_Entries.empty(); }

        /**
         * @brief Largest column index plus one, or zero for the empty vector.
         */
        [[nodiscard]] size_t requiredDimensions() const;

        [[nodiscard]] double squaredNorm() const;

        /**
         * @brief Value at a column. Columns without an entry are zero.
         */
        [[nodiscard]] double valueAt(size_t index) const;

        bool operator==(const SparseVector& other) const = default;

        /**
         * @brief Strict weak ordering used to count distinct rows. Compares entries lexicographically
         * by (index, value).
         */
        static bool lexicographicalLess(const SparseVector& lhs, const SparseVector& rhs);

        using const_iterator = std::vector<Entry>::const_iterator;
        [[nodiscard]] inline const_iterator begin() const { return m_Entries.begin(); }
        [[nodiscard]] inline const_iterator end() const { return m_Entries.end(); }

    private:
        std::vector<Entry> m_Entries;
    };

}

#endif //FEATUREMINER_SPARSEVECTOR_HPP
