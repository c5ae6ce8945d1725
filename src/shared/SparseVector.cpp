//
// Created by Matthew Krueger on 10/19/26.
//

#include "SparseVector.hpp"

#include <algorithm>
#include <functional>
#include <numeric>
#include <stdexcept>

namespace featureminer {

    SparseVector::SparseVector(std::vector<Entry> entries) : m_Entries(std::move(entries)) {
        bool strictlyIncreasing = std::ranges::adjacent_find(m_Entries, [](const Entry& left, const Entry& right) {
            return left.index >= right.index;
        }) == m_Entries.end();

        if (!strictlyIncreasing) {
            throw std::invalid_argument("Sparse vector entries must have strictly increasing indices");
        }
    }

    size_t SparseVector::requiredDimensions() const {
        return m_Entries.empty() ? 0 : m_Entries.back().index + 1;
    }

    double SparseVector::squaredNorm() const {
        return std::transform_reduce(
            m_Entries.begin(),
            m_Entries.end(),
            0.0,
            std::plus<>(),
            [](const Entry& entry) { return entry.value * entry.value; }
        );
    }

    double SparseVector::valueAt(size_t index) const {
        auto it = std::ranges::lower_bound(m_Entries, index, {}, &Entry::index);
        if (it != m_Entries.end() && it->index == index) {
            return it->value;
        }
        return 0.0;
    }

    bool SparseVector::lexicographicalLess(const SparseVector& lhs, const SparseVector& rhs) {
        return std::lexicographical_compare(
            lhs.m_Entries.begin(), lhs.m_Entries.end(),
            rhs.m_Entries.begin(), rhs.m_Entries.end(),
            [](const Entry& left, const Entry& right) {
                if (left.index != right.index) {
                    return left.index < right.index;
                }
                return left.value < right.value;
            }
        );
    }

}
