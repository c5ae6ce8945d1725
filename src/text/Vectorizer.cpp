//
// Created by Matthew Krueger on 10/19/26.
//

#include "Vectorizer.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <map>
#include <stdexcept>
#include <unordered_set>

#include <omp.h>

#include "StopWords.hpp"
#include "Tokenizer.hpp"
#include "../shared/Errors.hpp"
#include "../shared/Instrumentation.hpp"
#include "../shared/Logging.hpp"
#include "../shared/Threads.hpp"

namespace featureminer {

    namespace {

        struct TermStatistics {
            size_t documentFrequency = 0;
            size_t corpusFrequency = 0;
        };

    }

    Vectorizer::Vectorizer() : Vectorizer(Config{}) {}

    Vectorizer::Vectorizer(Config config) : m_Config(std::move(config)) {
        if (m_Config.ngramMin < 1 || m_Config.ngramMin > m_Config.ngramMax) {
            throw std::invalid_argument(
                "Invalid n-gram range (" + std::to_string(m_Config.ngramMin) + ", " +
                std::to_string(m_Config.ngramMax) + "): need 1 <= min <= max");
        }
        if (m_Config.minDocumentFrequency < 1) {
            throw std::invalid_argument("Minimum document frequency must be at least 1");
        }
        if (!(m_Config.maxDocumentFrequency > 0.0 && m_Config.maxDocumentFrequency <= 1.0)) {
            throw std::invalid_argument("Maximum document frequency must be in (0, 1]");
        }
        checkedThreadCount(m_Config.numThreads, "Vectorizer");

        m_StopWords = buildStopWordSet(m_Config.extraStopWords);
    }

    std::vector<std::string> Vectorizer::analyze(const std::string& text) const {
        return Tokenizer::buildNgrams(Tokenizer::tokenize(text), m_StopWords, m_Config.ngramMin, m_Config.ngramMax);
    }

    const Vocabulary& Vectorizer::fit(const std::vector<std::string>& corpus) {
        PROFILE_FUNCTION();

        if (corpus.empty()) {
            throw EmptyCorpusError("Cannot fit a vectorizer on an empty corpus");
        }

        // ordered so every later step sees the terms in the same order
        std::map<std::string, TermStatistics> statistics;
        for (const auto& document : corpus) {
            std::unordered_set<std::string> seenInDocument;
            for (auto& term : analyze(document)) {
                auto& termStatistics = statistics[term];
                ++termStatistics.corpusFrequency;
                if (seenInDocument.insert(std::move(term)).second) {
                    ++termStatistics.documentFrequency;
                }
            }
        }

        const size_t numDocuments = corpus.size();
        const double maxDocumentCount = m_Config.maxDocumentFrequency * static_cast<double>(numDocuments);

        std::vector<std::pair<std::string, TermStatistics>> kept;
        std::ranges::copy_if(statistics, std::back_inserter(kept), [&](const auto& termAndStatistics) {
            const size_t documentFrequency = termAndStatistics.second.documentFrequency;
            return documentFrequency >= m_Config.minDocumentFrequency
                   && static_cast<double>(documentFrequency) <= maxDocumentCount;
        });

        if (m_Config.maxFeatures > 0 && kept.size() > m_Config.maxFeatures) {
            std::ranges::stable_sort(kept, [](const auto& left, const auto& right) {
                return left.second.corpusFrequency > right.second.corpusFrequency;
            });
            kept.resize(m_Config.maxFeatures);
        }

        if (kept.size() < statistics.size()) {
            DEBUG_PRINT("Pruned " << statistics.size() - kept.size() << " of " << statistics.size() << " terms");
        }

        std::vector<std::string> terms;
        terms.reserve(kept.size());
        std::ranges::transform(kept, std::back_inserter(terms), [](const auto& termAndStatistics) {
            return termAndStatistics.first;
        });
        m_Vocabulary = Vocabulary(std::move(terms));

        m_Idf.assign(m_Vocabulary.size(), 0.0);
        const double smoothing = m_Config.smoothIdf ? 1.0 : 0.0;
        for (size_t column = 0; column < m_Vocabulary.size(); ++column) {
            const double documentFrequency = static_cast<double>(statistics.at(m_Vocabulary.getTerm(column)).documentFrequency);
            m_Idf[column] = std::log((static_cast<double>(numDocuments) + smoothing) / (documentFrequency + smoothing)) + 1.0;
        }

        m_Fitted = true;
        LOG_INFO("Vocabulary built with " << m_Vocabulary.size() << " terms from " << numDocuments << " documents");
        return m_Vocabulary;
    }

    std::vector<SparseVector> Vectorizer::fitTransform(const std::vector<std::string>& corpus) {
        fit(corpus);
        return transform(corpus);
    }

    SparseVector Vectorizer::transform(const std::string& text) const {
        if (!m_Fitted) {
            throw std::logic_error("Vectorizer::transform called before fit");
        }

        std::map<size_t, double> termFrequencies;
        for (const auto& term : analyze(text)) {
            if (auto column = m_Vocabulary.find(term); column.has_value()) {
                termFrequencies[*column] += 1.0;
            }
        }

        std::vector<SparseVector::Entry> entries;
        entries.reserve(termFrequencies.size());
        double squaredNorm = 0.0;
        for (const auto& [column, frequency] : termFrequencies) {
            const double weight = frequency * m_Idf[column];
            squaredNorm += weight * weight;
            entries.push_back({column, weight});
        }

        if (m_Config.normalize && squaredNorm > 0.0) {
            const double norm = std::sqrt(squaredNorm);
            for (auto& entry : entries) {
                entry.value /= norm;
            }
        }

        return SparseVector(std::move(entries));
    }

    std::vector<SparseVector> Vectorizer::transform(const std::vector<std::string>& documents) const {
        PROFILE_FUNCTION();

        if (!m_Fitted) {
            throw std::logic_error("Vectorizer::transform called before fit");
        }

        std::vector<SparseVector> rows(documents.size());

        // every row is independent, so the result does not depend on the thread count
#pragma omp parallel for schedule(static) num_threads(static_cast<int>(m_Config.numThreads))
        for (size_t documentIndex = 0; documentIndex < documents.size(); ++documentIndex) {
            rows[documentIndex] = transform(documents[documentIndex]);
        }

        return rows;
    }

    const Vocabulary& Vectorizer::getVocabulary() const {
        if (!m_Fitted) {
            throw std::logic_error("Vectorizer has not been fitted");
        }
        return m_Vocabulary;
    }

}
