//
// Created by Matthew Krueger on 10/19/26.
//

#ifndef FEATUREMINER_VECTORIZER_HPP
#define FEATUREMINER_VECTORIZER_HPP

#include <string>
#include <unordered_set>
#include <vector>

#include "Vocabulary.hpp"
#include "../shared/SparseVector.hpp"

namespace featureminer {

    /**
     * @brief TF-IDF vectorizer over unigrams and n-grams.
     *
     * fit() freezes the vocabulary and the inverse document frequencies. transform() never changes either,
     * so it can be called from several threads once fitting is done.
     */
    class Vectorizer {
    public:
        struct Config {
            size_t ngramMin = 1;
            size_t ngramMax = 2;
            std::vector<std::string> extraStopWords{"feature", "issue"};
            /// Terms in fewer documents than this are dropped.
            size_t minDocumentFrequency = 1;
            /// Terms in more than this fraction of documents are dropped. In (0, 1].
            double maxDocumentFrequency = 1.0;
            /// Zero keeps every term, otherwise the most frequent terms in the corpus.
            size_t maxFeatures = 0;
            bool smoothIdf = true;
            bool normalize = true;
            size_t numThreads = 1;
        };

        Vectorizer();
        explicit Vectorizer(Config config);

        /**
         * @brief Builds the vocabulary and inverse document frequencies from the corpus.
         * @throws EmptyCorpusError if the corpus has no documents
         */
        const Vocabulary& fit(const std::vector<std::string>& corpus);

        std::vector<SparseVector> fitTransform(const std::vector<std::string>& corpus);

        /**
         * @brief Maps text into the frozen vocabulary space. Unknown terms are ignored.
         * @throws std::logic_error if called before fit()
         */
        [[nodiscard]] SparseVector transform(const std::string& text) const;

        /**
         * @brief Transforms many documents, using numThreads OpenMP threads. Output order matches input order.
         */
        [[nodiscard]] std::vector<SparseVector> transform(const std::vector<std::string>& documents) const;

        [[nodiscard]] inline bool isFitted() const { return m_Fitted; }
        [[nodiscard]] const Vocabulary& getVocabulary() const;
        [[nodiscard]] inline const std::vector<double>& getIdf() const { return m_Idf; }
        [[nodiscard]] inline const Config& getConfig() const { return m_Config; }

    private:
        [[nodiscard]] std::vector<std::string> analyze(const std::string& text) const;

        Config m_Config;
        std::unordered_set<std::string> m_StopWords;
        Vocabulary m_Vocabulary;
        std::vector<double> m_Idf;
        bool m_Fitted = false;
    };

}

#endif //FEATUREMINER_VECTORIZER_HPP
