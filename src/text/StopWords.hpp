//
// Created by Matthew Krueger on 10/19/26.
//

#ifndef FEATUREMINER_STOPWORDS_HPP
#define FEATUREMINER_STOPWORDS_HPP

#include <string>
#include <unordered_set>
#include <vector>

namespace featureminer {

    /**
     * @brief The standard English stop word list.
     */
    const std::unordered_set<std::string>& englishStopWords();

    /**
     * @brief English stop words plus the extra domain words, lower-cased.
     */
    std::unordered_set<std::string> buildStopWordSet(const std::vector<std::string>& extraStopWords);

}

#endif //FEATUREMINER_STOPWORDS_HPP
