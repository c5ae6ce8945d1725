//
// Created by Matthew Krueger on 10/19/26.
//

#ifndef FEATUREMINER_TOKENIZER_HPP
#define FEATUREMINER_TOKENIZER_HPP

#include <string>
#include <unordered_set>
#include <vector>

namespace featureminer {

    class Tokenizer {
    public:
        /**
         * @brief Splits text into lower-case tokens.
         *
         * A token is a maximal run of ASCII letters, digits, underscores or non-ASCII bytes, at least two bytes
         * long. Non-ASCII bytes are kept as they are, so multi-byte text stays opaque.
         */
        static std::vector<std::string> tokenize(const std::string& text);

        /**
         * @brief Drops stop words, then builds every n-gram with minN <= n <= maxN over the remaining tokens.
         * The n-grams of one size are emitted before the next size, each in text order. Words are joined by a
         * single space.
         */
        static std::vector<std::string> buildNgrams(const std::vector<std::string>& tokens,
                                                    const std::unordered_set<std::string>& stopWords,
                                                    size_t minN, size_t maxN);
    };

}

#endif //FEATUREMINER_TOKENIZER_HPP
