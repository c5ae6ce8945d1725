//
// Created by Matthew Krueger on 10/19/26.
//

#include "Tokenizer.hpp"

#include <algorithm>
#include <iterator>

namespace featureminer {

    namespace {

        inline bool isTokenByte(unsigned char byte) {
            return byte >= 0x80 || (byte >= 'a' && byte <= 'z') || (byte >= 'A' && byte <= 'Z')
                   || (byte >= '0' && byte <= '9') || byte == '_';
        }

        inline char toLowerAscii(unsigned char byte) {
            return (byte >= 'A' && byte <= 'Z') ? static_cast<char>(byte - 'A' + 'a') : static_cast<char>(byte);
        }

    }

    std::vector<std::string> Tokenizer::tokenize(const std::string& text) {
        std::vector<std::string> tokens;
        std::string word;

        auto finishWord = [&]() {
            if (word.size() >= 2) {
                tokens.push_back(word);
            }
            word.clear();
        };

        for (const char c : text) {
            const auto byte = static_cast<unsigned char>(c);
            if (isTokenByte(byte)) {
                word += toLowerAscii(byte);
            } else if (!word.empty()) {
                finishWord();
            }
        }
        finishWord();

        return tokens;
    }

    std::vector<std::string> Tokenizer::buildNgrams(const std::vector<std::string>& tokens,
                                                    const std::unordered_set<std::string>& stopWords,
                                                    size_t minN, size_t maxN) {
        std::vector<std::string> kept;
        kept.reserve(tokens.size());
        std::ranges::copy_if(tokens, std::back_inserter(kept),
                             [&stopWords](const std::string& token) { return !stopWords.contains(token); });

        std::vector<std::string> ngrams;
        for (size_t n = minN; n <= maxN && n <= kept.size(); ++n) {
            for (size_t start = 0; start + n <= kept.size(); ++start) {
                std::string ngram = kept[start];
                for (size_t offset = 1; offset < n; ++offset) {
                    ngram += ' ';
                    ngram += kept[start + offset];
                }
                ngrams.push_back(std::move(ngram));
            }
        }

        return ngrams;
    }

}
