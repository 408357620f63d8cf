/**
 * SentenceSplitter.cpp - Sentence segmentation for incremental synthesis
 */

#include "volley/tts/Synthesizer.hpp"

#include <cctype>

namespace volley::tts {

namespace {

std::string trimmed(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool isTerminator(char c) {
    return c == '.' || c == '!' || c == '?';
}

} // anonymous namespace

std::vector<std::string> splitSentences(const std::string& text) {
    std::vector<std::string> sentences;
    std::string current;

    for (size_t i = 0; i < text.size(); ++i) {
        current += text[i];

        // Punctuation followed by whitespace or end of text; keeps "3.5" and "?!" together
        if (isTerminator(text[i]) &&
            (i + 1 == text.size() || std::isspace(static_cast<unsigned char>(text[i + 1])))) {
            std::string sentence = trimmed(current);
            current.clear();

            // Punctuation alone ("...") belongs to the previous sentence
            bool only_punct = true;
            for (char c : sentence) {
                if (!isTerminator(c)) {
                    only_punct = false;
                    break;
                }
            }
            if (only_punct && !sentences.empty()) {
                sentences.back() += sentence;
            } else if (!sentence.empty()) {
                sentences.push_back(sentence);
            }
        }
    }

    std::string tail = trimmed(current);
    if (!tail.empty()) {
        sentences.push_back(tail);
    }

    return sentences;
}

} // namespace volley::tts
