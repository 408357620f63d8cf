/**
 * SmallTalkClassifier.cpp - Greeting/thanks/goodbye detection
 */

#include "volley/pipeline/SmallTalkClassifier.hpp"

#include <algorithm>
#include <cctype>

namespace volley::pipeline {

namespace {

// ASCII folding only; UTF-8 continuation bytes pass through untouched
std::string lowercase(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c);
    });
    return out;
}

bool isWordByte(unsigned char c) {
    return c >= 0x80 || std::isalnum(c) || c == '\'';
}

} // anonymous namespace

const char* toString(SmallTalk kind) {
    switch (kind) {
        case SmallTalk::None: return "none";
        case SmallTalk::Greeting: return "greeting";
        case SmallTalk::Thanks: return "thanks";
        case SmallTalk::Goodbye: return "goodbye";
    }
    return "unknown";
}

SmallTalkClassifier::SmallTalkClassifier(SmallTalkConfig config)
    : config_(std::move(config))
{
    for (auto* list : {&config_.greeting_keywords, &config_.thanks_keywords, &config_.goodbye_keywords}) {
        for (auto& kw : *list) {
            kw = lowercase(kw);
        }
    }
}

bool SmallTalkClassifier::containsPhrase(const std::string& haystack, const std::string& phrase) {
    if (phrase.empty()) return false;

    size_t pos = haystack.find(phrase);
    while (pos != std::string::npos) {
        bool left_ok = pos == 0 || !isWordByte(static_cast<unsigned char>(haystack[pos - 1]));
        size_t end = pos + phrase.size();
        bool right_ok = end >= haystack.size() || !isWordByte(static_cast<unsigned char>(haystack[end]));
        if (left_ok && right_ok) return true;
        pos = haystack.find(phrase, pos + 1);
    }
    return false;
}

SmallTalk SmallTalkClassifier::classify(const std::string& text) const {
    const std::string lower = lowercase(text);

    auto matches = [&lower](const std::vector<std::string>& keywords) {
        return std::any_of(keywords.begin(), keywords.end(),
                           [&lower](const std::string& kw) { return containsPhrase(lower, kw); });
    };

    if (matches(config_.greeting_keywords)) return SmallTalk::Greeting;
    if (matches(config_.thanks_keywords)) return SmallTalk::Thanks;
    if (matches(config_.goodbye_keywords)) return SmallTalk::Goodbye;
    return SmallTalk::None;
}

std::string SmallTalkClassifier::respond(SmallTalk kind) {
    const std::vector<std::string>* responses = nullptr;
    size_t slot = 0;

    switch (kind) {
        case SmallTalk::Greeting: responses = &config_.greeting_responses; slot = 0; break;
        case SmallTalk::Thanks:   responses = &config_.thanks_responses;   slot = 1; break;
        case SmallTalk::Goodbye:  responses = &config_.goodbye_responses;  slot = 2; break;
        case SmallTalk::None:     return "";
    }

    if (!responses || responses->empty()) return "";

    const std::string& reply = (*responses)[next_[slot] % responses->size()];
    next_[slot]++;
    return reply;
}

} // namespace volley::pipeline
