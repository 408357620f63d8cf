/**
 * SmallTalkClassifier.hpp - Keyword fast path for conversational fillers
 */

#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace volley::pipeline {

enum class SmallTalk {
    None,
    Greeting,
    Thanks,
    Goodbye
};

const char* toString(SmallTalk kind);

struct SmallTalkConfig {
    std::vector<std::string> greeting_keywords = {"bonjour", "salut", "hello", "hey", "coucou", "bonsoir"};
    std::vector<std::string> thanks_keywords = {"merci", "merci beaucoup", "je te remercie", "thank you"};
    std::vector<std::string> goodbye_keywords = {"au revoir", "bye", "salut", "à bientôt", "à plus", "ciao"};

    std::vector<std::string> greeting_responses = {
        "Bonjour! Comment puis-je vous aider?",
        "Bonjour! Je suis l'assistant vocal de Harvard. Que puis-je faire pour vous?",
    };
    std::vector<std::string> thanks_responses = {"Je vous en prie!", "Avec plaisir!", "De rien!"};
    std::vector<std::string> goodbye_responses = {"Au revoir! Bonne journée!", "À bientôt!", "Au revoir!"};
};

class SmallTalkClassifier {
public:
    explicit SmallTalkClassifier(SmallTalkConfig config = SmallTalkConfig{});

    /**
     * Case-insensitive whole-word/phrase match. Categories are tried in the
     * order greeting, thanks, goodbye; the first hit wins.
     */
    SmallTalk classify(const std::string& text) const;

    // Next canned response for the category, rotating through the list
    std::string respond(SmallTalk kind);

private:
    static bool containsPhrase(const std::string& haystack, const std::string& phrase);

    SmallTalkConfig config_;
    std::array<size_t, 3> next_{{0, 0, 0}};
};

} // namespace volley::pipeline
