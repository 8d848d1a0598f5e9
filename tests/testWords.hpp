#pragma once

#include <string>

#include "../src/vocab.hpp"

namespace guesswork::test {

inline std::string dataPath(const std::string& name) {
    return std::string{GUESSWORK_TEST_DATA_DIR} + "/" + name;
}

// 44 answers, 14 allowed guesses (two of them also answers)
inline vocab::Lexicon fixtureLexicon() {
    return vocab::loadLexicon(dataPath("guesses.txt"), dataPath("answers.txt"));
}

inline vocab::Lexicon smallLexicon() {
    return vocab::Lexicon{{"soare", "lints", "cloud"}, {"crane", "crate", "trace", "react", "cater", "slate", "plush"}};
}

}
