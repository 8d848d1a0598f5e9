#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "strategyBase.hpp"

namespace guesswork::strategy {

// Strategy name -> precomputed first guess
class OpeningBook {
    std::map<std::string, std::string> entries;

public:
    std::optional<std::string> get(std::string_view strategyName) const;

    void set(std::string_view strategyName, std::string word);

    bool empty() const noexcept { return entries.empty(); }

    size_t size() const noexcept { return entries.size(); }

    // Replaces the contents with a saved book. Returns false (book unchanged) on failure.
    bool load(const std::string& path);

    bool save(const std::string& path) const;
};

/*
Answers only the opening move: empty history, untouched Answer Set, and a book entry for the
wrapped strategy naming a word in the lexicon. Otherwise declines so the next provider runs.
*/
class OpeningBookProvider : public Strategy {
    const OpeningBook& book;
    const vocab::Lexicon& lexicon;
    const std::string strategyName;

public:
    OpeningBookProvider(const OpeningBook& book, const vocab::Lexicon& lexicon, std::string_view strategyName);

    std::string_view name() const noexcept override { return "opening_book"; }

    std::optional<Suggestion> propose(const Query& query) override;
};

// Best first guess computed from scratch against the full Answer Set
Suggestion buildOpening(StrategyBase& strategy, const vocab::Lexicon& lexicon);

}
