#include "openingBook.hpp"

#include <exception>
#include <fstream>

#include <boost/archive/archive_exception.hpp>
#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/serialization/map.hpp>
#include <boost/serialization/string.hpp>

#include "errors.hpp"
#include "log.hpp"

namespace guesswork::strategy {

std::optional<std::string> OpeningBook::get(std::string_view strategyName) const {
    auto it = entries.find(std::string{strategyName});
    if (it == entries.end()) return std::nullopt;
    return it->second;
}

void OpeningBook::set(std::string_view strategyName, std::string word) {
    entries[std::string{strategyName}] = std::move(word);
}

bool OpeningBook::load(const std::string& path) {
    std::map<std::string, std::string> loaded;
    try {
        std::ifstream file{path, std::ios::binary};
        if (!file) throw CacheUnavailable("cannot open " + path);
        boost::archive::binary_iarchive archive{file};
        archive >> loaded;
    } catch (const CacheUnavailable& e) {
        log::warn("Opening book not loaded: {}", e.what());
        return false;
    } catch (const boost::archive::archive_exception& e) {
        log::warn("Opening book not loaded: {} is not a valid book ({})", path, e.what());
        return false;
    } catch (const std::ios_base::failure& e) {
        log::warn("Opening book not loaded: {} ({})", path, e.what());
        return false;
    }

    entries = std::move(loaded);
    log::debug("Loaded {} opening book entries from {}", entries.size(), path);
    return true;
}

bool OpeningBook::save(const std::string& path) const {
    try {
        std::ofstream file{path, std::ios::binary | std::ios::trunc};
        if (!file) throw CacheUnavailable("cannot open " + path + " for writing");
        {
            boost::archive::binary_oarchive archive{file};
            archive << entries;
        }
        file.flush();
        if (!file) throw CacheUnavailable("write to " + path + " failed");
    } catch (const CacheUnavailable& e) {
        log::warn("Opening book not saved: {}", e.what());
        return false;
    } catch (const boost::archive::archive_exception& e) {
        log::warn("Opening book not saved to {}: {}", path, e.what());
        return false;
    }
    return true;
}

OpeningBookProvider::OpeningBookProvider(const OpeningBook& book, const vocab::Lexicon& lexicon, std::string_view strategyName)
: book{book}, lexicon{lexicon}, strategyName{strategyName} {}

std::optional<Suggestion> OpeningBookProvider::propose(const Query& query) {
    if (!query.history.empty() || query.candidates.size() != lexicon.answerCount()) return std::nullopt;

    const auto word = book.get(strategyName);
    if (!word) return std::nullopt;

    const auto id = lexicon.find(*word);
    if (!id) {
        log::debug("Opening book word {} for {} is not in the vocabulary, ignoring", *word, strategyName);
        return std::nullopt;
    }
    return Suggestion{*id, std::nullopt, true};
}

Suggestion buildOpening(StrategyBase& strategy, const vocab::Lexicon& lexicon) {
    return strategy.select(lexicon.answers(), lexicon.guesses());
}

}
