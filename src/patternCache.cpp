#include "patternCache.hpp"

#include <fstream>

#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>

#include "errors.hpp"
#include "guard.hpp"
#include "log.hpp"

namespace guesswork::cache {

namespace {
    // On-disk form. Keyed by words so a snapshot survives reordered or resized word lists.
    struct Snapshot {
        size_t wordLength = config::WORD_LENGTH;
        std::vector<std::string> secrets;
        std::vector<std::string> guesses;
        std::vector<feedback::Encoding> patterns;  // Row-major, guesses.size() x secrets.size()

        template <typename Archive>
        void serialize(Archive& ar, const unsigned int /*version*/) {
            ar & wordLength;
            ar & secrets;
            ar & guesses;
            ar & patterns;
        }
    };

    Snapshot readSnapshot(const std::string& path) {
        std::ifstream file{path, std::ios::binary};
        if (!file) guard::formatError<CacheUnavailable>("no pattern cache at {}", path);

        Snapshot snapshot;
        try {
            boost::archive::binary_iarchive archive{file};
            archive >> snapshot;
        } catch (const std::exception& e) {
            guard::formatError<CacheUnavailable>("{} is corrupted or incompatible: {}", path, e.what());
        }

        guard::runtimeGuard<CacheUnavailable>(snapshot.wordLength == config::WORD_LENGTH, "{} holds {}-letter words", path, snapshot.wordLength);
        guard::runtimeGuard<CacheUnavailable>(snapshot.patterns.size() == snapshot.secrets.size() * snapshot.guesses.size(), "{} has a truncated pattern table", path);
        for (auto encoding : snapshot.patterns) {
            guard::runtimeGuard<CacheUnavailable>(encoding <= feedback::NOT_COMPUTED, "{} holds an invalid pattern", path);
        }
        return snapshot;
    }
}

PatternCache::PatternCache(const vocab::Lexicon& lexicon)
: lexicon{lexicon},
  stride{lexicon.answerCount()},
  table(lexicon.size() * lexicon.answerCount()) {
    for (auto& slot : table) {
        slot.store(feedback::NOT_COMPUTED, std::memory_order_relaxed);
    }
}

feedback::Encoding PatternCache::lookupOrCompute(WordId secretId, WordId guessId) {
    thread_local feedback::Encoder encoder{};
    if (!lexicon.isAnswer(secretId)) return encoder(lexicon.word(guessId), lexicon.word(secretId));

    auto& slot = cell(secretId, guessId);
    feedback::Encoding encoding = slot.load(std::memory_order_relaxed);
    if (encoding != feedback::NOT_COMPUTED) return encoding;

    encoding = encoder(lexicon.word(guessId), lexicon.word(secretId));
    slot.store(encoding, std::memory_order_relaxed);
    markDirty();
    return encoding;
}

feedback::Encoding PatternCache::lookupOrCompute(std::string_view secret, std::string_view guess) {
    auto secretId = lexicon.find(secret);
    auto guessId = lexicon.find(guess);
    if (secretId && guessId && lexicon.isAnswer(*secretId)) return lookupOrCompute(*secretId, *guessId);

    return feedback::encode(guess, secret);
}

std::optional<feedback::Encoding> PatternCache::peek(WordId secretId, WordId guessId) const {
    if (!lexicon.isAnswer(secretId) || guessId >= lexicon.size()) return std::nullopt;
    feedback::Encoding encoding = cell(secretId, guessId).load(std::memory_order_relaxed);
    if (encoding == feedback::NOT_COMPUTED) return std::nullopt;
    return encoding;
}

size_t PatternCache::fillRows(const WordIds& guesses, size_t start, size_t stop, const WordIds& secrets) {
    thread_local feedback::Encoder encoder{};
    size_t added = 0;
    for (size_t row = start; row < stop; ++row) {
        const WordId guessId = guesses[row];
        std::string_view guess = lexicon.word(guessId);
        for (WordId secretId : secrets) {
            auto& slot = cell(secretId, guessId);
            if (slot.load(std::memory_order_relaxed) != feedback::NOT_COMPUTED) continue;
            slot.store(encoder(guess, lexicon.word(secretId)), std::memory_order_relaxed);
            ++added;
        }
    }
    return added;
}

void PatternCache::bulkPrecompute(parallel::TaskQueue& queue, size_t numThreads) {
    WordIds everyWord(lexicon.size());
    for (size_t i = 0; i < everyWord.size(); ++i) everyWord[i] = static_cast<WordId>(i);
    bulkPrecompute(lexicon.answers(), everyWord, queue, numThreads);
}

void PatternCache::bulkPrecompute(const WordIds& secrets, const WordIds& guesses, parallel::TaskQueue& queue, size_t numThreads) {
    for (WordId secretId : secrets) {
        guard::runtimeGuard<InvalidWordError>(lexicon.isAnswer(secretId), "'{}' is not a possible answer", lexicon.word(secretId));
    }

    // Each thread owns a contiguous block of guess rows
    std::atomic_size_t added = 0;
    queue.pushChunked(guesses.size(), numThreads, [this, &secrets, &guesses, &added](size_t, size_t start, size_t stop) {
        added.fetch_add(fillRows(guesses, start, stop, secrets), std::memory_order_relaxed);
    });
    queue.wait();

    if (added.load()) markDirty();
    log::info("Precomputed {} feedback patterns ({} of {} cached)", added.load(), filledCount(), table.size());
}

bool PatternCache::load(const std::string& path) {
    Snapshot snapshot;
    try {
        snapshot = readSnapshot(path);
    } catch (const CacheUnavailable& e) {
        log::warn("Pattern cache unavailable, patterns will be computed on demand ({})", e.what());
        return false;
    }

    // Map snapshot columns onto answer ids; secrets that are no longer answers are skipped
    std::vector<std::optional<WordId>> columns(snapshot.secrets.size());
    for (size_t j = 0; j < columns.size(); ++j) {
        auto secretId = lexicon.find(snapshot.secrets[j]);
        if (secretId && lexicon.isAnswer(*secretId)) columns[j] = secretId;
    }

    size_t restored = 0;
    for (size_t i = 0; i < snapshot.guesses.size(); ++i) {
        auto guessId = lexicon.find(snapshot.guesses[i]);
        if (!guessId) continue;

        const feedback::Encoding* row = snapshot.patterns.data() + i * snapshot.secrets.size();
        for (size_t j = 0; j < columns.size(); ++j) {
            if (!columns[j] || row[j] == feedback::NOT_COMPUTED) continue;
            cell(*columns[j], *guessId).store(row[j], std::memory_order_relaxed);
            ++restored;
        }
    }

    log::info("Loaded {} feedback patterns from {}", restored, path);
    return true;
}

bool PatternCache::save(const std::string& path) const {
    Snapshot snapshot;
    snapshot.secrets.reserve(lexicon.answerCount());
    for (WordId secretId : lexicon.answers()) {
        snapshot.secrets.push_back(lexicon.word(secretId));
    }
    snapshot.guesses.reserve(lexicon.size());
    for (size_t guessId = 0; guessId < lexicon.size(); ++guessId) {
        snapshot.guesses.push_back(lexicon.word(static_cast<WordId>(guessId)));
    }
    snapshot.patterns.reserve(table.size());
    for (const auto& slot : table) {
        snapshot.patterns.push_back(slot.load(std::memory_order_relaxed));
    }

    try {
        std::ofstream file{path, std::ios::binary | std::ios::trunc};
        if (!file) guard::formatError<CacheUnavailable>("cannot open {} for writing", path);
        {
            boost::archive::binary_oarchive archive{file};
            archive << snapshot;
        }
        file.flush();
        if (!file) guard::formatError<CacheUnavailable>("error writing {}", path);
    } catch (const std::exception& e) {
        log::warn("Could not save pattern cache: {}", e.what());
        return false;
    }

    log::info("Saved pattern cache to {}", path);
    return true;
}

bool PatternCache::flush(const std::string& path) {
    if (!isDirty()) return true;
    if (!save(path)) return false;
    dirty.store(false, std::memory_order_relaxed);
    return true;
}

size_t PatternCache::filledCount() const noexcept {
    size_t filled = 0;
    for (const auto& slot : table) {
        filled += static_cast<size_t>(slot.load(std::memory_order_relaxed) != feedback::NOT_COMPUTED);
    }
    return filled;
}

}
