#pragma once

#include <atomic>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "feedback.hpp"
#include "parallelTaskQueue.hpp"
#include "vocab.hpp"

namespace guesswork::cache {

using vocab::WordId;
using vocab::WordIds;

/*
Write-through memo of feedback patterns keyed by (secret, guess). Stored guess-major: one row per
lexicon word, one column per answer, so scoring a guess against a candidate set walks a single
row. Entries are only ever added.

Lookups and lazy fills are safe from any number of threads: each cell is a relaxed atomic and a
racing fill can only store the value another thread computed for the same pair. load() must not
run concurrently with lookups.
*/
class PatternCache {
    const vocab::Lexicon& lexicon;
    const size_t stride;
    std::vector<std::atomic<feedback::Encoding>> table;
    std::atomic_bool dirty{false};

    std::atomic<feedback::Encoding>& cell(WordId secretId, WordId guessId) noexcept {
        return table[static_cast<size_t>(guessId) * stride + secretId];
    }

    const std::atomic<feedback::Encoding>& cell(WordId secretId, WordId guessId) const noexcept {
        return table[static_cast<size_t>(guessId) * stride + secretId];
    }

    void markDirty() noexcept {
        if (!dirty.load(std::memory_order_relaxed)) dirty.store(true, std::memory_order_relaxed);
    }

    // Fills guesses[start, stop) against the given secrets. Returns number of new entries.
    size_t fillRows(const WordIds& guesses, size_t start, size_t stop, const WordIds& secrets);

public:
    explicit PatternCache(const vocab::Lexicon& lexicon);
    PatternCache(const PatternCache&) = delete;
    PatternCache& operator=(const PatternCache&) = delete;

    // Hot path. A secret outside the Answer Set is computed but never stored.
    feedback::Encoding lookupOrCompute(WordId secretId, WordId guessId);

    // Word API. Words outside the lexicon are computed but never stored.
    feedback::Encoding lookupOrCompute(std::string_view secret, std::string_view guess);

    // Returns the cached pattern without computing
    std::optional<feedback::Encoding> peek(WordId secretId, WordId guessId) const;

    // Fills the full answer x word cross product
    void bulkPrecompute(parallel::TaskQueue& queue, size_t numThreads = parallel::defaultConcurrency());

    // Fills secrets x guesses. Every secret must be an answer.
    void bulkPrecompute(const WordIds& secrets, const WordIds& guesses, parallel::TaskQueue& queue, size_t numThreads = parallel::defaultConcurrency());

    // Merges a saved snapshot. Returns false (cache unchanged) on a missing or undecodable file.
    bool load(const std::string& path);

    // Writes a snapshot. Returns false on failure.
    bool save(const std::string& path) const;

    // Saves only when entries were computed since the last successful flush. Clears the dirty flag on success.
    bool flush(const std::string& path);

    bool isDirty() const noexcept { return dirty.load(std::memory_order_relaxed); }

    bool isComplete() const noexcept { return filledCount() == table.size(); }

    size_t filledCount() const noexcept;

    size_t capacity() const noexcept { return table.size(); }

    const vocab::Lexicon& getLexicon() const noexcept { return lexicon; }
};

}
