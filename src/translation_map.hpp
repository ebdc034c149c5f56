#ifndef TOKTRANS_TRANSLATION_MAP_HPP
#define TOKTRANS_TRANSLATION_MAP_HPP

#include "tokenizer.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace toktrans {

/**
 * @brief A target-vocabulary token covering [start, end) of a source token's text
 */
struct Fragment {
    TokenType id;
    std::size_t start;
    std::size_t end;
};

/**
 * @brief Directed map from every source-vocabulary id to the target tokens covering its text
 *
 * Depends only on the two vocabularies. Built once per (source, target)
 * pair and immutable afterwards, so concurrent reads need no locking.
 */
class TranslationMap {
public:
    /**
     * @brief Decode every source id and tokenize its text with the target tokenizer
     *
     * Source special tokens map to the target special token of the same role
     * when the target has one.
     * @param source Tokenizer whose ids are keys
     * @param target Tokenizer whose ids are values
     * @param debug Whether to print the fragment-count histogram
     */
    static TranslationMap build(const Tokenizer& source, const Tokenizer& target, bool debug = false);

    std::size_t source_vocab_size() const { return texts_.size(); }
    std::size_t target_vocab_size() const { return target_vocab_size_; }

    bool contains(TokenType source_id) const {
        return source_id >= 0 && static_cast<std::size_t>(source_id) < texts_.size();
    }

    // Decoded source text; empty for ids outside the map
    const std::string& text(TokenType source_id) const;

    // Target fragments in text order; empty for ids outside the map
    const std::vector<Fragment>& fragments(TokenType source_id) const;

    // Target id of the fragment starting at byte 0
    std::optional<TokenType> first(TokenType source_id) const;

    // Target id when a single fragment covers the whole source text
    std::optional<TokenType> exact(TokenType source_id) const;

    // Fragment count -> number of source ids with that many fragments
    std::map<std::size_t, std::size_t> length_histogram() const;

private:
    std::vector<std::string> texts_;
    std::vector<std::vector<Fragment>> fragments_;
    std::size_t target_vocab_size_ = 0;
};

/**
 * @brief Memoized target-vocabulary tokenization of raw text spans
 *
 * Grows without bound; callers that need bounded memory check size() and
 * clear(). Safe for concurrent use.
 */
class SplitMapCache {
public:
    SplitMapCache() = default;
    SplitMapCache(const SplitMapCache&) = delete;
    SplitMapCache& operator=(const SplitMapCache&) = delete;

    /**
     * @brief Tokenization of text by target, computed on first request
     * @param target Tokenizer to split with; a cache must only ever see one target
     * @param text Raw text span
     * @return Spans relative to text; the reference stays valid until clear()
     */
    const std::vector<TokenSpan>& split(const Tokenizer& target, const std::string& text);

    std::size_t size() const;
    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::vector<TokenSpan>> splits_;
};

} // namespace toktrans

#endif // TOKTRANS_TRANSLATION_MAP_HPP
