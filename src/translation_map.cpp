#include "translation_map.hpp"

#include <iostream>
#include <mutex>
#include <unordered_map>

namespace toktrans {

namespace {

const std::string kEmptyText;
const std::vector<Fragment> kNoFragments;

} // namespace

TranslationMap TranslationMap::build(const Tokenizer& source, const Tokenizer& target, bool debug) {
    TranslationMap map;
    map.target_vocab_size_ = target.vocab_size();

    SpecialTokenMap target_special = target.special_tokens();

    // Source id -> role, fetched once: special_tokens() may be a call into Python
    std::unordered_map<TokenType, std::string> source_roles;
    for (const auto& [role, special] : source.special_tokens()) {
        source_roles.emplace(special.id, role);
    }

    std::size_t vocab = source.vocab_size();
    map.texts_.resize(vocab);
    map.fragments_.resize(vocab);

    if (debug) {
        std::cout << "TranslationMap::build - Mapping " << vocab << " source tokens onto "
                  << map.target_vocab_size_ << " target tokens" << std::endl;
    }

    std::size_t special_count = 0;
    for (std::size_t id = 0; id < vocab; ++id) {
        TokenType token = static_cast<TokenType>(id);
        std::string text = source.decode_token(token);
        std::vector<Fragment>& fragments = map.fragments_[id];

        auto role = source_roles.find(token);
        auto counterpart = role != source_roles.end() ? target_special.find(role->second) : target_special.end();
        if (counterpart != target_special.end()) {
            fragments.push_back({counterpart->second.id, 0, text.size()});
            ++special_count;
        } else {
            for (const auto& span : target.encode(text)) {
                fragments.push_back({span.id, span.start, span.end});
            }
        }

        map.texts_[id] = std::move(text);
    }

    if (debug) {
        std::cout << "TranslationMap::build - " << special_count << " special tokens mapped by role" << std::endl;
        for (const auto& [length, count] : map.length_histogram()) {
            std::cout << "TranslationMap::build - " << count << " source tokens split into "
                      << length << " target tokens" << std::endl;
        }
    }

    return map;
}

const std::string& TranslationMap::text(TokenType source_id) const {
    return contains(source_id) ? texts_[source_id] : kEmptyText;
}

const std::vector<Fragment>& TranslationMap::fragments(TokenType source_id) const {
    return contains(source_id) ? fragments_[source_id] : kNoFragments;
}

std::optional<TokenType> TranslationMap::first(TokenType source_id) const {
    const auto& pieces = fragments(source_id);
    if (pieces.empty() || pieces.front().start != 0) {
        return std::nullopt;
    }
    return pieces.front().id;
}

std::optional<TokenType> TranslationMap::exact(TokenType source_id) const {
    const auto& pieces = fragments(source_id);
    if (pieces.size() != 1 || pieces.front().start != 0 || pieces.front().end != text(source_id).size()) {
        return std::nullopt;
    }
    return pieces.front().id;
}

std::map<std::size_t, std::size_t> TranslationMap::length_histogram() const {
    std::map<std::size_t, std::size_t> histogram;
    for (const auto& pieces : fragments_) {
        histogram[pieces.size()]++;
    }
    return histogram;
}

const std::vector<TokenSpan>& SplitMapCache::split(const Tokenizer& target, const std::string& text) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = splits_.find(text);
        if (it != splits_.end()) {
            return it->second;
        }
    }

    // Tokenize outside the lock; a concurrent duplicate computes the same result
    std::vector<TokenSpan> spans = target.encode(text);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto inserted = splits_.emplace(text, std::move(spans));
    return inserted.first->second;
}

std::size_t SplitMapCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return splits_.size();
}

void SplitMapCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    splits_.clear();
}

} // namespace toktrans
