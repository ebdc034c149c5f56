#include "bpe.hpp"

#include <algorithm>
#include <climits>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace toktrans {

namespace {

enum class ByteClass { Space, Word, Punct };

ByteClass classify(unsigned char c) {
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f') {
        return ByteClass::Space;
    }
    if ((c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c >= 0x80) {
        return ByteClass::Word;
    }
    return ByteClass::Punct;
}

const char* kFormatHeader = "#toktrans-bpe 1";

} // namespace

OffsetMapping split_chunks(const std::string& text, std::size_t begin, std::size_t end) {
    OffsetMapping chunks;
    std::size_t i = begin;

    while (i < end) {
        if (classify(text[i]) == ByteClass::Space) {
            std::size_t j = i;
            while (j < end && classify(text[j]) == ByteClass::Space) {
                ++j;
            }
            // A trailing ' ' directly before a word or punctuation run joins that run
            bool attach = j < end && text[j - 1] == ' ';
            std::size_t run_end = attach ? j - 1 : j;
            if (run_end > i) {
                chunks.push_back({i, run_end});
            }
            i = run_end;
            if (!attach) {
                continue;
            }
        }

        std::size_t k = i;
        if (text[k] == ' ') {
            ++k;
        }
        ByteClass run_class = classify(text[k]);
        while (k < end && classify(text[k]) == run_class) {
            ++k;
        }
        chunks.push_back({i, k});
        i = k;
    }

    return chunks;
}

std::unordered_map<TokenPair, int, TokenPairHash> get_stats(const std::vector<WeightedChunk>& chunks) {
    std::unordered_map<TokenPair, int, TokenPairHash> stats;
    for (const auto& [tokens, count] : chunks) {
        for (std::size_t i = 0; i + 1 < tokens.size(); ++i) {
            stats[{tokens[i], tokens[i + 1]}] += count;
        }
    }
    return stats;
}

TokenSequence merge_pairs(const TokenSequence& tokens, const TokenPair& pair, TokenType new_token) {
    TokenSequence merged;
    merged.reserve(tokens.size());
    std::size_t i = 0;

    while (i < tokens.size()) {
        if (i + 1 < tokens.size() && tokens[i] == pair.first && tokens[i + 1] == pair.second) {
            merged.push_back(new_token);
            i += 2;  // Skip the pair
        } else {
            merged.push_back(tokens[i]);
            i += 1;
        }
    }

    return merged;
}

std::vector<TokenSpan> merge_pairs(const std::vector<TokenSpan>& spans, const TokenPair& pair, TokenType new_token) {
    std::vector<TokenSpan> merged;
    merged.reserve(spans.size());
    std::size_t i = 0;

    while (i < spans.size()) {
        if (i + 1 < spans.size() && spans[i].id == pair.first && spans[i + 1].id == pair.second) {
            merged.push_back({new_token, spans[i].start, spans[i + 1].end});
            i += 2;
        } else {
            merged.push_back(spans[i]);
            i += 1;
        }
    }

    return merged;
}

BpeTokenizer::BpeTokenizer(const std::vector<TokenPair>& merges,
                           const std::map<std::string, std::string>& special_texts)
    : merges_(merges), special_texts_(special_texts) {
    rebuild();
}

void BpeTokenizer::rebuild() {
    ranks_.clear();
    token_bytes_.clear();
    token_bytes_.reserve(kByteVocabSize + merges_.size());

    for (int b = 0; b < kByteVocabSize; ++b) {
        token_bytes_.push_back(std::string(1, static_cast<char>(b)));
    }

    for (std::size_t i = 0; i < merges_.size(); ++i) {
        const auto& [first, second] = merges_[i];
        if (first < 0 || second < 0 ||
            static_cast<std::size_t>(first) >= token_bytes_.size() ||
            static_cast<std::size_t>(second) >= token_bytes_.size()) {
            throw std::invalid_argument("BpeTokenizer - merge " + std::to_string(i) +
                                        " references an undefined token");
        }
        ranks_[merges_[i]] = static_cast<int>(i);
        token_bytes_.push_back(token_bytes_[first] + token_bytes_[second]);
    }

    specials_.clear();
    special_by_id_.clear();
    special_matchers_.clear();

    TokenType next_id = static_cast<TokenType>(token_bytes_.size());
    for (const auto& [role, text] : special_texts_) {
        if (text.empty()) {
            throw std::invalid_argument("BpeTokenizer - special token '" + role + "' has empty text");
        }
        specials_[role] = {text, next_id};
        special_by_id_[next_id] = text;
        special_matchers_.push_back({text, next_id});
        ++next_id;
    }

    std::stable_sort(special_matchers_.begin(), special_matchers_.end(),
                     [](const auto& a, const auto& b) { return a.first.size() > b.first.size(); });
}

void BpeTokenizer::learn(const std::string& corpus, int max_merges, bool debug) {
    if (max_merges < 0) {
        throw std::invalid_argument("BpeTokenizer::learn - max_merges must be non-negative");
    }

    // Identical chunks are merged identically, so count them once
    std::map<std::string, int> chunk_counts;
    for (const auto& chunk : split_chunks(corpus, 0, corpus.size())) {
        chunk_counts[corpus.substr(chunk.start, chunk.end - chunk.start)]++;
    }

    std::vector<WeightedChunk> chunks;
    chunks.reserve(chunk_counts.size());
    for (const auto& [text, count] : chunk_counts) {
        TokenSequence bytes;
        for (unsigned char c : text) {
            bytes.push_back(static_cast<TokenType>(c));
        }
        chunks.push_back({bytes, count});
    }

    if (debug) {
        std::cout << "BpeTokenizer::learn - " << chunks.size() << " distinct chunks from "
                  << corpus.size() << " bytes" << std::endl;
    }

    merges_.clear();

    while (static_cast<int>(merges_.size()) < max_merges) {
        auto stats = get_stats(chunks);
        if (stats.empty()) {
            if (debug) {
                std::cout << "BpeTokenizer::learn - No more pairs to merge, stopping" << std::endl;
            }
            break;
        }

        // Most frequent pair; ties go to the smallest pair so learning is deterministic
        auto best = stats.begin();
        for (auto it = stats.begin(); it != stats.end(); ++it) {
            if (it->second > best->second || (it->second == best->second && it->first < best->first)) {
                best = it;
            }
        }

        if (best->second < 2) {
            if (debug) {
                std::cout << "BpeTokenizer::learn - Most frequent pair occurs only once, stopping" << std::endl;
            }
            break;
        }

        TokenPair pair = best->first;
        TokenType new_token = kByteVocabSize + static_cast<TokenType>(merges_.size());
        for (auto& chunk : chunks) {
            chunk.first = merge_pairs(chunk.first, pair, new_token);
        }
        merges_.push_back(pair);

        if (debug && merges_.size() % 100 == 0) {
            std::cout << "BpeTokenizer::learn - Completed " << merges_.size() << " merges" << std::endl;
        }
    }

    rebuild();

    if (debug) {
        std::cout << "BpeTokenizer::learn - Finished with " << merges_.size()
                  << " merges, vocabulary size " << vocab_size() << std::endl;
    }
}

void BpeTokenizer::encode_plain(const std::string& text, std::size_t begin, std::size_t end,
                                std::vector<TokenSpan>& out) const {
    for (const auto& chunk : split_chunks(text, begin, end)) {
        std::vector<TokenSpan> spans;
        spans.reserve(chunk.end - chunk.start);
        for (std::size_t i = chunk.start; i < chunk.end; ++i) {
            spans.push_back({static_cast<TokenType>(static_cast<unsigned char>(text[i])), i, i + 1});
        }

        // Apply the lowest-ranked available merge until none applies
        while (spans.size() > 1) {
            int best_rank = INT_MAX;
            for (std::size_t i = 0; i + 1 < spans.size(); ++i) {
                auto it = ranks_.find({spans[i].id, spans[i + 1].id});
                if (it != ranks_.end() && it->second < best_rank) {
                    best_rank = it->second;
                }
            }
            if (best_rank == INT_MAX) {
                break;
            }
            spans = merge_pairs(spans, merges_[best_rank], kByteVocabSize + best_rank);
        }

        out.insert(out.end(), spans.begin(), spans.end());
    }
}

std::vector<TokenSpan> BpeTokenizer::encode(const std::string& text) const {
    std::vector<TokenSpan> result;
    std::size_t pos = 0;

    while (pos < text.size()) {
        // Earliest special-token occurrence; the longest one wins at equal positions
        std::size_t found = std::string::npos;
        const std::pair<std::string, TokenType>* match = nullptr;
        for (const auto& matcher : special_matchers_) {
            std::size_t at = text.find(matcher.first, pos);
            if (at != std::string::npos && (found == std::string::npos || at < found)) {
                found = at;
                match = &matcher;
            }
        }

        std::size_t plain_end = match ? found : text.size();
        encode_plain(text, pos, plain_end, result);

        if (!match) {
            break;
        }
        result.push_back({match->second, found, found + match->first.size()});
        pos = found + match->first.size();
    }

    return result;
}

std::string BpeTokenizer::decode(const TokenSequence& tokens) const {
    std::string decoded;
    for (TokenType token : tokens) {
        if (token >= 0 && static_cast<std::size_t>(token) < token_bytes_.size()) {
            decoded += token_bytes_[token];
            continue;
        }
        auto it = special_by_id_.find(token);
        if (it == special_by_id_.end()) {
            throw std::invalid_argument("BpeTokenizer::decode - unknown token id " + std::to_string(token));
        }
        decoded += it->second;
    }
    return decoded;
}

std::size_t BpeTokenizer::vocab_size() const {
    return token_bytes_.size() + specials_.size();
}

void BpeTokenizer::save(std::ostream& out) const {
    out << kFormatHeader << "\n";
    out << "merges " << merges_.size() << "\n";
    for (const auto& [first, second] : merges_) {
        out << first << " " << second << "\n";
    }
    for (const auto& [role, text] : special_texts_) {
        if (role.find_first_of(" \t\n") != std::string::npos || text.find_first_of("\t\n") != std::string::npos) {
            throw std::invalid_argument("BpeTokenizer::save - special token '" + role +
                                        "' cannot be stored in the line format");
        }
        out << "special " << role << "\t" << text << "\n";
    }
}

BpeTokenizer BpeTokenizer::load(std::istream& in) {
    std::string line;
    if (!std::getline(in, line) || line != kFormatHeader) {
        throw std::runtime_error("BpeTokenizer::load - missing '" + std::string(kFormatHeader) + "' header");
    }

    std::size_t merge_count = 0;
    if (!std::getline(in, line)) {
        throw std::runtime_error("BpeTokenizer::load - missing merge count");
    }
    {
        std::istringstream header(line);
        std::string keyword;
        if (!(header >> keyword >> merge_count) || keyword != "merges") {
            throw std::runtime_error("BpeTokenizer::load - malformed merge count line: " + line);
        }
    }

    // The count is untrusted: merges grow line by line
    std::vector<TokenPair> merges;
    for (std::size_t i = 0; i < merge_count; ++i) {
        if (!std::getline(in, line)) {
            throw std::runtime_error("BpeTokenizer::load - expected " + std::to_string(merge_count) +
                                     " merges, found " + std::to_string(i));
        }
        std::istringstream fields(line);
        TokenPair pair;
        if (!(fields >> pair.first >> pair.second)) {
            throw std::runtime_error("BpeTokenizer::load - malformed merge line: " + line);
        }
        merges.push_back(pair);
    }

    std::map<std::string, std::string> special_texts;
    while (std::getline(in, line)) {
        if (line.empty()) {
            continue;
        }
        const std::string prefix = "special ";
        std::size_t tab = line.find('\t');
        if (line.compare(0, prefix.size(), prefix) != 0 || tab == std::string::npos || tab <= prefix.size()) {
            throw std::runtime_error("BpeTokenizer::load - malformed special line: " + line);
        }
        special_texts[line.substr(prefix.size(), tab - prefix.size())] = line.substr(tab + 1);
    }

    return BpeTokenizer(merges, special_texts);
}

} // namespace toktrans
