#ifndef TOKTRANS_BPE_HPP
#define TOKTRANS_BPE_HPP

#include "tokenizer.hpp"

#include <istream>
#include <map>
#include <ostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace toktrans {

using TokenPair = std::pair<TokenType, TokenType>;

// Hash function for TokenPair to use in unordered_map
struct TokenPairHash {
    std::size_t operator()(const TokenPair& pair) const {
        return std::hash<TokenType>()(pair.first) ^ (std::hash<TokenType>()(pair.second) << 1);
    }
};

// A pre-tokenized chunk with the number of times it occurs in a corpus
using WeightedChunk = std::pair<TokenSequence, int>;

/**
 * @brief Split [begin, end) of text into pre-tokenization chunks
 *
 * A chunk is an optional single leading space followed by a run of word bytes
 * (alphanumeric or non-ASCII) or a run of punctuation bytes. Whitespace that
 * is not absorbed that way forms its own chunk. Merges never cross chunks.
 * @param text Source text
 * @param begin First byte to split
 * @param end One past the last byte to split
 * @return Chunk spans in order
 */
OffsetMapping split_chunks(const std::string& text, std::size_t begin, std::size_t end);

/**
 * @brief Count adjacent token pairs inside each chunk, weighted by chunk frequency
 * @param chunks Weighted token chunks
 * @return Pair -> frequency
 */
std::unordered_map<TokenPair, int, TokenPairHash> get_stats(const std::vector<WeightedChunk>& chunks);

/**
 * @brief Merge all occurrences of a token pair into a single new token
 * @param tokens Vector of token IDs to process
 * @param pair Pair of two token IDs to merge
 * @param new_token Token ID to use for the merged pair
 * @return New vector of tokens with all occurrences of the pair merged
 */
TokenSequence merge_pairs(const TokenSequence& tokens, const TokenPair& pair, TokenType new_token);

/**
 * @brief Span-preserving variant of merge_pairs: merged spans cover both halves
 */
std::vector<TokenSpan> merge_pairs(const std::vector<TokenSpan>& spans, const TokenPair& pair, TokenType new_token);

/**
 * @brief Byte-level BPE tokenizer
 *
 * Ids 0-255 are raw bytes, merge i creates id 256 + i and special tokens
 * follow the merges in role order. Offsets are byte offsets.
 */
class BpeTokenizer : public Tokenizer {
public:
    static constexpr TokenType kByteVocabSize = 256;

    /**
     * @brief Construct a BPE tokenizer from known merges
     * @param merges Merge list in rank order
     * @param special_texts Role -> special-token text
     */
    explicit BpeTokenizer(const std::vector<TokenPair>& merges = {},
                          const std::map<std::string, std::string>& special_texts = {});

    /**
     * @brief Learn merges from a corpus, replacing any existing ones
     * @param corpus Training text
     * @param max_merges Maximum number of merges to learn
     * @param debug Whether to print progress
     */
    void learn(const std::string& corpus, int max_merges, bool debug = false);

    std::vector<TokenSpan> encode(const std::string& text) const override;
    std::string decode(const TokenSequence& tokens) const override;
    std::size_t vocab_size() const override;
    SpecialTokenMap special_tokens() const override { return specials_; }

    const std::vector<TokenPair>& merges() const { return merges_; }

    /**
     * @brief Write merges and special tokens in the toktrans-bpe text format
     */
    void save(std::ostream& out) const;

    /**
     * @brief Read a tokenizer written by save()
     * @throws std::runtime_error on malformed input
     */
    static BpeTokenizer load(std::istream& in);

private:
    std::vector<TokenPair> merges_;
    std::unordered_map<TokenPair, int, TokenPairHash> ranks_;
    std::vector<std::string> token_bytes_;
    std::map<std::string, std::string> special_texts_;
    SpecialTokenMap specials_;
    std::unordered_map<TokenType, std::string> special_by_id_;
    // Special texts ordered longest first, for greedy matching
    std::vector<std::pair<std::string, TokenType>> special_matchers_;

    void rebuild();
    void encode_plain(const std::string& text, std::size_t begin, std::size_t end,
                      std::vector<TokenSpan>& out) const;
};

} // namespace toktrans

#endif // TOKTRANS_BPE_HPP
