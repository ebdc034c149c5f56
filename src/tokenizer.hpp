#ifndef TOKTRANS_TOKENIZER_HPP
#define TOKTRANS_TOKENIZER_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace toktrans {

using TokenType = int;
using TokenSequence = std::vector<TokenType>;

/**
 * @brief One token of an encoding with its byte span in the source text
 */
struct TokenSpan {
    TokenType id;
    std::size_t start;
    std::size_t end;

    bool operator==(const TokenSpan& other) const {
        return id == other.id && start == other.start && end == other.end;
    }
    bool operator!=(const TokenSpan& other) const { return !(*this == other); }
};

/**
 * @brief A (start, end) byte span, one per token
 */
struct Offset {
    std::size_t start;
    std::size_t end;

    bool operator==(const Offset& other) const { return start == other.start && end == other.end; }
    bool operator!=(const Offset& other) const { return !(*this == other); }
};

using OffsetMapping = std::vector<Offset>;

struct SpecialToken {
    std::string text;
    TokenType id;

    bool operator==(const SpecialToken& other) const { return text == other.text && id == other.id; }
    bool operator!=(const SpecialToken& other) const { return !(*this == other); }
};

// Role name ("bos", "eos", "unk", "pad", ...) -> special token
using SpecialTokenMap = std::map<std::string, SpecialToken>;

/**
 * @brief Tokenizer capability consumed by the translation core
 *
 * Offsets are byte offsets into the UTF-8 text passed to encode().
 * Implementations must be usable from several threads once constructed.
 */
class Tokenizer {
public:
    virtual ~Tokenizer() = default;

    /**
     * @brief Encode text into tokens with their byte spans
     * @param text Input text
     * @return Ordered tokens; spans are non-decreasing
     */
    virtual std::vector<TokenSpan> encode(const std::string& text) const = 0;

    /**
     * @brief Decode token ids back to text
     * @param tokens Token ids
     * @return Decoded text
     */
    virtual std::string decode(const TokenSequence& tokens) const = 0;

    /**
     * @brief Number of ids in the vocabulary, special tokens included
     */
    virtual std::size_t vocab_size() const = 0;

    /**
     * @brief Special tokens by role
     */
    virtual SpecialTokenMap special_tokens() const = 0;

    std::string decode_token(TokenType token) const { return decode(TokenSequence{token}); }

    // Role of a special token id, if the id is special
    std::optional<std::string> special_role(TokenType token) const;
};

TokenSequence token_ids(const std::vector<TokenSpan>& spans);
OffsetMapping offsets(const std::vector<TokenSpan>& spans);

} // namespace toktrans

#endif // TOKTRANS_TOKENIZER_HPP
