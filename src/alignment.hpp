#ifndef TOKTRANS_ALIGNMENT_HPP
#define TOKTRANS_ALIGNMENT_HPP

#include "tokenizer.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace toktrans {

/**
 * @brief One replaced special-token span: where it was in the original
 * text and where its replacement sits in the rewritten text
 */
struct OffsetCorrection {
    std::size_t orig_start;
    std::size_t orig_end;
    std::size_t rewritten_start;
    std::size_t rewritten_end;
};

/**
 * @brief Text rewritten for the foreign tokenizer plus its correction table
 */
struct SpecialTextRewrite {
    std::string text;
    std::vector<OffsetCorrection> corrections;
};

/**
 * @brief Replace the standard tokenizer's special-token texts with the foreign equivalents
 *
 * A standard special token maps to the foreign special token of the same
 * role, or is removed when the foreign tokenizer has no such role. At each
 * position the longest matching special text is replaced. Pure function.
 * @param texts Original texts (standard-tokenizer side)
 * @param std_tok Standard tokenizer
 * @param foreign_tok Foreign tokenizer
 * @return One rewrite per text; a text without special tokens gets an empty table
 */
std::vector<SpecialTextRewrite> translate_special_token_text(const std::vector<std::string>& texts,
                                                             const Tokenizer& std_tok,
                                                             const Tokenizer& foreign_tok);

/**
 * @brief Remap offsets computed on rewritten text into original-text coordinates
 * @param offsets Offsets on rewrite.text
 * @param rewrite Rewritten text and correction table
 * @return Offsets in original coordinates
 * @throws OffsetMisalignment if the table or offsets do not fit the rewritten text
 */
OffsetMapping pad_offsets(const OffsetMapping& offsets, const SpecialTextRewrite& rewrite);

// Throws OffsetMisalignment unless spans are well formed and within text_length
void check_offsets(const OffsetMapping& offsets, std::size_t text_length);

/**
 * @brief A text batch tokenized by both tokenizers, offsets in original coordinates
 *
 * errors[b] is empty when element b is usable; otherwise its sequences are empty.
 */
struct AlignedBatch {
    std::vector<TokenSequence> std_ids;
    std::vector<OffsetMapping> std_offsets;
    std::vector<std::string> foreign_texts;
    std::vector<TokenSequence> foreign_ids;
    std::vector<OffsetMapping> foreign_offsets;
    std::vector<std::string> errors;

    std::size_t size() const { return std_ids.size(); }
    bool ok(std::size_t b) const { return errors[b].empty(); }
};

/**
 * @brief Tokenize texts with both tokenizers so positions refer to the same characters
 * @param texts Original texts
 * @param std_tok Standard tokenizer, run on the originals
 * @param foreign_tok Foreign tokenizer, run on the special-token rewrites
 * @param debug Whether to print failed elements
 */
AlignedBatch align_batch(const std::vector<std::string>& texts,
                         const Tokenizer& std_tok,
                         const Tokenizer& foreign_tok,
                         bool debug = false);

} // namespace toktrans

#endif // TOKTRANS_ALIGNMENT_HPP
