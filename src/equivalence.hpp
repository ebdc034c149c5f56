#ifndef TOKTRANS_EQUIVALENCE_HPP
#define TOKTRANS_EQUIVALENCE_HPP

#include "tokenizer.hpp"

#include <string>
#include <vector>

namespace toktrans {

/**
 * @brief Built-in probe texts: English, German, digits, punctuation, whitespace runs and code
 */
const std::vector<std::string>& default_probe_texts();

/**
 * @brief Check whether two tokenizers are functionally identical
 *
 * True iff both have the same vocabulary size and special tokens, every id
 * decodes to the same text, and every probe (plus the special-token texts of
 * both tokenizers) encodes to identical ids and offsets.
 * @param a First tokenizer
 * @param b Second tokenizer
 * @return True if translation between the two can be skipped
 */
bool check_tokenizer_equivalence(const Tokenizer& a, const Tokenizer& b);

/**
 * @brief Same check with caller-supplied probe texts
 */
bool check_tokenizer_equivalence(const Tokenizer& a, const Tokenizer& b, const std::vector<std::string>& probes);

} // namespace toktrans

#endif // TOKTRANS_EQUIVALENCE_HPP
