#ifndef TOKTRANS_LOSS_HPP
#define TOKTRANS_LOSS_HPP

#include "tensor.hpp"
#include "tokenizer.hpp"

#include <vector>

namespace toktrans {

/**
 * @brief Turn probabilities into logits a standard loss can consume: log(p + eps)
 */
Tensor3 probs_to_logits(const Tensor3& probs);

/**
 * @brief Mean next-token cross-entropy
 *
 * Row t of element b is scored against labels[b][t + 1] for every
 * t < labels[b].size() - 1. Elements with fewer than two labels contribute
 * nothing.
 * @param logits [batch, sequence, vocab] logits
 * @param labels Token ids per element, no longer than the sequence dimension
 * @return Average loss over all scored positions; 0 when there are none
 * @throws ShapeMismatch on a batch or length disagreement
 * @throws std::invalid_argument on a label outside the vocabulary
 */
double causal_lm_loss(const Tensor3& logits, const std::vector<TokenSequence>& labels);

/**
 * @brief Summed next-token cross-entropy, the negative log-likelihood of the text
 *
 * Unlike the mean, comparable between tokenizations of different granularity.
 * Same scoring and errors as causal_lm_loss().
 */
double causal_lm_nll(const Tensor3& logits, const std::vector<TokenSequence>& labels);

} // namespace toktrans

#endif // TOKTRANS_LOSS_HPP
