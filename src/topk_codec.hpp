#ifndef TOKTRANS_TOPK_CODEC_HPP
#define TOKTRANS_TOPK_CODEC_HPP

#include "tensor.hpp"

#include <cstddef>
#include <vector>

namespace toktrans {

// Floor for remainder mass and for log() arguments
constexpr double kEpsilon = 1e-64;

/**
 * @brief Encode one probability row to its top-k (values, ids)
 * @param probs Row of vocab_size probabilities
 * @param vocab_size Row length
 * @param k Number of entries to keep
 * @return 2k floats: k values in descending order, then k ids
 * @throws InvalidK if k <= 0 or k > vocab_size
 */
std::vector<float> encode_topk(const float* probs, std::size_t vocab_size, int k);

/**
 * @brief Encode every row of a [batch, sequence, vocab] probability tensor
 * @return [batch, sequence, 2k] tensor
 */
Tensor3 encode_topk(const Tensor3& probs, int k);

/**
 * @brief Decode one 2k-wide row into a full probability row
 *
 * Entries outside the top-k share the remainder mass uniformly; top-k
 * entries are written with their exact values.
 * @param encoded 2k floats
 * @param vocab_size Output row length
 * @param k Number of encoded entries
 * @param out Output row of vocab_size floats
 * @throws InvalidK on a bad k, std::invalid_argument on a bad id
 */
void decode_topk(const float* encoded, std::size_t vocab_size, int k, float* out);

/**
 * @brief Decode a [batch, sequence, 2k] tensor into [batch, sequence, vocab_size] probabilities
 */
Tensor3 decode_topk(const Tensor3& encoded, std::size_t vocab_size, int k);

/**
 * @brief Decode into log space: log(floor) everywhere, log(value + eps) at the top-k ids
 */
Tensor3 decode_topk_logits(const Tensor3& encoded, std::size_t vocab_size, int k);

// Row-wise softmax over the last dimension
Tensor3 softmax(const Tensor3& logits);

// Server-side wire step: softmax followed by encode_topk
Tensor3 encode_logits_topk(const Tensor3& logits, int k);

} // namespace toktrans

#endif // TOKTRANS_TOPK_CODEC_HPP
