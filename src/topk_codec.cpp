#include "topk_codec.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>

namespace toktrans {

namespace {

void check_k(int k, std::size_t vocab_size) {
    if (k <= 0) {
        throw InvalidK("k must be positive, got " + std::to_string(k));
    }
    if (static_cast<std::size_t>(k) > vocab_size) {
        throw InvalidK("k = " + std::to_string(k) + " exceeds vocabulary size " + std::to_string(vocab_size));
    }
}

// Remainder mass left for the ids outside the top-k, clamped to [eps, 1]
double remainder_mass(const float* encoded, int k) {
    double topk_mass = 0.0;
    for (int i = 0; i < k; ++i) {
        topk_mass += encoded[i];
    }
    double remainder = 1.0 - topk_mass;
    if (!std::isfinite(remainder) || remainder < kEpsilon) {
        return kEpsilon;
    }
    return std::min(remainder, 1.0);
}

std::size_t encoded_index(float value, std::size_t vocab_size) {
    if (!std::isfinite(value) || value < 0.0f || value != std::floor(value) ||
        static_cast<double>(value) >= static_cast<double>(vocab_size)) {
        throw std::invalid_argument("decode_topk - encoded id " + std::to_string(value) +
                                    " is not a valid index below " + std::to_string(vocab_size));
    }
    return static_cast<std::size_t>(value);
}

} // namespace

std::vector<float> encode_topk(const float* probs, std::size_t vocab_size, int k) {
    check_k(k, vocab_size);

    std::vector<std::size_t> order(vocab_size);
    std::iota(order.begin(), order.end(), 0);
    std::partial_sort(order.begin(), order.begin() + k, order.end(),
                      [probs](std::size_t a, std::size_t b) {
                          if (probs[a] != probs[b]) {
                              return probs[a] > probs[b];
                          }
                          return a < b;
                      });

    std::vector<float> encoded(2 * static_cast<std::size_t>(k));
    for (int i = 0; i < k; ++i) {
        encoded[i] = probs[order[i]];
        encoded[k + i] = static_cast<float>(order[i]);
    }
    return encoded;
}

Tensor3 encode_topk(const Tensor3& probs, int k) {
    check_k(k, probs.width);

    Tensor3 encoded(probs.batch, probs.sequence, 2 * static_cast<std::size_t>(k));
    for (std::size_t b = 0; b < probs.batch; ++b) {
        for (std::size_t s = 0; s < probs.sequence; ++s) {
            auto row = encode_topk(probs.row(b, s), probs.width, k);
            std::copy(row.begin(), row.end(), encoded.row(b, s));
        }
    }
    return encoded;
}

void decode_topk(const float* encoded, std::size_t vocab_size, int k, float* out) {
    check_k(k, vocab_size);

    std::size_t rest = vocab_size - static_cast<std::size_t>(k);
    float floor_mass = rest > 0 ? static_cast<float>(remainder_mass(encoded, k) / static_cast<double>(rest)) : 0.0f;
    std::fill(out, out + vocab_size, floor_mass);

    for (int i = 0; i < k; ++i) {
        out[encoded_index(encoded[k + i], vocab_size)] = encoded[i];
    }
}

Tensor3 decode_topk(const Tensor3& encoded, std::size_t vocab_size, int k) {
    check_k(k, vocab_size);
    if (encoded.width != 2 * static_cast<std::size_t>(k)) {
        throw InvalidK("encoded width " + std::to_string(encoded.width) + " does not match 2k = " +
                       std::to_string(2 * k));
    }

    Tensor3 probs(encoded.batch, encoded.sequence, vocab_size);
    for (std::size_t b = 0; b < encoded.batch; ++b) {
        for (std::size_t s = 0; s < encoded.sequence; ++s) {
            decode_topk(encoded.row(b, s), vocab_size, k, probs.row(b, s));
        }
    }
    return probs;
}

Tensor3 decode_topk_logits(const Tensor3& encoded, std::size_t vocab_size, int k) {
    check_k(k, vocab_size);
    if (encoded.width != 2 * static_cast<std::size_t>(k)) {
        throw InvalidK("encoded width " + std::to_string(encoded.width) + " does not match 2k = " +
                       std::to_string(2 * k));
    }

    std::size_t rest = vocab_size - static_cast<std::size_t>(k);
    Tensor3 logits(encoded.batch, encoded.sequence, vocab_size);
    for (std::size_t b = 0; b < encoded.batch; ++b) {
        for (std::size_t s = 0; s < encoded.sequence; ++s) {
            const float* in = encoded.row(b, s);
            float* out = logits.row(b, s);

            // log() in double: a float floor of 1e-64 would flush to zero
            double floor_mass = rest > 0 ? remainder_mass(in, k) / static_cast<double>(rest) : kEpsilon;
            std::fill(out, out + vocab_size, static_cast<float>(std::log(floor_mass)));
            for (int i = 0; i < k; ++i) {
                out[encoded_index(in[k + i], vocab_size)] =
                    static_cast<float>(std::log(static_cast<double>(in[i]) + kEpsilon));
            }
        }
    }
    return logits;
}

Tensor3 softmax(const Tensor3& logits) {
    Tensor3 probs(logits.batch, logits.sequence, logits.width);
    for (std::size_t b = 0; b < logits.batch; ++b) {
        for (std::size_t s = 0; s < logits.sequence; ++s) {
            const float* in = logits.row(b, s);
            float* out = probs.row(b, s);
            if (logits.width == 0) {
                continue;
            }
            float max_logit = *std::max_element(in, in + logits.width);
            double total = 0.0;
            for (std::size_t w = 0; w < logits.width; ++w) {
                total += std::exp(static_cast<double>(in[w]) - max_logit);
            }
            for (std::size_t w = 0; w < logits.width; ++w) {
                out[w] = static_cast<float>(std::exp(static_cast<double>(in[w]) - max_logit) / total);
            }
        }
    }
    return probs;
}

Tensor3 encode_logits_topk(const Tensor3& logits, int k) {
    return encode_topk(softmax(logits), k);
}

} // namespace toktrans
