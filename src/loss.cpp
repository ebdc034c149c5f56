#include "loss.hpp"
#include "errors.hpp"
#include "topk_codec.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace toktrans {

Tensor3 probs_to_logits(const Tensor3& probs) {
    Tensor3 logits(probs.batch, probs.sequence, probs.width);
    for (std::size_t i = 0; i < probs.values.size(); ++i) {
        logits.values[i] = static_cast<float>(std::log(static_cast<double>(probs.values[i]) + kEpsilon));
    }
    return logits;
}

namespace {

struct ScoredLoss {
    double total = 0.0;
    std::size_t count = 0;
};

ScoredLoss score(const Tensor3& logits, const std::vector<TokenSequence>& labels) {
    if (labels.size() != logits.batch) {
        throw ShapeMismatch("logits have batch " + std::to_string(logits.batch) + " but " +
                            std::to_string(labels.size()) + " label sequences were given");
    }

    ScoredLoss scored;
    for (std::size_t b = 0; b < labels.size(); ++b) {
        const TokenSequence& seq = labels[b];
        if (seq.size() > logits.sequence) {
            throw ShapeMismatch("label sequence " + std::to_string(b) + " is longer than the logits");
        }
        for (std::size_t t = 0; t + 1 < seq.size(); ++t) {
            TokenType target = seq[t + 1];
            if (target < 0 || static_cast<std::size_t>(target) >= logits.width) {
                throw std::invalid_argument("causal_lm_loss - label " + std::to_string(target) +
                                            " is outside the vocabulary");
            }

            const float* row = logits.row(b, t);
            double max_logit = *std::max_element(row, row + logits.width);
            double sum = 0.0;
            for (std::size_t w = 0; w < logits.width; ++w) {
                sum += std::exp(static_cast<double>(row[w]) - max_logit);
            }
            double log_prob = static_cast<double>(row[target]) - max_logit - std::log(sum);
            scored.total -= log_prob;
            ++scored.count;
        }
    }
    return scored;
}

} // namespace

double causal_lm_loss(const Tensor3& logits, const std::vector<TokenSequence>& labels) {
    ScoredLoss scored = score(logits, labels);
    return scored.count > 0 ? scored.total / static_cast<double>(scored.count) : 0.0;
}

double causal_lm_nll(const Tensor3& logits, const std::vector<TokenSequence>& labels) {
    return score(logits, labels).total;
}

} // namespace toktrans
