#include "redistribute.hpp"
#include "equivalence.hpp"
#include "errors.hpp"
#include "topk_codec.hpp"

#include <algorithm>
#include <iostream>
#include <optional>
#include <string>

namespace toktrans {

namespace {

// Where a standard boundary falls in the foreign sequence
struct Anchor {
    bool found;
    std::size_t token;  // foreign token k overlapping the boundary
    std::size_t depth;  // bytes from the start of k to the boundary
};

Anchor locate(const OffsetMapping& foreign_offsets, std::size_t boundary) {
    for (std::size_t k = 0; k < foreign_offsets.size(); ++k) {
        const auto& span = foreign_offsets[k];
        if (span.start == span.end) {
            continue;
        }
        if (span.start <= boundary && boundary < span.end) {
            return {true, k, boundary - span.start};
        }
        if (span.start >= boundary) {
            return {true, k, 0};
        }
    }
    if (foreign_offsets.empty()) {
        return {false, 0, 0};
    }
    // Past the end: the last foreign row predicts whatever follows the text
    return {true, foreign_offsets.size(), 0};
}

// Foreign token holding the last byte before end; depth is measured up to end
Anchor locate_end(const OffsetMapping& foreign_offsets, std::size_t end) {
    Anchor last{false, 0, 0};
    for (std::size_t k = 0; k < foreign_offsets.size(); ++k) {
        const auto& span = foreign_offsets[k];
        if (span.start == span.end) {
            continue;
        }
        if (span.start < end && end <= span.end) {
            return {true, k, end - span.start};
        }
        if (span.start >= end) {
            return {false, 0, 0};
        }
        last = {true, k, span.end - span.start};
    }
    // Past the end: the whole of the last token
    return last;
}

std::size_t boundary_of(const OffsetMapping& std_offsets, std::size_t j) {
    return j + 1 < std_offsets.size() ? std_offsets[j + 1].start : std_offsets[j].end;
}

std::size_t longest(const std::vector<OffsetMapping>& offsets) {
    std::size_t length = 0;
    for (const auto& o : offsets) {
        length = std::max(length, o.size());
    }
    return length;
}

// Bytes of a token's text covered by the first depth bytes of its span; a padded special token counts whole
std::size_t text_depth(const Offset& span, std::size_t depth, const std::string& text) {
    if (depth >= span.end - span.start) {
        return text.size();
    }
    return std::min(depth, text.size());
}

// Mass on ids whose text starts with the first depth bytes of prefix; the whole row for depth 0
double consistent_mass(const float* probs, std::size_t width, const TranslationMap& to_map,
                       const std::string& prefix, std::size_t depth) {
    double mass = 0.0;
    for (std::size_t v = 0; v < width; ++v) {
        double p = probs[v];
        if (p <= 0.0) {
            continue;
        }
        if (depth == 0) {
            mass += p;
            continue;
        }
        const std::string& text = to_map.text(static_cast<TokenType>(v));
        if (text.size() >= depth && text.compare(0, depth, prefix, 0, depth) == 0) {
            mass += p;
        }
    }
    return mass;
}

/**
 * @brief Probability that the foreign model reads the text from one anchor to another
 *
 * Prefix mass at the end anchor over prefix mass at the start anchor, times
 * the probability of every observed foreign token completed in between.
 * Along one element these ratios multiply out to the foreign path
 * probability of the text.
 */
std::optional<double> chained_mass(const Tensor3& probs,
                                   std::size_t b,
                                   const TokenSequence& ids,
                                   const OffsetMapping& offsets,
                                   const TranslationMap& to_map,
                                   const Anchor& from,
                                   const Anchor& to) {
    const std::string& from_text = to_map.text(ids[from.token]);
    const std::string& to_text = to_map.text(ids[to.token]);
    if (from_text.empty() || to_text.empty()) {
        return std::nullopt;
    }

    double denominator = consistent_mass(probs.row(b, from.token - 1), probs.width, to_map, from_text,
                                         text_depth(offsets[from.token], from.depth, from_text));
    if (denominator <= 0.0) {
        return std::nullopt;
    }

    double numerator = consistent_mass(probs.row(b, to.token - 1), probs.width, to_map, to_text,
                                       text_depth(offsets[to.token], to.depth, to_text));
    for (std::size_t m = from.token; m < to.token; ++m) {
        numerator *= probs.row(b, m - 1)[ids[m]];
    }
    return std::min(1.0, numerator / denominator);
}

/**
 * @brief Projects foreign rows of one batch element onto the standard vocabulary
 */
class RowProjector {
public:
    RowProjector(const Tokenizer& std_tok,
                 SplitMapCache& split_cache,
                 const TranslationMap& to_map,
                 std::size_t foreign_width,
                 const TranslationConfig& config)
        : std_tok_(std_tok),
          split_cache_(split_cache),
          to_map_(to_map),
          foreign_width_(foreign_width),
          std_vocab_(to_map.target_vocab_size()),
          config_(config),
          scratch_(std_vocab_, 0.0) {}

    TranslationStats stats;

    void uniform(float* out) {
        std::fill(out, out + std_vocab_, static_cast<float>(1.0 / static_cast<double>(std_vocab_)));
        ++stats.unanchored_rows;
    }

    // Boundary at the start of a foreign token: every id goes to its first fragment
    void project_whole(const float* probs) {
        begin_row();
        for (std::size_t v = 0; v < foreign_width_; ++v) {
            double p = probs[v];
            if (p <= 0.0) {
                continue;
            }
            auto target = to_map_.first(static_cast<TokenType>(v));
            if (target && static_cast<std::size_t>(*target) < std_vocab_) {
                scratch_[*target] += p;
            } else {
                floor_mass_ += miss(v, p);
            }
        }
    }

    // Boundary depth bytes into the foreign token observed at this position
    bool project_partial(const float* probs, TokenType observed, std::size_t depth) {
        const std::string& observed_text = to_map_.text(observed);
        std::string prefix = observed_text.substr(0, depth);

        begin_row();
        double row_mass = 0.0;
        double candidate_mass = 0.0;

        for (std::size_t v = 0; v < foreign_width_; ++v) {
            double p = probs[v];
            if (p <= 0.0) {
                continue;
            }
            row_mass += p;

            const std::string& text = to_map_.text(static_cast<TokenType>(v));
            if (!to_map_.contains(static_cast<TokenType>(v)) || text.empty()) {
                floor_mass_ += miss(v, p);
                continue;
            }
            if (text.size() <= depth || text.compare(0, depth, prefix) != 0) {
                continue;
            }

            const auto& pieces = split_cache_.split(std_tok_, text.substr(depth));
            if (pieces.empty() || static_cast<std::size_t>(pieces.front().id) >= std_vocab_) {
                floor_mass_ += miss(v, p);
                continue;
            }
            scratch_[pieces.front().id] += p;
            candidate_mass += p;
        }

        if (candidate_mass <= 0.0) {
            return false;
        }

        // Candidates take over the mass of every translatable id
        double scale = (row_mass - row_missed_) / candidate_mass;
        for (double& value : scratch_) {
            value *= scale;
        }
        ++stats.partial_rows;
        return true;
    }

    // The observed standard token takes mass; the other ids share what is left of the row
    void settle_observed(TokenType observed, double mass) {
        if (observed < 0 || static_cast<std::size_t>(observed) >= std_vocab_) {
            return;
        }
        double total = 0.0;
        for (double value : scratch_) {
            total += value;
        }
        mass = std::min(std::max(mass, 0.0), total);

        double others = total - scratch_[observed];
        double rest = total - mass;
        if (others > 0.0) {
            double scale = rest / others;
            for (double& value : scratch_) {
                value *= scale;
            }
        } else if (rest > 0.0 && std_vocab_ > 1) {
            double share = rest / static_cast<double>(std_vocab_ - 1);
            for (double& value : scratch_) {
                value += share;
            }
        }
        scratch_[observed] = mass;
    }

    void emit(float* out) const {
        double fill = floor_mass_ / static_cast<double>(std_vocab_);
        for (std::size_t s = 0; s < std_vocab_; ++s) {
            out[s] = static_cast<float>(scratch_[s] + fill);
        }
    }

private:
    void begin_row() {
        std::fill(scratch_.begin(), scratch_.end(), 0.0);
        floor_mass_ = 0.0;
        row_missed_ = 0.0;
    }

    // Returns the mass to spread uniformly
    double miss(std::size_t v, double p) {
        if (config_.miss_policy == MissPolicy::Error) {
            throw TranslationMapMiss("foreign token " + std::to_string(v) + " has no standard translation");
        }
        if (config_.debug) {
            std::cout << "RowProjector::miss - Foreign token " << v << " has no standard translation" << std::endl;
        }
        ++stats.missed_tokens;
        row_missed_ += p;
        if (config_.miss_policy == MissPolicy::FloorFill) {
            return p;
        }
        stats.missed_mass += p;
        return 0.0;
    }

    const Tokenizer& std_tok_;
    SplitMapCache& split_cache_;
    const TranslationMap& to_map_;
    std::size_t foreign_width_;
    std::size_t std_vocab_;
    const TranslationConfig& config_;
    std::vector<double> scratch_;
    double floor_mass_ = 0.0;
    double row_missed_ = 0.0;
};

void merge_stats(TranslationStats& total, const TranslationStats& element) {
    total.rows += element.rows;
    total.unanchored_rows += element.unanchored_rows;
    total.partial_rows += element.partial_rows;
    total.missed_tokens += element.missed_tokens;
    total.missed_mass += element.missed_mass;
}

} // namespace

TranslationResult translate_equivalent(const Tensor3& foreign,
                                       const std::vector<OffsetMapping>& offsets_std,
                                       const TranslationMap& from_map,
                                       const TranslationConfig& config) {
    if (offsets_std.size() != foreign.batch) {
        throw ShapeMismatch("foreign tensor has batch " + std::to_string(foreign.batch) + " but " +
                            std::to_string(offsets_std.size()) + " standard offset lists were given");
    }
    std::size_t std_vocab = from_map.source_vocab_size();
    if (std_vocab == 0) {
        throw ShapeMismatch("standard vocabulary is empty");
    }
    std::size_t length = longest(offsets_std);
    if (length > foreign.sequence) {
        throw ShapeMismatch("standard sequence of length " + std::to_string(length) +
                            " is longer than the foreign tensor (" + std::to_string(foreign.sequence) + ")");
    }

    Tensor3 converted;
    if (config.input == InputKind::Logits) {
        converted = softmax(foreign);
    }
    const Tensor3& probs = config.input == InputKind::Logits ? converted : foreign;

    // Standard id -> foreign column, resolved once for the whole batch
    std::vector<long long> column(std_vocab, -1);
    for (std::size_t s = 0; s < std_vocab; ++s) {
        auto f = from_map.exact(static_cast<TokenType>(s));
        if (f && static_cast<std::size_t>(*f) < foreign.width) {
            column[s] = *f;
        }
    }

    TranslationResult result;
    result.probs = Tensor3(foreign.batch, length, std_vocab);
    result.elements.resize(foreign.batch);
    result.stats.fast_path = true;

    for (std::size_t b = 0; b < foreign.batch; ++b) {
        for (std::size_t j = 0; j < offsets_std[b].size(); ++j) {
            const float* in = probs.row(b, j);
            float* out = result.probs.row(b, j);
            for (std::size_t s = 0; s < std_vocab; ++s) {
                if (column[s] >= 0) {
                    out[s] = in[column[s]];
                }
            }
            ++result.stats.rows;
        }
    }

    if (config.debug) {
        std::cout << "translate_equivalent - Copied " << result.stats.rows << " rows through the direct index map"
                  << std::endl;
    }
    return result;
}

TranslationResult translate_logits_to_probs_std(const Tensor3& foreign,
                                                const std::vector<OffsetMapping>& offsets_foreign,
                                                const std::vector<OffsetMapping>& offsets_std,
                                                const Tokenizer& foreign_tok,
                                                const Tokenizer& std_tok,
                                                SplitMapCache& split_cache,
                                                const TranslationMap& to_map,
                                                const TranslationMap& from_map,
                                                const std::vector<TokenSequence>& foreign_ids,
                                                const std::vector<TokenSequence>& std_ids,
                                                bool skip_equivalent,
                                                const TranslationConfig& config) {
    std::size_t batch = foreign.batch;
    if (offsets_foreign.size() != batch || offsets_std.size() != batch || foreign_ids.size() != batch ||
        std_ids.size() != batch) {
        throw ShapeMismatch("batch size disagreement: tensor " + std::to_string(batch) + ", foreign offsets " +
                            std::to_string(offsets_foreign.size()) + ", standard offsets " +
                            std::to_string(offsets_std.size()) + ", foreign ids " +
                            std::to_string(foreign_ids.size()) + ", standard ids " + std::to_string(std_ids.size()));
    }
    std::size_t std_vocab = to_map.target_vocab_size();
    if (std_vocab == 0 || foreign.width == 0) {
        throw ShapeMismatch("zero-width vocabulary");
    }
    if (std_vocab != std_tok.vocab_size()) {
        throw ShapeMismatch("translation map targets " + std::to_string(std_vocab) +
                            " ids but the standard tokenizer has " + std::to_string(std_tok.vocab_size()));
    }

    if (skip_equivalent && check_tokenizer_equivalence(foreign_tok, std_tok)) {
        return translate_equivalent(foreign, offsets_std, from_map, config);
    }

    Tensor3 converted;
    if (config.input == InputKind::Logits) {
        converted = softmax(foreign);
    }
    const Tensor3& probs = config.input == InputKind::Logits ? converted : foreign;

    TranslationResult result;
    result.probs = Tensor3(batch, longest(offsets_std), std_vocab);
    result.elements.resize(batch);

    for (std::size_t b = 0; b < batch; ++b) {
        RowProjector projector(std_tok, split_cache, to_map, foreign.width, config);
        const OffsetMapping& f_offsets = offsets_foreign[b];
        const OffsetMapping& s_offsets = offsets_std[b];

        try {
            if (f_offsets.size() != foreign_ids[b].size() || s_offsets.size() != std_ids[b].size()) {
                throw OffsetMisalignment("token ids and offsets have different lengths");
            }
            if (f_offsets.size() > foreign.sequence) {
                throw OffsetMisalignment("foreign sequence of length " + std::to_string(f_offsets.size()) +
                                         " does not fit the tensor (" + std::to_string(foreign.sequence) + ")");
            }

            for (TokenType id : foreign_ids[b]) {
                if (id < 0 || static_cast<std::size_t>(id) >= foreign.width) {
                    throw OffsetMisalignment("foreign token id " + std::to_string(id) +
                                             " is outside the foreign tensor width");
                }
            }

            for (std::size_t j = 0; j < s_offsets.size(); ++j) {
                float* out = result.probs.row(b, j);
                Anchor anchor = locate(f_offsets, boundary_of(s_offsets, j));
                ++projector.stats.rows;

                if (!anchor.found || anchor.token == 0) {
                    projector.uniform(out);
                    continue;
                }

                const float* in = probs.row(b, anchor.token - 1);
                bool projected = true;
                if (anchor.depth == 0) {
                    projector.project_whole(in);
                } else {
                    TokenType observed = foreign_ids[b][anchor.token];
                    if (!to_map.contains(observed)) {
                        throw OffsetMisalignment("foreign token id " + std::to_string(observed) +
                                                 " is outside the foreign vocabulary");
                    }
                    if (anchor.depth >= to_map.text(observed).size()) {
                        projector.project_whole(in);
                    } else {
                        projected = projector.project_partial(in, observed, anchor.depth);
                    }
                }
                if (!projected) {
                    projector.uniform(out);
                    continue;
                }

                // The standard token read next may run across several foreign tokens
                if (j + 1 < s_offsets.size() && anchor.token < f_offsets.size()) {
                    Anchor end = locate_end(f_offsets, s_offsets[j + 1].end);
                    if (end.found &&
                        (end.token > anchor.token || (end.token == anchor.token && end.depth > anchor.depth))) {
                        auto mass = chained_mass(probs, b, foreign_ids[b], f_offsets, to_map, anchor, end);
                        if (mass) {
                            projector.settle_observed(std_ids[b][j + 1], *mass);
                        }
                    }
                }
                projector.emit(out);
            }

            merge_stats(result.stats, projector.stats);
        } catch (const std::runtime_error& e) {
            std::fill(result.probs.row(b, 0), result.probs.row(b, 0) + result.probs.sequence * std_vocab, 0.0f);
            result.elements[b].ok = false;
            result.elements[b].error = e.what();
            ++result.stats.failed_elements;
            if (config.debug) {
                std::cout << "translate_logits_to_probs_std - Element " << b << " failed: " << e.what() << std::endl;
            }
        }
    }

    if (config.debug) {
        std::cout << "translate_logits_to_probs_std - " << result.stats.rows << " rows, "
                  << result.stats.partial_rows << " partial, " << result.stats.unanchored_rows << " unanchored, "
                  << result.stats.missed_tokens << " misses (" << result.stats.missed_mass << " mass dropped)"
                  << std::endl;
    }
    return result;
}

} // namespace toktrans
