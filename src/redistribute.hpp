#ifndef TOKTRANS_REDISTRIBUTE_HPP
#define TOKTRANS_REDISTRIBUTE_HPP

#include "tensor.hpp"
#include "tokenizer.hpp"
#include "translation_map.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace toktrans {

// What the foreign tensor holds
enum class InputKind {
    Probabilities,
    Logits
};

// What happens to the mass of a foreign id with no translation
enum class MissPolicy {
    Drop,       // mass is lost and counted
    FloorFill,  // mass is spread uniformly over the standard vocabulary
    Error       // TranslationMapMiss fails the batch element
};

struct TranslationConfig {
    InputKind input = InputKind::Probabilities;
    MissPolicy miss_policy = MissPolicy::Drop;
    bool skip_equivalent = true;
    bool debug = false;
};

struct TranslationStats {
    std::size_t rows = 0;               // standard rows written
    std::size_t unanchored_rows = 0;    // rows with no predicting foreign row (uniform)
    std::size_t partial_rows = 0;       // rows whose boundary fell inside a foreign token
    std::size_t missed_tokens = 0;      // foreign (row, id) entries without a translation
    double missed_mass = 0.0;
    std::size_t failed_elements = 0;
    bool fast_path = false;
};

struct ElementStatus {
    bool ok = true;
    std::string error;
};

struct TranslationResult {
    Tensor3 probs;                        // [batch, max standard length, standard vocab]
    std::vector<ElementStatus> elements;
    TranslationStats stats;
};

/**
 * @brief Copy foreign rows onto the standard vocabulary through a direct index map
 *
 * Only valid for equivalent tokenizers: standard row j is foreign row j and
 * standard id s takes the mass of from_map.exact(s).
 */
TranslationResult translate_equivalent(const Tensor3& foreign,
                                       const std::vector<OffsetMapping>& offsets_std,
                                       const TranslationMap& from_map,
                                       const TranslationConfig& config = TranslationConfig());

/**
 * @brief Re-project foreign-vocabulary distributions onto the standard vocabulary
 *
 * Standard row j predicts the token after j, which begins at boundary c.
 * The foreign token k overlapping c is located; foreign row k - 1 predicted
 * it. When c is the start of k, each foreign id's mass goes to the first
 * standard token of its text. When c lies d bytes into k, only ids whose
 * text agrees with k over those d bytes are kept, the rest of their text is
 * split by the standard tokenizer (memoized in split_cache) and the first
 * piece receives the mass, rescaled to the row total. Mass landing on the
 * same standard id is summed.
 *
 * The standard token actually read after j (std_ids[j + 1]) may run across
 * several foreign tokens k..m. It receives the chained probability of the
 * foreign path over its text: the prefix mass where it ends over the prefix
 * mass at c, times the probability of each observed foreign token completed
 * in between. The other standard ids keep their projected proportions and
 * share the rest of the row. Rows are not renormalized.
 *
 * @param foreign [batch, foreign length, foreign width] probabilities or logits
 * @param offsets_foreign Foreign offsets per element, original-text coordinates
 * @param offsets_std Standard offsets per element
 * @param foreign_tok Foreign tokenizer
 * @param std_tok Standard tokenizer
 * @param split_cache Split cache for std_tok
 * @param to_map Foreign -> standard translation map
 * @param from_map Standard -> foreign translation map (fast path)
 * @param foreign_ids Foreign token ids per element
 * @param std_ids Standard token ids per element
 * @param skip_equivalent Use the direct index map when the tokenizers are equivalent
 * @param config Input kind, miss policy, debug output
 * @return Standard probabilities with per-element status
 * @throws ShapeMismatch when batch sizes disagree
 */
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
                                                const TranslationConfig& config = TranslationConfig());

} // namespace toktrans

#endif // TOKTRANS_REDISTRIBUTE_HPP
