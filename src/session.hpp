#ifndef TOKTRANS_SESSION_HPP
#define TOKTRANS_SESSION_HPP

#include "alignment.hpp"
#include "redistribute.hpp"
#include "tensor.hpp"
#include "tokenizer.hpp"
#include "translation_map.hpp"

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

namespace toktrans {

/**
 * @brief Owns the translation maps, split caches and equivalence results for a
 * set of tokenizer pairs
 *
 * Tokenizers are identified by address and must outlive the session. A map
 * for a given (source, target) pair is built once even when several threads
 * ask for it at the same time; later lookups return the same immutable map.
 */
class TranslationSession {
public:
    explicit TranslationSession(TranslationConfig config = TranslationConfig());

    TranslationSession(const TranslationSession&) = delete;
    TranslationSession& operator=(const TranslationSession&) = delete;

    /**
     * @brief Translation map from source ids to target tokens, built on first use
     * @throws whatever the tokenizers throw during the build; the pair can be retried
     */
    std::shared_ptr<const TranslationMap> translation_map(const Tokenizer& source, const Tokenizer& target);

    // Split-map cache for text pieces headed from foreign to standard
    SplitMapCache& split_cache(const Tokenizer& foreign, const Tokenizer& standard);

    // Memoized check_tokenizer_equivalence
    bool equivalent(const Tokenizer& a, const Tokenizer& b);

    /**
     * @brief Translate foreign-vocabulary rows for an aligned batch
     *
     * Elements that failed alignment are reported failed without being
     * translated; their rows are zero.
     * @param foreign [batch, foreign length, foreign vocab] probabilities or logits
     * @param batch Output of align_batch for the same texts
     * @param foreign Foreign tokenizer
     * @param standard Standard tokenizer
     * @return [batch, standard length, standard vocab] probabilities
     */
    TranslationResult translate(const Tensor3& foreign_probs,
                                const AlignedBatch& batch,
                                const Tokenizer& foreign,
                                const Tokenizer& standard);

    TranslationConfig config() const;
    void set_config(const TranslationConfig& config);

    std::size_t map_count() const;

    // Drops every cached map, split cache and equivalence result; references from split_cache() dangle
    void clear();

private:
    using Key = std::pair<const Tokenizer*, const Tokenizer*>;
    using MapFuture = std::shared_future<std::shared_ptr<const TranslationMap>>;

    mutable std::mutex mutex_;
    TranslationConfig config_;
    std::map<Key, MapFuture> maps_;
    std::map<Key, std::unique_ptr<SplitMapCache>> split_caches_;
    std::map<Key, bool> equivalence_;
};

} // namespace toktrans

#endif // TOKTRANS_SESSION_HPP
