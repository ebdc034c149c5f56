#include "session.hpp"
#include "equivalence.hpp"
#include "errors.hpp"

#include <exception>
#include <iostream>

namespace toktrans {

TranslationSession::TranslationSession(TranslationConfig config) : config_(config) {}

std::shared_ptr<const TranslationMap> TranslationSession::translation_map(const Tokenizer& source,
                                                                          const Tokenizer& target) {
    Key key(&source, &target);
    std::promise<std::shared_ptr<const TranslationMap>> promise;
    MapFuture future;
    bool builder = false;
    bool debug = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = maps_.find(key);
        if (it != maps_.end()) {
            future = it->second;
        } else {
            future = promise.get_future().share();
            maps_.emplace(key, future);
            builder = true;
            debug = config_.debug;
        }
    }

    if (!builder) {
        return future.get();
    }

    // Build outside the lock; other callers for this pair wait on the future
    try {
        auto map = std::make_shared<const TranslationMap>(TranslationMap::build(source, target, debug));
        promise.set_value(map);
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            maps_.erase(key);
        }
        promise.set_exception(std::current_exception());
    }

    return future.get();
}

SplitMapCache& TranslationSession::split_cache(const Tokenizer& foreign, const Tokenizer& standard) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& cache = split_caches_[Key(&foreign, &standard)];
    if (!cache) {
        cache = std::make_unique<SplitMapCache>();
    }
    return *cache;
}

bool TranslationSession::equivalent(const Tokenizer& a, const Tokenizer& b) {
    Key key(&a, &b);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = equivalence_.find(key);
        if (it != equivalence_.end()) {
            return it->second;
        }
    }

    bool result = check_tokenizer_equivalence(a, b);

    std::lock_guard<std::mutex> lock(mutex_);
    equivalence_[key] = result;
    equivalence_[Key(&b, &a)] = result;
    if (config_.debug) {
        std::cout << "TranslationSession::equivalent - Tokenizers are "
                  << (result ? "equivalent" : "not equivalent") << std::endl;
    }
    return result;
}

TranslationResult TranslationSession::translate(const Tensor3& foreign_probs,
                                                const AlignedBatch& batch,
                                                const Tokenizer& foreign,
                                                const Tokenizer& standard) {
    if (foreign_probs.batch != batch.size()) {
        throw ShapeMismatch("foreign tensor has batch " + std::to_string(foreign_probs.batch) +
                            " but the aligned batch has " + std::to_string(batch.size()) + " elements");
    }

    TranslationConfig config = this->config();

    TranslationResult result;
    if (config.skip_equivalent && equivalent(foreign, standard)) {
        auto from_map = translation_map(standard, foreign);
        result = translate_equivalent(foreign_probs, batch.std_offsets, *from_map, config);
    } else {
        // The equivalence check already ran, so from_map is never read here and
        // the reverse map is not built
        auto to_map = translation_map(foreign, standard);
        result = translate_logits_to_probs_std(foreign_probs, batch.foreign_offsets, batch.std_offsets, foreign,
                                               standard, split_cache(foreign, standard), *to_map, *to_map,
                                               batch.foreign_ids, batch.std_ids, false, config);
    }

    for (std::size_t b = 0; b < batch.size(); ++b) {
        if (!batch.ok(b) && result.elements[b].ok) {
            result.elements[b].ok = false;
            result.elements[b].error = batch.errors[b];
            ++result.stats.failed_elements;
        }
    }
    return result;
}

TranslationConfig TranslationSession::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void TranslationSession::set_config(const TranslationConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
}

std::size_t TranslationSession::map_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return maps_.size();
}

void TranslationSession::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    maps_.clear();
    split_caches_.clear();
    equivalence_.clear();
}

} // namespace toktrans
