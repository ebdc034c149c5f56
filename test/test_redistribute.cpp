#include "../src/alignment.hpp"
#include "../src/bpe.hpp"
#include "../src/errors.hpp"
#include "../src/redistribute.hpp"
#include "test_util.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>

using namespace toktrans;
using toktrans_test::near;

namespace {

const std::string kText = "aaabdaaabac";

// Foreign vocabulary: bytes plus "aa", "ab", "aaab"; standard vocabulary: bytes
struct Fixture {
    BpeTokenizer foreign = BpeTokenizer({{97, 97}, {97, 98}, {256, 257}});
    BpeTokenizer standard;
    TranslationMap to_map = TranslationMap::build(foreign, standard);
    TranslationMap from_map = TranslationMap::build(standard, foreign);
    SplitMapCache cache;
    AlignedBatch batch;

    explicit Fixture(const std::vector<std::string>& texts = {kText})
        : batch(align_batch(texts, standard, foreign)) {}

    TranslationResult translate(const Tensor3& probs, const TranslationConfig& config = TranslationConfig()) {
        return translate_logits_to_probs_std(probs, batch.foreign_offsets, batch.std_offsets, foreign, standard,
                                             cache, to_map, from_map, batch.foreign_ids, batch.std_ids, false,
                                             config);
    }
};

bool is_one_hot(const Tensor3& tensor, std::size_t b, std::size_t s, std::size_t id) {
    for (std::size_t w = 0; w < tensor.width; ++w) {
        float expected = w == id ? 1.0f : 0.0f;
        if (!near(tensor.at(b, s, w), expected)) {
            return false;
        }
    }
    return true;
}

} // namespace

void test_row_alignment() {
    std::cout << "Testing row alignment and projection..." << std::endl;

    Fixture fx;
    TokenSequence foreign_ids = {258, 'd', 258, 'a', 'c'};
    assert(fx.batch.foreign_ids[0] == foreign_ids);
    assert(fx.batch.std_ids[0].size() == kText.size());

    // Foreign row t puts all its mass on the true token t + 1
    Tensor3 probs(1, 5, 259);
    probs.at(0, 0, 'd') = 1.0f;
    probs.at(0, 1, 258) = 1.0f;
    probs.at(0, 2, 'a') = 1.0f;
    probs.at(0, 3, 'c') = 1.0f;
    probs.at(0, 4, 'a') = 1.0f;

    TranslationResult result = fx.translate(probs);
    assert(result.probs.batch == 1);
    assert(result.probs.sequence == 11);
    assert(result.probs.width == 256);
    assert(result.elements[0].ok);

    // Standard rows 0-2 fall inside the first foreign token: nothing predicted them
    for (std::size_t j = 0; j < 3; ++j) {
        for (std::size_t w = 0; w < 256; ++w) {
            assert(near(result.probs.at(0, j, w), 1.0 / 256.0));
        }
    }
    assert(result.stats.unanchored_rows == 3);

    // Every other row predicts the true next byte
    for (std::size_t j = 3; j + 1 < kText.size(); ++j) {
        assert(is_one_hot(result.probs, 0, j, static_cast<unsigned char>(kText[j + 1])));
    }
    // Rows 5-7 sit inside the second "aaab"
    assert(result.stats.partial_rows == 3);

    // The last row is predicted by the last foreign row
    assert(is_one_hot(result.probs, 0, 10, 'a'));
    assert(result.stats.rows == 11);
    assert(result.stats.missed_tokens == 0);

    std::cout << "row alignment tests passed!" << std::endl;
}

void test_mass_accumulation() {
    std::cout << "Testing mass accumulation and partial rescaling..." << std::endl;

    Fixture fx;
    Tensor3 probs(1, 5, 259);
    // Row 1 predicts the second "aaab", read by standard rows 4-7
    probs.at(0, 1, 258) = 0.5f;
    probs.at(0, 1, 'd') = 0.3f;
    probs.at(0, 1, 257) = 0.2f;
    // Row 2 predicts the "a" read by standard row 8
    probs.at(0, 2, 'a') = 0.25f;
    probs.at(0, 2, 256) = 0.25f;
    probs.at(0, 2, 258) = 0.25f;
    probs.at(0, 2, 'c') = 0.25f;

    TranslationResult result = fx.translate(probs);

    // Boundary at a foreign start: each id goes to its first fragment
    assert(near(result.probs.at(0, 4, 'a'), 0.7));
    assert(near(result.probs.at(0, 4, 'd'), 0.3));

    // One byte into "aaab": only "aaab" and "ab" agree with the prefix "a"
    assert(near(result.probs.at(0, 5, 'a'), 0.5 / 0.7));
    assert(near(result.probs.at(0, 5, 'b'), 0.2 / 0.7));
    assert(near(result.probs.at(0, 5, 'd'), 0.0));
    assert(near(toktrans_test::row_sum(result.probs, 0, 5), 1.0));

    // Three bytes in: only "aaab" remains
    assert(near(result.probs.at(0, 7, 'b'), 1.0));

    // Several foreign ids on one standard id are summed
    assert(near(result.probs.at(0, 8, 'a'), 0.75));
    assert(near(result.probs.at(0, 8, 'c'), 0.25));

    std::cout << "mass accumulation tests passed!" << std::endl;
}

void test_tokens_spanning_several_foreign_tokens() {
    std::cout << "Testing standard tokens that span several foreign tokens..." << std::endl;

    // " robot" is "ro" "bo" "t" in the foreign vocabulary and a single standard token
    BpeTokenizer foreign({{'r', 'o'}, {'b', 'o'}});
    BpeTokenizer standard({{'r', 'o'}, {'b', 'o'}, {256, 257}, {258, 't'}});
    TranslationMap to_map = TranslationMap::build(foreign, standard);
    SplitMapCache cache;
    AlignedBatch batch = align_batch({"a robot"}, standard, foreign);

    TokenSequence foreign_ids = {'a', ' ', 256, 257, 't'};
    TokenSequence std_ids = {'a', ' ', 259};
    assert(batch.foreign_ids[0] == foreign_ids);
    assert(batch.std_ids[0] == std_ids);

    auto translate = [&](const Tensor3& probs) {
        return translate_logits_to_probs_std(probs, batch.foreign_offsets, batch.std_offsets, foreign, standard,
                                             cache, to_map, to_map, batch.foreign_ids, batch.std_ids, false);
    };

    // A model sure of every next foreign token is sure of "robot"
    Tensor3 certain(1, 5, 258);
    certain.at(0, 0, ' ') = 1.0f;
    certain.at(0, 1, 256) = 1.0f;
    certain.at(0, 2, 257) = 1.0f;
    certain.at(0, 3, 't') = 1.0f;
    certain.at(0, 4, 'a') = 1.0f;

    TranslationResult sure = translate(certain);
    assert(sure.elements[0].ok);
    assert(is_one_hot(sure.probs, 0, 0, ' '));
    assert(is_one_hot(sure.probs, 0, 1, 259));

    // "robot" takes the product along the foreign path; "ro" and "r" share the rest 4:1
    Tensor3 hedged = certain;
    hedged.at(0, 1, 256) = 0.8f;
    hedged.at(0, 1, 'r') = 0.2f;
    hedged.at(0, 2, 257) = 0.5f;
    hedged.at(0, 2, 'b') = 0.5f;

    TranslationResult split = translate(hedged);
    assert(near(split.probs.at(0, 1, 259), 0.4));
    assert(near(split.probs.at(0, 1, 256), 0.48));
    assert(near(split.probs.at(0, 1, 'r'), 0.12));
    assert(near(toktrans_test::row_sum(split.probs, 0, 1), 1.0));

    // The other way round, each standard piece of a foreign "robot" is certain
    TranslationMap reverse_map = TranslationMap::build(standard, foreign);
    SplitMapCache reverse_cache;
    AlignedBatch reverse = align_batch({"a robot"}, foreign, standard);
    Tensor3 coarse(1, 3, 260);
    coarse.at(0, 0, ' ') = 1.0f;
    coarse.at(0, 1, 259) = 1.0f;
    coarse.at(0, 2, 'a') = 1.0f;

    TranslationResult fine = translate_logits_to_probs_std(coarse, reverse.foreign_offsets, reverse.std_offsets,
                                                           standard, foreign, reverse_cache, reverse_map, reverse_map,
                                                           reverse.foreign_ids, reverse.std_ids, false);
    assert(fine.elements[0].ok);
    assert(is_one_hot(fine.probs, 0, 1, 256));
    assert(is_one_hot(fine.probs, 0, 2, 257));
    assert(is_one_hot(fine.probs, 0, 3, 't'));

    std::cout << "spanning token tests passed!" << std::endl;
}

void test_miss_policies() {
    std::cout << "Testing miss policies..." << std::endl;

    Fixture fx;
    // Padded foreign width: ids 259-261 have no translation
    Tensor3 probs(1, 5, 262);
    probs.at(0, 3, 'c') = 0.5f;
    probs.at(0, 3, 261) = 0.5f;

    TranslationResult dropped = fx.translate(probs);
    assert(dropped.elements[0].ok);
    assert(near(dropped.probs.at(0, 9, 'c'), 0.5));
    assert(near(toktrans_test::row_sum(dropped.probs, 0, 9), 0.5));
    assert(dropped.stats.missed_tokens == 1);
    assert(near(dropped.stats.missed_mass, 0.5));

    TranslationConfig floor_fill;
    floor_fill.miss_policy = MissPolicy::FloorFill;
    TranslationResult filled = fx.translate(probs, floor_fill);
    assert(near(filled.probs.at(0, 9, 'c'), 0.5 + 0.5 / 256.0));
    assert(near(filled.probs.at(0, 9, 'x'), 0.5 / 256.0));
    assert(near(toktrans_test::row_sum(filled.probs, 0, 9), 1.0));
    assert(filled.stats.missed_tokens == 1);
    assert(near(filled.stats.missed_mass, 0.0));

    TranslationConfig strict;
    strict.miss_policy = MissPolicy::Error;
    TranslationResult failed = fx.translate(probs, strict);
    assert(!failed.elements[0].ok);
    assert(!failed.elements[0].error.empty());
    assert(failed.stats.failed_elements == 1);
    for (float value : failed.probs.values) {
        assert(value == 0.0f);
    }

    std::cout << "miss policy tests passed!" << std::endl;
}

void test_batch_order_independence() {
    std::cout << "Testing batch order independence..." << std::endl;

    Fixture forward({kText, "abac"});
    Fixture backward({"abac", kText});

    Tensor3 element_a(1, 5, 259);
    Tensor3 element_b(1, 5, 259);
    toktrans_test::fill_distribution(element_a, 1);
    toktrans_test::fill_distribution(element_b, 2);

    Tensor3 ab(2, 5, 259);
    Tensor3 ba(2, 5, 259);
    std::copy(element_a.values.begin(), element_a.values.end(), ab.row(0, 0));
    std::copy(element_b.values.begin(), element_b.values.end(), ab.row(1, 0));
    std::copy(element_b.values.begin(), element_b.values.end(), ba.row(0, 0));
    std::copy(element_a.values.begin(), element_a.values.end(), ba.row(1, 0));

    TranslationResult first = forward.translate(ab);
    TranslationResult second = backward.translate(ba);
    assert(first.probs.sequence == 11 && second.probs.sequence == 11);

    for (std::size_t s = 0; s < 11; ++s) {
        for (std::size_t w = 0; w < 256; ++w) {
            assert(first.probs.at(0, s, w) == second.probs.at(1, s, w));
            assert(first.probs.at(1, s, w) == second.probs.at(0, s, w));
        }
    }

    // Rows past the shorter element are zero
    assert(toktrans_test::row_sum(first.probs, 1, 4) == 0.0);

    std::cout << "batch order independence tests passed!" << std::endl;
}

void test_idempotence() {
    std::cout << "Testing idempotence with warm and cold caches..." << std::endl;

    Fixture fx({kText, "abac"});
    Tensor3 probs(2, 5, 259);
    toktrans_test::fill_distribution(probs, 5);

    TranslationResult cold = fx.translate(probs);
    assert(fx.cache.size() > 0);
    TranslationResult warm = fx.translate(probs);
    assert(cold.probs.values == warm.probs.values);

    fx.cache.clear();
    TranslationResult cleared = fx.translate(probs);
    assert(cold.probs.values == cleared.probs.values);

    std::cout << "idempotence tests passed!" << std::endl;
}

void test_logits_input() {
    std::cout << "Testing logits input..." << std::endl;

    Fixture fx;
    Tensor3 probs(1, 5, 259);
    toktrans_test::fill_distribution(probs, 9);

    Tensor3 logits = probs;
    for (float& value : logits.values) {
        value = std::log(value) + 3.0f;
    }

    TranslationConfig config;
    config.input = InputKind::Logits;
    TranslationResult from_logits = fx.translate(logits, config);
    TranslationResult from_probs = fx.translate(probs);

    for (std::size_t i = 0; i < from_probs.probs.values.size(); ++i) {
        assert(near(from_logits.probs.values[i], from_probs.probs.values[i], 1e-5));
    }

    std::cout << "logits input tests passed!" << std::endl;
}

void test_equivalent_fast_path() {
    std::cout << "Testing the equivalent fast path..." << std::endl;

    BpeTokenizer tokenizer = toktrans_test::learned_tokenizer(50);
    AlignedBatch batch = align_batch(toktrans_test::sample_texts(), tokenizer, tokenizer);
    TranslationMap map = TranslationMap::build(tokenizer, tokenizer);
    SplitMapCache cache;

    std::size_t length = 0;
    for (const auto& ids : batch.std_ids) {
        length = std::max(length, ids.size());
    }
    Tensor3 probs(batch.size(), length, tokenizer.vocab_size());
    toktrans_test::fill_distribution(probs, 13);

    TranslationResult fast = translate_logits_to_probs_std(probs, batch.foreign_offsets, batch.std_offsets,
                                                           tokenizer, tokenizer, cache, map, map, batch.foreign_ids,
                                                           batch.std_ids, true);
    assert(fast.stats.fast_path);
    for (std::size_t b = 0; b < batch.size(); ++b) {
        for (std::size_t s = 0; s < length; ++s) {
            bool inside = s < batch.std_ids[b].size();
            for (std::size_t w = 0; w < probs.width; ++w) {
                if (map.exact(static_cast<TokenType>(w)) == static_cast<TokenType>(w)) {
                    assert(fast.probs.at(b, s, w) == (inside ? probs.at(b, s, w) : 0.0f));
                }
            }
            // Every token of the text maps onto itself
            if (inside) {
                TokenType id = batch.std_ids[b][s];
                assert(fast.probs.at(b, s, id) == probs.at(b, s, id));
            }
        }
    }

    // With a byte vocabulary the general path is the identity too, up to rounding
    BpeTokenizer bytes;
    AlignedBatch byte_batch = align_batch({"bytes only"}, bytes, bytes);
    TranslationMap byte_map = TranslationMap::build(bytes, bytes);
    SplitMapCache byte_cache;
    Tensor3 byte_probs(1, 10, 256);
    toktrans_test::fill_distribution(byte_probs, 17);

    TranslationResult slow = translate_logits_to_probs_std(byte_probs, byte_batch.foreign_offsets,
                                                           byte_batch.std_offsets, bytes, bytes, byte_cache, byte_map,
                                                           byte_map, byte_batch.foreign_ids, byte_batch.std_ids,
                                                           false);
    assert(!slow.stats.fast_path);
    for (std::size_t i = 0; i < byte_probs.values.size(); ++i) {
        assert(near(slow.probs.values[i], byte_probs.values[i], 1e-6));
    }

    std::cout << "fast path tests passed!" << std::endl;
}

void test_failures() {
    std::cout << "Testing shape mismatches and failed elements..." << std::endl;

    Fixture fx({kText, "abac"});
    Tensor3 probs(2, 5, 259);
    toktrans_test::fill_distribution(probs, 21);

    // Batch sizes disagree
    bool thrown = false;
    try {
        Tensor3 single(1, 5, 259);
        fx.translate(single);
    } catch (const ShapeMismatch&) {
        thrown = true;
    }
    assert(thrown);

    // Zero-width foreign rows
    thrown = false;
    try {
        fx.translate(Tensor3(2, 5, 0));
    } catch (const ShapeMismatch&) {
        thrown = true;
    }
    assert(thrown);

    TranslationResult reference = fx.translate(probs);

    // Element 0 gets inconsistent ids; element 1 is unaffected
    fx.batch.foreign_ids[0].pop_back();
    TranslationResult isolated = fx.translate(probs);
    assert(!isolated.elements[0].ok);
    assert(isolated.elements[1].ok);
    assert(isolated.stats.failed_elements == 1);
    assert(toktrans_test::row_sum(isolated.probs, 0, 3) == 0.0);
    for (std::size_t s = 0; s < 4; ++s) {
        for (std::size_t w = 0; w < 256; ++w) {
            assert(isolated.probs.at(1, s, w) == reference.probs.at(1, s, w));
        }
    }

    std::cout << "failure tests passed!" << std::endl;
}

int main() {
    test_row_alignment();
    test_mass_accumulation();
    test_tokens_spanning_several_foreign_tokens();
    test_miss_policies();
    test_batch_order_independence();
    test_idempotence();
    test_logits_input();
    test_equivalent_fast_path();
    test_failures();

    std::cout << "All redistribution tests passed!" << std::endl;

    return 0;
}
