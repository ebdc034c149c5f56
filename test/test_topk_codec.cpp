#include "../src/errors.hpp"
#include "../src/topk_codec.hpp"
#include "test_util.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace toktrans;
using toktrans_test::near;

void test_encode_row() {
    std::cout << "Testing encode_topk on one row..." << std::endl;

    std::vector<float> probs = {0.1f, 0.5f, 0.2f, 0.2f};
    auto encoded = encode_topk(probs.data(), probs.size(), 2);

    assert(encoded.size() == 4);
    assert(encoded[0] == 0.5f);
    assert(encoded[1] == 0.2f);
    // Equal values are ordered by id
    assert(encoded[2] == 1.0f);
    assert(encoded[3] == 2.0f);

    std::cout << "encode_topk row tests passed!" << std::endl;
}

void test_decode_row() {
    std::cout << "Testing decode_topk on one row..." << std::endl;

    std::vector<float> encoded = {0.5f, 0.2f, 1.0f, 2.0f};
    std::vector<float> out(4);
    decode_topk(encoded.data(), 4, 2, out.data());

    assert(out[1] == 0.5f);
    assert(out[2] == 0.2f);
    assert(near(out[0], 0.15));
    assert(near(out[3], 0.15));
    assert(out[0] == out[3]);

    std::cout << "decode_topk row tests passed!" << std::endl;
}

void test_topk_exact() {
    std::cout << "Testing that decoded top-k entries are exact..." << std::endl;

    Tensor3 probs(2, 3, 50);
    toktrans_test::fill_distribution(probs, 7);
    const int k = 5;

    Tensor3 encoded = encode_topk(probs, k);
    assert(encoded.batch == 2 && encoded.sequence == 3 && encoded.width == 10);

    Tensor3 decoded = decode_topk(encoded, 50, k);
    assert(decoded.width == 50);

    for (std::size_t b = 0; b < 2; ++b) {
        for (std::size_t s = 0; s < 3; ++s) {
            const float* enc = encoded.row(b, s);
            double topk_mass = 0.0;
            for (int i = 0; i < k; ++i) {
                std::size_t id = static_cast<std::size_t>(enc[k + i]);
                assert(decoded.at(b, s, id) == probs.at(b, s, id));
                topk_mass += enc[i];
                if (i > 0) {
                    assert(enc[i] <= enc[i - 1]);
                }
            }
            double floor_mass = (1.0 - topk_mass) / 45.0;
            std::size_t floor_count = 0;
            for (std::size_t w = 0; w < 50; ++w) {
                if (near(decoded.at(b, s, w), floor_mass, 1e-6)) {
                    ++floor_count;
                }
            }
            assert(floor_count >= 45);
            assert(near(toktrans_test::row_sum(decoded, b, s), 1.0, 1e-4));
        }
    }

    std::cout << "top-k exactness tests passed!" << std::endl;
}

void test_lossless_full_k() {
    std::cout << "Testing lossless round trip with k = vocabulary size..." << std::endl;

    Tensor3 probs(1, 4, 16);
    toktrans_test::fill_distribution(probs, 3);

    Tensor3 decoded = decode_topk(encode_topk(probs, 16), 16, 16);
    assert(decoded.values == probs.values);

    std::cout << "lossless round trip tests passed!" << std::endl;
}

void test_decode_logits() {
    std::cout << "Testing decode_topk_logits..." << std::endl;

    // Top-k mass of one leaves only the epsilon floor
    std::vector<float> row = {0.0f, 1.0f, 0.0f};
    Tensor3 encoded(1, 1, 2);
    auto enc = encode_topk(row.data(), row.size(), 1);
    encoded.values.assign(enc.begin(), enc.end());

    Tensor3 logits = decode_topk_logits(encoded, 3, 1);
    assert(logits.at(0, 0, 1) == 0.0f);
    for (std::size_t w : {0, 2}) {
        float value = logits.at(0, 0, w);
        assert(std::isfinite(value));
        assert(near(value, std::log(kEpsilon / 2.0), 1e-3));
    }

    // Probabilities survive the log-space decode
    Tensor3 probs(1, 2, 8);
    toktrans_test::fill_distribution(probs, 11);
    Tensor3 recovered = softmax(decode_topk_logits(encode_topk(probs, 8), 8, 8));
    for (std::size_t i = 0; i < probs.values.size(); ++i) {
        assert(near(recovered.values[i], probs.values[i], 1e-5));
    }

    std::cout << "decode_topk_logits tests passed!" << std::endl;
}

void test_softmax() {
    std::cout << "Testing softmax and encode_logits_topk..." << std::endl;

    Tensor3 logits(1, 2, 3);
    logits.values = {1.0f, 2.0f, 3.0f, 1000.0f, 1000.0f, -1000.0f};
    Tensor3 probs = softmax(logits);

    assert(near(toktrans_test::row_sum(probs, 0, 0), 1.0));
    assert(probs.at(0, 0, 2) > probs.at(0, 0, 1) && probs.at(0, 0, 1) > probs.at(0, 0, 0));
    assert(near(probs.at(0, 1, 0), 0.5));
    assert(near(probs.at(0, 1, 1), 0.5));
    assert(probs.at(0, 1, 2) == 0.0f);

    Tensor3 encoded = encode_logits_topk(logits, 1);
    assert(encoded.width == 2);
    assert(encoded.at(0, 0, 1) == 2.0f);
    assert(encoded.at(0, 1, 1) == 0.0f);

    std::cout << "softmax tests passed!" << std::endl;
}

void test_invalid_input() {
    std::cout << "Testing invalid k and malformed encodings..." << std::endl;

    std::vector<float> probs = {0.25f, 0.25f, 0.5f};
    bool thrown = false;
    try {
        encode_topk(probs.data(), probs.size(), 0);
    } catch (const InvalidK&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        encode_topk(probs.data(), probs.size(), 4);
    } catch (const InvalidK&) {
        thrown = true;
    }
    assert(thrown);

    // Width does not match 2k
    thrown = false;
    try {
        decode_topk(Tensor3(1, 1, 3), 3, 1);
    } catch (const InvalidK&) {
        thrown = true;
    }
    assert(thrown);

    // Encoded id outside the vocabulary
    std::vector<float> encoded = {0.9f, 7.0f};
    std::vector<float> out(3);
    thrown = false;
    try {
        decode_topk(encoded.data(), 3, 1, out.data());
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    // Non-integral id
    encoded = {0.9f, 1.5f};
    thrown = false;
    try {
        decode_topk(encoded.data(), 3, 1, out.data());
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "invalid input tests passed!" << std::endl;
}

int main() {
    test_encode_row();
    test_decode_row();
    test_topk_exact();
    test_lossless_full_k();
    test_decode_logits();
    test_softmax();
    test_invalid_input();

    std::cout << "All top-k codec tests passed!" << std::endl;

    return 0;
}
