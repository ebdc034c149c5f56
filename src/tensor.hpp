#ifndef TOKTRANS_TENSOR_HPP
#define TOKTRANS_TENSOR_HPP

#include <cstddef>
#include <vector>

namespace toktrans {

/**
 * @brief Dense row-major float tensor of shape [batch, sequence, width]
 *
 * Used for logits, probabilities and top-k encoded distributions alike.
 * A "row" is the width-long vector at one (batch, position).
 */
struct Tensor3 {
    std::size_t batch = 0;
    std::size_t sequence = 0;
    std::size_t width = 0;
    std::vector<float> values;

    Tensor3() = default;

    Tensor3(std::size_t batch_size, std::size_t sequence_len, std::size_t row_width, float fill = 0.0f)
        : batch(batch_size),
          sequence(sequence_len),
          width(row_width),
          values(batch_size * sequence_len * row_width, fill) {}

    float* row(std::size_t b, std::size_t s) {
        return values.data() + (b * sequence + s) * width;
    }

    const float* row(std::size_t b, std::size_t s) const {
        return values.data() + (b * sequence + s) * width;
    }

    float& at(std::size_t b, std::size_t s, std::size_t w) {
        return values[(b * sequence + s) * width + w];
    }

    float at(std::size_t b, std::size_t s, std::size_t w) const {
        return values[(b * sequence + s) * width + w];
    }

    std::size_t rows() const { return batch * sequence; }
};

} // namespace toktrans

#endif // TOKTRANS_TENSOR_HPP
