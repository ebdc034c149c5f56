#ifndef TOKTRANS_ERRORS_HPP
#define TOKTRANS_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace toktrans {

/**
 * @brief k is non-positive or exceeds the vocabulary size
 */
class InvalidK : public std::invalid_argument {
public:
    explicit InvalidK(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief Batch inputs disagree in shape (batch size, widths)
 */
class ShapeMismatch : public std::invalid_argument {
public:
    explicit ShapeMismatch(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief Offsets or a correction table are inconsistent with the text they describe.
 * Fatal for one batch element only.
 */
class OffsetMisalignment : public std::runtime_error {
public:
    explicit OffsetMisalignment(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief A foreign token has no entry in the translation map.
 * Only raised when the miss policy is MissPolicy::Error.
 */
class TranslationMapMiss : public std::runtime_error {
public:
    explicit TranslationMapMiss(const std::string& what) : std::runtime_error(what) {}
};

} // namespace toktrans

#endif // TOKTRANS_ERRORS_HPP
