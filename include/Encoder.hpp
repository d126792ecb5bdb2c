#ifndef ENCODER_HPP
#define ENCODER_HPP

#include <cstddef>
#include <string_view>
#include <vector>

namespace Encoder {

using FeatureVector = std::vector<double>;

/**
 * Hash a text into a fixed-length feature vector
 *
 * Each character c at position i lands in slot (code(c) * 31 + i) mod size,
 * and the slot advances by 0.3 modulo 1.0. Only the first size * 4
 * characters are considered. Collisions are expected.
 *
 * @param text Input text, UTF-8 (invalid bytes count as their byte value)
 * @param size Vector length, must be non-zero
 * @return Feature vector of length size
 */
FeatureVector encode(std::string_view text, size_t size);

/**
 * 1 - euclidean distance. Not bounded below.
 *
 * @return similarity, or throws std::invalid_argument on length mismatch
 */
double similarity(const FeatureVector& a, const FeatureVector& b);

} // namespace Encoder

#endif // ENCODER_HPP
