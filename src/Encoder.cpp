#include "Encoder.hpp"
#include "StringUtils.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace Encoder {

FeatureVector encode(std::string_view text, size_t size) {
    if (size == 0) {
        throw std::invalid_argument("Encoder: vector size must be non-zero");
    }

    FeatureVector vec(size, 0.0);
    const std::vector<uint32_t> codes = utils::decodeUtf8(text);
    const size_t limit = std::min(codes.size(), size * 4);

    // Positions and the limit count characters, not bytes
    for (size_t i = 0; i < limit; ++i) {
        const size_t code = codes[i];
        const size_t idx = (code * 31 + i) % size;
        vec[idx] = std::fmod(vec[idx] + 0.3, 1.0);
    }
    return vec;
}

double similarity(const FeatureVector& a, const FeatureVector& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("Encoder: cannot compare vectors of different length");
    }
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        const double d = a[i] - b[i];
        sum += d * d;
    }
    return 1.0 - std::sqrt(sum);
}

} // namespace Encoder
