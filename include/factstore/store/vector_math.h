#pragma once

#include <cmath>
#include <cstddef>
#include <cstring>
#include <vector>

namespace factstore::store {

/**
 * Cosine similarity in [-1, 1]. Mismatched lengths or zero-norm inputs
 * yield 0.
 */
inline double computeCosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) {
        return 0.0;
    }

    double dot_product = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;

    for (size_t i = 0; i < a.size(); ++i) {
        dot_product += static_cast<double>(a[i]) * static_cast<double>(b[i]);
        norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
        norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
    }

    norm_a = std::sqrt(norm_a);
    norm_b = std::sqrt(norm_b);

    if (norm_a == 0.0 || norm_b == 0.0) {
        return 0.0;
    }

    return dot_product / (norm_a * norm_b);
}

// Raw float32 layout, host byte order
inline std::vector<std::byte> vectorToBlob(const std::vector<float>& vec) {
    std::vector<std::byte> blob(vec.size() * sizeof(float));
    if (!blob.empty()) {
        std::memcpy(blob.data(), vec.data(), blob.size());
    }
    return blob;
}

inline std::vector<float> blobToVector(const std::vector<std::byte>& blob) {
    size_t num_floats = blob.size() / sizeof(float);
    std::vector<float> vec(num_floats);
    if (num_floats > 0) {
        std::memcpy(vec.data(), blob.data(), num_floats * sizeof(float));
    }
    return vec;
}

} // namespace factstore::store
