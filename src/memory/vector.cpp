#include "vector.hpp"
#include <cmath>
#include <cstring>

namespace memweave {

double cosine_similarity(const Embedding& a, const Embedding& b) {
    if (a.empty() || b.empty() || a.size() != b.size()) return 0.0;

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;

    for (size_t i = 0; i < a.size(); i++) {
        dot    += static_cast<double>(a[i]) * static_cast<double>(b[i]);
        norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
        norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
    }

    double denom = std::sqrt(norm_a) * std::sqrt(norm_b);
    if (denom < 1e-12) return 0.0;

    return dot / denom;
}

std::string serialize_vector(const Embedding& vec) {
    if (vec.empty()) return {};

    std::string data(sizeof(float) * vec.size(), '\0');
    std::memcpy(data.data(), vec.data(), sizeof(float) * vec.size());
    return data;
}

Embedding deserialize_vector(const void* data, size_t bytes) {
    if (!data || bytes == 0 || bytes % sizeof(float) != 0) return {};

    Embedding vec(bytes / sizeof(float));
    std::memcpy(vec.data(), data, bytes);
    return vec;
}

} // namespace memweave
