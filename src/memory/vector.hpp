#pragma once
#include "../memory.hpp"
#include <string>

namespace memweave {

// Cosine similarity between two float vectors. Returns 0.0 if either is empty,
// zero-magnitude, or the lengths differ.
double cosine_similarity(const Embedding& a, const Embedding& b);

// Shift a cosine similarity from [-1,1] to [0,1].
inline double unit_similarity(double cosine) {
    return (cosine + 1.0) / 2.0;
}

// Serialize a float vector to a binary string (for DB storage).
std::string serialize_vector(const Embedding& vec);

// Deserialize a binary string back to a float vector.
Embedding deserialize_vector(const void* data, size_t bytes);

} // namespace memweave
