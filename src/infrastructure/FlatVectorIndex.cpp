#include "infrastructure/FlatVectorIndex.hpp"
#include <algorithm>

namespace reviewmemory::infrastructure {

void FlatVectorIndex::add(const std::vector<float>& vector) {
    m_data.insert(m_data.end(), vector.begin(), vector.end());
}

void FlatVectorIndex::reset(std::size_t dimension) {
    m_dimension = dimension;
    m_data.clear();
}

float FlatVectorIndex::squaredL2(const float* a, const float* b, std::size_t dimension) {
    float sum = 0.0f;
    for (std::size_t i = 0; i < dimension; ++i) {
        float d = a[i] - b[i];
        sum += d * d;
    }
    return sum;
}

std::vector<IndexHit> FlatVectorIndex::search(const std::vector<float>& query, std::size_t topK) const {
    std::vector<IndexHit> hits;
    const std::size_t count = size();
    if (count == 0 || topK == 0 || query.size() != m_dimension) return hits;

    hits.reserve(count);
    for (std::size_t pos = 0; pos < count; ++pos) {
        hits.push_back({pos, squaredL2(query.data(), m_data.data() + pos * m_dimension, m_dimension)});
    }

    auto closer = [](const IndexHit& a, const IndexHit& b) {
        if (a.distance != b.distance) return a.distance < b.distance;
        return a.position < b.position;
    };
    const std::size_t k = std::min(topK, count);
    std::partial_sort(hits.begin(), hits.begin() + static_cast<std::ptrdiff_t>(k), hits.end(), closer);
    hits.resize(k);
    return hits;
}

} // namespace reviewmemory::infrastructure
