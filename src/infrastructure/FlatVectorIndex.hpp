/**
 * @file FlatVectorIndex.hpp
 * @brief Exhaustive nearest-neighbour index over fixed-length float vectors.
 */

#pragma once
#include <cstddef>
#include <utility>
#include <vector>

namespace reviewmemory::infrastructure {

/**
 * @struct IndexHit
 * @brief Position of a stored vector and its squared L2 distance to the query.
 */
struct IndexHit {
    std::size_t position = 0;
    float distance = 0.0f;
};

/**
 * @class FlatVectorIndex
 * @brief Row-major storage scanned in full for every query.
 *
 * Exact results: the k smallest squared distances, ties resolved by the lower
 * position.
 */
class FlatVectorIndex {
public:
    explicit FlatVectorIndex(std::size_t dimension = 0) : m_dimension(dimension) {}

    /** @brief Appends a vector; the caller has already validated its length. */
    void add(const std::vector<float>& vector);

    std::vector<IndexHit> search(const std::vector<float>& query, std::size_t topK) const;

    std::size_t size() const { return m_dimension == 0 ? 0 : m_data.size() / m_dimension; }
    std::size_t dimension() const { return m_dimension; }

    /** @brief Sets the dimension of an empty index. */
    void reset(std::size_t dimension);

    static float squaredL2(const float* a, const float* b, std::size_t dimension);

private:
    std::size_t m_dimension;
    std::vector<float> m_data;
};

} // namespace reviewmemory::infrastructure
