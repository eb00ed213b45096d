/**
 * @file MemoryErrors.hpp
 * @brief Error taxonomy of the memory store and retrieval pipeline.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace reviewmemory::domain {

/** @brief Base class so callers can isolate any pipeline failure. */
class MemoryError : public std::runtime_error {
public:
    explicit MemoryError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief An embedding does not have the store's dimension. Never coerced. */
class DimensionMismatch : public MemoryError {
public:
    DimensionMismatch(std::size_t expected, std::size_t actual)
        : MemoryError("DimensionMismatch: expected " + std::to_string(expected) +
                      ", got " + std::to_string(actual)),
          m_expected(expected), m_actual(actual) {}

    std::size_t expected() const { return m_expected; }
    std::size_t actual() const { return m_actual; }

private:
    std::size_t m_expected;
    std::size_t m_actual;
};

/** @brief A persisted snapshot is inconsistent. Loading halts. */
class CorruptStore : public MemoryError {
public:
    explicit CorruptStore(const std::string& message) : MemoryError("CorruptStore: " + message) {}
};

/** @brief An embedding or generation call failed. Recoverable per unit. */
class ExternalCallFailure : public MemoryError {
public:
    explicit ExternalCallFailure(const std::string& message) : MemoryError("ExternalCallFailure: " + message) {}

protected:
    struct RawMessage {};
    ExternalCallFailure(RawMessage, const std::string& message) : MemoryError(message) {}
};

/** @brief An embedding or generation call exceeded its time box. */
class ExternalCallTimeout : public ExternalCallFailure {
public:
    explicit ExternalCallTimeout(const std::string& message)
        : ExternalCallFailure(RawMessage{}, "ExternalCallTimeout: " + message) {}
};

} // namespace reviewmemory::domain
