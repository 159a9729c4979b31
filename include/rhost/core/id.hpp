#pragma once

/// @file id.hpp
/// @brief Scene-scoped local identifier allocation for rhost_core

#include "fwd.hpp"
#include "error.hpp"
#include <cstdint>
#include <limits>
#include <mutex>
#include <string>

namespace rhost_core {

// =============================================================================
// LocalId
// =============================================================================

/// Top of the reserved local id range. The first id handed out is seed + 1.
inline constexpr LocalId k_default_local_id_seed = 720000;

/// Largest id the allocator will ever hand out
inline constexpr LocalId k_max_local_id = std::numeric_limits<LocalId>::max();

// =============================================================================
// LocalIdAllocator
// =============================================================================

/// Thread-safe, strictly increasing local id counter.
///
/// Ids are never reused. When the counter reaches k_max_local_id every
/// further allocation fails with IdError::exhausted and the counter is left
/// untouched.
class LocalIdAllocator {
public:
    explicit LocalIdAllocator(LocalId seed = k_default_local_id_seed) noexcept
        : m_seed(seed), m_last(seed) {}

    // Non-copyable
    LocalIdAllocator(const LocalIdAllocator&) = delete;
    LocalIdAllocator& operator=(const LocalIdAllocator&) = delete;

    /// Allocate the next id (thread-safe)
    [[nodiscard]] Result<LocalId> allocate();

    /// Last id handed out (seed if none yet)
    [[nodiscard]] LocalId last_allocated() const;

    /// Seed the allocator was created with
    [[nodiscard]] LocalId seed() const noexcept { return m_seed; }

    /// Number of ids handed out so far
    [[nodiscard]] std::uint64_t allocated_count() const;

    /// Number of ids still available
    [[nodiscard]] std::uint64_t remaining() const;

private:
    LocalId m_seed;
    mutable std::mutex m_mutex;
    LocalId m_last;
};

/// Format a local id for diagnostics
[[nodiscard]] std::string format_local_id(LocalId id);

} // namespace rhost_core
