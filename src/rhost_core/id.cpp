/// @file id.cpp
/// @brief Local id allocator implementation for rhost_core

#include <rhost/core/id.hpp>
#include <rhost/core/log.hpp>

#include <iomanip>
#include <sstream>

namespace rhost_core {

// =============================================================================
// LocalIdAllocator
// =============================================================================

Result<LocalId> LocalIdAllocator::allocate() {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_last != k_max_local_id) {
        LocalId id = ++m_last;
        return id;
    }
    LocalId last = m_last;
    lock.unlock();

    core_logger()->error("Local id allocation refused, counter is at {}", last);
    Error err = IdError::exhausted(last);
    debug::record_error(err);
    return Err<LocalId>(std::move(err));
}

LocalId LocalIdAllocator::last_allocated() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_last;
}

std::uint64_t LocalIdAllocator::allocated_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<std::uint64_t>(m_last) - static_cast<std::uint64_t>(m_seed);
}

std::uint64_t LocalIdAllocator::remaining() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<std::uint64_t>(k_max_local_id) - static_cast<std::uint64_t>(m_last);
}

// =============================================================================
// Formatting
// =============================================================================

std::string format_local_id(LocalId id) {
    std::ostringstream oss;
    oss << id << " (0x" << std::hex << std::setw(8) << std::setfill('0') << id << ")";
    return oss.str();
}

} // namespace rhost_core
