// rhost_core LocalIdAllocator tests

#include <catch2/catch_test_macros.hpp>
#include <rhost/core/id.hpp>
#include <algorithm>
#include <mutex>
#include <thread>
#include <unordered_set>
#include <vector>

using namespace rhost_core;

// =============================================================================
// Sequencing
// =============================================================================

TEST_CASE("LocalIdAllocator first id follows seed", "[core][id]") {
    LocalIdAllocator ids;

    REQUIRE(ids.seed() == 720000);
    REQUIRE(ids.last_allocated() == 720000);

    auto first = ids.allocate();
    REQUIRE(first.is_ok());
    REQUIRE(first.value() == 720001);

    auto second = ids.allocate();
    REQUIRE(second.value() == 720002);
    REQUIRE(ids.allocated_count() == 2);
}

TEST_CASE("LocalIdAllocator custom seed", "[core][id]") {
    LocalIdAllocator ids(10);

    REQUIRE(ids.allocate().value() == 11);
    REQUIRE(ids.last_allocated() == 11);
    REQUIRE(ids.remaining() == static_cast<std::uint64_t>(k_max_local_id) - 11);
}

TEST_CASE("LocalIdAllocator is strictly increasing", "[core][id]") {
    LocalIdAllocator ids;
    LocalId previous = ids.seed();

    for (int i = 0; i < 500; ++i) {
        auto id = ids.allocate();
        REQUIRE(id.is_ok());
        REQUIRE(id.value() > previous);
        previous = id.value();
    }
}

// =============================================================================
// Exhaustion
// =============================================================================

TEST_CASE("LocalIdAllocator exhaustion", "[core][id]") {
    LocalIdAllocator ids(k_max_local_id - 1);

    auto last = ids.allocate();
    REQUIRE(last.is_ok());
    REQUIRE(last.value() == k_max_local_id);
    REQUIRE(ids.remaining() == 0);

    auto refused = ids.allocate();
    REQUIRE(refused.is_err());
    REQUIRE(refused.error().code() == ErrorCode::Exhausted);
    REQUIRE(refused.error().is<IdError>());

    // Counter does not wrap
    REQUIRE(ids.last_allocated() == k_max_local_id);
    REQUIRE(ids.allocate().is_err());
}

// =============================================================================
// Concurrency
// =============================================================================

TEST_CASE("LocalIdAllocator concurrent allocation", "[core][id]") {
    LocalIdAllocator ids;
    constexpr int thread_count = 8;
    constexpr int per_thread = 1000;

    std::mutex mutex;
    std::vector<LocalId> all;
    std::vector<std::thread> threads;

    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([&]() {
            std::vector<LocalId> mine;
            mine.reserve(per_thread);
            for (int i = 0; i < per_thread; ++i) {
                auto id = ids.allocate();
                if (id) {
                    mine.push_back(id.value());
                }
            }
            std::lock_guard<std::mutex> lock(mutex);
            all.insert(all.end(), mine.begin(), mine.end());
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(all.size() == thread_count * per_thread);

    std::unordered_set<LocalId> unique(all.begin(), all.end());
    REQUIRE(unique.size() == all.size());
    REQUIRE(*std::min_element(all.begin(), all.end()) == 720001);
    REQUIRE(*std::max_element(all.begin(), all.end()) == 720000 + thread_count * per_thread);
    REQUIRE(ids.allocated_count() == thread_count * per_thread);
}

TEST_CASE("format_local_id", "[core][id]") {
    REQUIRE(format_local_id(255) == "255 (0x000000ff)");
}
