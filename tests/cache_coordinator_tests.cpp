// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <spool/core/cache_coordinator.hpp>
#include <spool/core/error.hpp>
#include "test_helpers.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <thread>
#include <vector>

using namespace spool::core;
using spool::disk::BlobStore;
using spool::disk::MemoryBlobStore;
using spool::test::payload;

namespace {

constexpr std::int64_t CONTENT_LENGTH = 10'000'000;

ResourceKey test_key() {
    return *ResourceKey::from_url("https://media.example.com/movie.mp4");
}

std::shared_ptr<CacheCoordinator> make_coordinator(std::shared_ptr<BlobStore> store,
                                                   CachingConfig config = {}) {
    auto coordinator = CacheCoordinator::create(test_key(), std::move(store), config);
    REQUIRE_FALSE(coordinator->save_content_info({CONTENT_LENGTH, "video/mp4", true}));
    return coordinator;
}

void store_chunk(CacheCoordinator& coordinator, std::int64_t offset, std::int64_t length) {
    REQUIRE_FALSE(coordinator.save_chunk(payload(offset, length), offset));
}

// Chunk reads block until released
class GatedBlobStore final : public BlobStore {
public:
    mutable std::atomic<int> chunk_reads{0};

    void release() {
        {
            auto lock = std::lock_guard(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] std::expected<std::optional<spool::disk::Bytes>, std::error_code>
    get(std::string_view key) const override {
        if (key.find("_chunk_") != std::string_view::npos) {
            ++chunk_reads;
            auto lock = std::unique_lock(mutex_);
            cv_.wait(lock, [this] { return open_; });
        }
        return inner_.get(key);
    }

    [[nodiscard]] std::error_code put(std::string_view key, std::span<const std::byte> data) override {
        return inner_.put(key, data);
    }
    [[nodiscard]] std::error_code remove(std::string_view key) override { return inner_.remove(key); }
    [[nodiscard]] bool contains(std::string_view key) const override { return inner_.contains(key); }
    [[nodiscard]] std::uint64_t byte_count() const override { return inner_.byte_count(); }
    [[nodiscard]] std::error_code clear() override { return inner_.clear(); }

private:
    MemoryBlobStore inner_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool open_{false};
};

} // namespace

TEST_CASE("CacheCoordinator write contract", "[coordinator]") {
    auto store = std::make_shared<MemoryBlobStore>();

    SECTION("Chunks need content info first") {
        auto coordinator = CacheCoordinator::create(test_key(), store);
        CHECK(coordinator->save_chunk(payload(0, 10), 0) == make_error_code(CacheErrc::no_content_info));
        CHECK(store->size() == 0);
    }

    SECTION("Content info survives chunk writes and can be replaced") {
        auto coordinator = make_coordinator(store);
        store_chunk(*coordinator, 0, 100);
        REQUIRE_FALSE(coordinator->save_content_info({CONTENT_LENGTH, "video/quicktime", true}));

        auto meta = coordinator->retrieve_metadata();
        REQUIRE(meta.has_value());
        CHECK(meta->content_info.content_type == "video/quicktime");
        CHECK(meta->cached_ranges.ranges() == std::vector<CachedRange>{{0, 100}});
    }

    SECTION("Invalid chunk arguments") {
        auto coordinator = make_coordinator(store);
        CHECK(coordinator->save_chunk(payload(0, 10), -5) == make_error_code(CacheErrc::invalid_range));
        CHECK(coordinator->save_chunk(Bytes{}, 0) == make_error_code(CacheErrc::invalid_range));
    }

    SECTION("Writing the same chunk twice is idempotent") {
        auto coordinator = make_coordinator(store);
        store_chunk(*coordinator, 1'000, 500);
        auto once = coordinator->retrieve_metadata();
        auto bytes_once = store->byte_count();

        store_chunk(*coordinator, 1'000, 500);
        CHECK(coordinator->retrieve_metadata() == once);
        CHECK(store->byte_count() == bytes_once);
        CHECK(coordinator->retrieve_range(1'000, 500).data == payload(1'000, 500));
    }

    SECTION("A shorter rewrite never shrinks a chunk") {
        auto coordinator = make_coordinator(store);
        store_chunk(*coordinator, 0, 1'000);
        store_chunk(*coordinator, 0, 10);

        auto result = coordinator->retrieve_range(0, 1'000);
        CHECK(result.status == RetrieveStatus::Hit);
        CHECK(result.data == payload(0, 1'000));
    }

    SECTION("State is persistent across coordinators") {
        {
            auto coordinator = make_coordinator(store);
            store_chunk(*coordinator, 0, 2'048);
        }
        auto reopened = CacheCoordinator::create(test_key(), store);
        CHECK(reopened->is_range_cached(0, 2'048));
        CHECK(reopened->retrieve_range(0, 2'048).data == payload(0, 2'048));
    }

    SECTION("A longer rewrite only adds the uncovered tail") {
        auto coordinator = make_coordinator(store);
        store_chunk(*coordinator, 0, 100);
        store_chunk(*coordinator, 100, 50);
        store_chunk(*coordinator, 0, 300);

        auto meta = coordinator->retrieve_metadata();
        REQUIRE(meta.has_value());
        CHECK(meta->chunk_offsets() == std::vector<std::int64_t>{0, 100, 150});
        CHECK(meta->chunk_length(0) == 100);
        CHECK(meta->chunk_length(150) == 150);

        auto result = coordinator->retrieve_range(0, 300);
        CHECK(result.status == RetrieveStatus::Hit);
        CHECK(result.data == payload(0, 300));
    }

    SECTION("A failed record write after a longer rewrite keeps the old bytes readable") {
        auto flaky = std::make_shared<spool::test::FlakyBlobStore>();
        auto coordinator = make_coordinator(flaky);
        store_chunk(*coordinator, 0, 100);
        REQUIRE(coordinator->retrieve_range(0, 100).is_hit());

        flaky->fail_record_puts = true;
        CHECK(coordinator->save_chunk(payload(0, 200), 0));
        flaky->fail_record_puts = false;

        CHECK(coordinator->is_range_cached(0, 100));
        CHECK_FALSE(coordinator->is_range_cached(0, 200));
        auto result = coordinator->retrieve_range(0, 100);
        CHECK(result.status == RetrieveStatus::Hit);
        CHECK(result.data == payload(0, 100));

        // A fresh coordinator reads the same from the store
        auto reopened = CacheCoordinator::create(test_key(), flaky);
        CHECK(reopened->retrieve_range(0, 100).is_hit());
        CHECK(reopened->retrieve_range(0, 200).status == RetrieveStatus::Partial);

        // Retrying once the store recovers completes the range
        REQUIRE_FALSE(coordinator->save_chunk(payload(0, 200), 0));
        auto full = coordinator->retrieve_range(0, 200);
        CHECK(full.status == RetrieveStatus::Hit);
        CHECK(full.data == payload(0, 200));
    }

    SECTION("A failed blob write leaves the index unchanged") {
        auto flaky = std::make_shared<spool::test::FlakyBlobStore>();
        auto coordinator = make_coordinator(flaky);
        flaky->fail_puts = true;
        CHECK(coordinator->save_chunk(payload(0, 100), 0));
        flaky->fail_puts = false;

        CHECK_FALSE(coordinator->is_range_cached(0, 100));
        CHECK(coordinator->cached_ranges().empty());
    }
}

TEST_CASE("CacheCoordinator retrieval", "[coordinator]") {
    auto store = std::make_shared<MemoryBlobStore>();
    auto coordinator = make_coordinator(store);

    SECTION("Partial prefix across a gap") {
        store_chunk(*coordinator, 0, 100);
        store_chunk(*coordinator, 150, 50);

        auto result = coordinator->retrieve_range(0, 200);
        CHECK(result.status == RetrieveStatus::Partial);
        CHECK(result.data == payload(0, 100));
    }

    SECTION("Request starting in a gap is a miss") {
        store_chunk(*coordinator, 0, 100);
        store_chunk(*coordinator, 150, 50);
        CHECK(coordinator->retrieve_range(120, 10).status == RetrieveStatus::Miss);
        CHECK(coordinator->retrieve_range(9'000'000, 10).status == RetrieveStatus::Miss);
    }

    SECTION("Assembly across chunks and from the middle of a chunk") {
        store_chunk(*coordinator, 0, 300);
        store_chunk(*coordinator, 300, 300);
        store_chunk(*coordinator, 600, 300);

        auto result = coordinator->retrieve_range(250, 400);
        CHECK(result.status == RetrieveStatus::Hit);
        CHECK(result.data == payload(250, 400));
    }

    SECTION("Overlapping chunks") {
        store_chunk(*coordinator, 0, 500);
        store_chunk(*coordinator, 200, 600);

        auto result = coordinator->retrieve_range(100, 650);
        CHECK(result.status == RetrieveStatus::Hit);
        CHECK(result.data == payload(100, 650));
    }

    SECTION("Chunks at arbitrary offsets after a seek") {
        store_chunk(*coordinator, 0, 524'288);
        store_chunk(*coordinator, 3'333'333, 77'777);

        auto result = coordinator->retrieve_range(3'333'400, 1'000);
        CHECK(result.status == RetrieveStatus::Hit);
        CHECK(result.data == payload(3'333'400, 1'000));
        CHECK(coordinator->gaps(0, 4'000'000) ==
              std::vector<CachedRange>{{524'288, 3'333'333 - 524'288}, {3'411'110, 4'000'000 - 3'411'110}});
    }

    SECTION("Out-of-order arrival") {
        store_chunk(*coordinator, 2'000, 1'000);
        store_chunk(*coordinator, 0, 1'000);
        store_chunk(*coordinator, 1'000, 1'000);

        CHECK(coordinator->cached_ranges() == std::vector<CachedRange>{{0, 3'000}});
        CHECK(coordinator->retrieve_range(0, 3'000).data == payload(0, 3'000));
    }

    SECTION("Invalid requests miss") {
        CHECK(coordinator->retrieve_range(-1, 10).status == RetrieveStatus::Miss);
        CHECK(coordinator->retrieve_range(0, 0).status == RetrieveStatus::Miss);
    }

    SECTION("Async retrieval") {
        store_chunk(*coordinator, 0, 4'096);
        auto future = coordinator->retrieve_range_async(1'024, 1'024);
        auto result = future.get();
        CHECK(result.status == RetrieveStatus::Hit);
        CHECK(result.data == payload(1'024, 1'024));
    }
}

TEST_CASE("CacheCoordinator treats damaged chunks as gaps", "[coordinator]") {
    auto store = std::make_shared<MemoryBlobStore>();
    auto coordinator = make_coordinator(store);
    const auto key = test_key();

    store_chunk(*coordinator, 0, 100);
    store_chunk(*coordinator, 100, 100);
    store_chunk(*coordinator, 200, 100);

    SECTION("Blob of the wrong length") {
        REQUIRE_FALSE(store->put(key.chunk_key(100), payload(100, 40)));
        auto result = coordinator->retrieve_range(0, 300);
        CHECK(result.status == RetrieveStatus::Partial);
        CHECK(result.data == payload(0, 100));
    }

    SECTION("Missing blob") {
        REQUIRE_FALSE(store->remove(key.chunk_key(0)));
        CHECK(coordinator->retrieve_range(0, 300).status == RetrieveStatus::Miss);

        // Chunks after the damaged one are still served
        auto tail = coordinator->retrieve_range(100, 200);
        CHECK(tail.status == RetrieveStatus::Hit);
        CHECK(tail.data == payload(100, 200));
    }
}

TEST_CASE("CacheCoordinator returns a hit exactly when the range is covered", "[coordinator]") {
    auto store = std::make_shared<MemoryBlobStore>();
    auto coordinator = make_coordinator(store);

    std::uint64_t seed = 99;
    auto next = [&seed](std::int64_t bound) {
        seed = seed * 6364136223846793005ULL + 1442695040888963407ULL;
        return static_cast<std::int64_t>((seed >> 33) % static_cast<std::uint64_t>(bound));
    };

    for (int i = 0; i < 40; ++i) {
        store_chunk(*coordinator, next(50'000), 1 + next(3'000));
    }

    for (int i = 0; i < 300; ++i) {
        auto offset = next(55'000);
        auto length = 1 + next(4'000);
        const bool covered = coordinator->is_range_cached(offset, length);
        auto result = coordinator->retrieve_range(offset, length);

        CHECK((result.status == RetrieveStatus::Hit) == covered);
        if (covered) {
            CHECK(result.data == payload(offset, length));
        } else {
            CHECK(static_cast<std::int64_t>(result.data.size()) < length);
            CHECK(result.data == payload(offset, static_cast<std::int64_t>(result.data.size())));
        }
    }
}

TEST_CASE("CacheCoordinator sessions", "[coordinator]") {
    auto store = std::make_shared<MemoryBlobStore>();
    auto coordinator = make_coordinator(store, CachingConfig::aggressive());

    SECTION("Flushed bytes become visible while the transfer continues") {
        auto session = coordinator->open_session(1'000'000);
        REQUIRE(session.has_value());

        REQUIRE_FALSE((*session)->append(payload(1'000'000, 300'000)));
        CHECK(coordinator->is_range_cached(1'000'000, 300'000));

        REQUIRE_FALSE((*session)->append(payload(1'300'000, 5'000)));
        CHECK_FALSE(coordinator->is_range_cached(1'000'000, 305'000));

        REQUIRE_FALSE((*session)->finish());
        CHECK(coordinator->retrieve_range(1'000'000, 305'000).data == payload(1'000'000, 305'000));
    }

    SECTION("Cancelled session keeps what arrived") {
        auto session = coordinator->open_session(0);
        REQUIRE(session.has_value());
        REQUIRE_FALSE((*session)->append(payload(0, 12'345)));
        REQUIRE_FALSE((*session)->cancel());

        CHECK(coordinator->cached_ranges() == std::vector<CachedRange>{{0, 12'345}});
    }

    SECTION("Session keeps its coordinator alive") {
        auto session = coordinator->open_session(0);
        REQUIRE(session.has_value());
        coordinator.reset();

        REQUIRE_FALSE((*session)->append(payload(0, 100)));
        REQUIRE_FALSE((*session)->finish());

        auto reopened = CacheCoordinator::create(test_key(), store);
        CHECK(reopened->is_range_cached(0, 100));
    }

    SECTION("Negative start offset is rejected") {
        auto session = coordinator->open_session(-1);
        REQUIRE_FALSE(session.has_value());
        CHECK(session.error() == make_error_code(CacheErrc::invalid_range));
    }

    SECTION("Concurrent sessions on different offsets") {
        constexpr int sessions = 4;
        constexpr std::int64_t span = 600'000;
        std::atomic<int> errors{0};

        std::vector<std::thread> threads;
        for (int s = 0; s < sessions; ++s) {
            threads.emplace_back([&, s] {
                auto session = coordinator->open_session(s * span);
                if (!session) {
                    ++errors;
                    return;
                }
                for (std::int64_t off = 0; off < span; off += 10'000) {
                    if ((*session)->append(payload(s * span + off, 10'000))) ++errors;
                }
                if ((*session)->finish()) ++errors;
            });
        }
        for (auto& th : threads) th.join();

        CHECK(errors == 0);
        CHECK(coordinator->cached_ranges() == std::vector<CachedRange>{{0, sessions * span}});
        CHECK(coordinator->retrieve_range(0, sessions * span).data == payload(0, sessions * span));
    }
}

TEST_CASE("CacheCoordinator migrates legacy records", "[coordinator]") {
    auto store = std::make_shared<MemoryBlobStore>();
    const auto key = test_key();
    const auto body = payload(0, 76'737);
    REQUIRE_FALSE(store->put(key.str(), encode_legacy_record({76'737, "video/mp4", true}, body)));

    auto coordinator = CacheCoordinator::create(key, store);
    auto meta = coordinator->retrieve_metadata();
    REQUIRE(meta.has_value());
    CHECK(meta->cached_ranges.ranges() == std::vector<CachedRange>{{0, 76'737}});
    CHECK(meta->chunk_offsets() == std::vector<std::int64_t>{0});

    auto result = coordinator->retrieve_range(0, 76'737);
    CHECK(result.status == RetrieveStatus::Hit);
    CHECK(result.data == body);
}

TEST_CASE("CacheCoordinator keeps a legacy payload until it can be moved", "[coordinator]") {
    auto store = std::make_shared<spool::test::FlakyBlobStore>();
    const auto key = test_key();
    constexpr std::int64_t legacy_size = 76'737;
    const auto body = payload(0, legacy_size);
    REQUIRE_FALSE(store->put(key.str(), encode_legacy_record({1'000'000, "video/mp4", true}, body)));

    auto coordinator = CacheCoordinator::create(key, store);

    store->fail_puts = true;
    CHECK_FALSE(coordinator->retrieve_metadata().has_value());
    CHECK(coordinator->retrieve_range(0, legacy_size).status == RetrieveStatus::Miss);
    CHECK(coordinator->save_chunk(payload(50'000, 10), 50'000) ==
          make_error_code(CacheErrc::persistence_failed));
    CHECK(coordinator->save_content_info({1'000'000, "video/mp4", true}) ==
          make_error_code(CacheErrc::persistence_failed));

    // Nothing replaced the legacy record
    auto raw = store->get(key.str());
    REQUIRE(raw.has_value());
    REQUIRE(raw->has_value());
    auto decoded = decode_metadata(**raw);
    REQUIRE(decoded.has_value());
    CHECK(decoded->legacy_payload == body);

    // Once writes succeed the upgrade runs before the new chunk is stored
    store->fail_puts = false;
    REQUIRE_FALSE(coordinator->save_chunk(payload(900'000, 10), 900'000));

    auto reopened = CacheCoordinator::create(key, store);
    auto result = reopened->retrieve_range(0, legacy_size);
    CHECK(result.status == RetrieveStatus::Hit);
    CHECK(result.data == body);
    CHECK(reopened->cached_ranges() ==
          std::vector<CachedRange>{{0, legacy_size}, {900'000, 10}});
}

TEST_CASE("CacheCoordinator reads stay hits while the record is reloaded", "[coordinator]") {
    auto store = std::make_shared<MemoryBlobStore>();
    auto coordinator = make_coordinator(store);
    store_chunk(*coordinator, 0, 4'096);

    std::atomic<bool> stop{false};
    std::thread invalidator([&] {
        while (!stop) coordinator->invalidate();
    });

    constexpr int readers = 4;
    std::atomic<int> misses{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < readers; ++i) {
        threads.emplace_back([&, i] {
            for (int n = 0; n < 500; ++n) {
                if (!coordinator->retrieve_range(i * 64, 1'024).is_hit()) ++misses;
            }
        });
    }
    for (auto& th : threads) th.join();
    stop = true;
    invalidator.join();

    CHECK(misses == 0);
}

TEST_CASE("CacheCoordinator collapses identical concurrent reads", "[coordinator]") {
    auto store = std::make_shared<GatedBlobStore>();
    auto coordinator = make_coordinator(store);
    store_chunk(*coordinator, 0, 1'000);
    REQUIRE(coordinator->retrieve_metadata().has_value());

    constexpr int readers = 8;
    std::vector<RetrieveResult> results(readers);
    std::vector<std::thread> threads;
    for (int i = 0; i < readers; ++i) {
        threads.emplace_back([&, i] { results[i] = coordinator->retrieve_range(100, 500); });
    }

    // One reader is blocked on the chunk, the rest wait on it
    while (store->chunk_reads == 0 || coordinator->joined_reads() < readers - 1) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    store->release();
    for (auto& th : threads) th.join();

    CHECK(store->chunk_reads == 1);
    for (const auto& r : results) {
        CHECK(r.status == RetrieveStatus::Hit);
        CHECK(r.data == payload(100, 500));
    }

    CHECK(coordinator->joined_reads() == 0);

    // The entry is gone once resolved: a later read fetches again
    CHECK(coordinator->retrieve_range(100, 500).is_hit());
    CHECK(store->chunk_reads == 2);
}
