// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <spool/core/chunk_store.hpp>
#include <spool/core/error.hpp>
#include "test_helpers.hpp"

using namespace spool::core;
using spool::disk::MemoryBlobStore;
using spool::test::payload;

TEST_CASE("ChunkStore", "[chunk_store]") {
    MemoryBlobStore blobs;
    MetadataStore metadata(blobs);
    ChunkStore chunks(blobs, metadata);
    const auto key = *ResourceKey::from_string("video-42");

    SECTION("Blobs are keyed by resource and offset") {
        REQUIRE_FALSE(chunks.put(key, 524'288, payload(524'288, 100)));
        CHECK(blobs.contains("video-42_chunk_524288"));

        auto got = chunks.get(key, 524'288);
        REQUIRE(got.has_value());
        CHECK(*got == payload(524'288, 100));
        CHECK_FALSE(chunks.get(key, 0).has_value());
    }

    SECTION("Invalid chunks are rejected") {
        CHECK(chunks.put(key, -1, payload(0, 10)) == make_error_code(CacheErrc::invalid_range));
        CHECK(chunks.put(key, 0, Bytes{}) == make_error_code(CacheErrc::invalid_range));
        CHECK(blobs.size() == 0);
    }

    SECTION("Known offsets come from the metadata record, not from the blobs") {
        // An unindexed blob is not reported
        REQUIRE_FALSE(chunks.put(key, 7, payload(7, 3)));
        CHECK(chunks.list_known_offsets(key).empty());

        AssetMetadata meta;
        meta.content_info.content_length = 10'000;
        REQUIRE_FALSE(meta.add_chunk(900, 100));
        REQUIRE_FALSE(meta.add_chunk(0, 300));
        REQUIRE_FALSE(metadata.save(key, meta));

        CHECK(chunks.list_known_offsets(key) == std::vector<std::int64_t>{0, 900});
    }

    SECTION("Remove") {
        REQUIRE_FALSE(chunks.put(key, 0, payload(0, 10)));
        REQUIRE_FALSE(chunks.remove(key, 0));
        CHECK_FALSE(chunks.get(key, 0).has_value());
    }
}
