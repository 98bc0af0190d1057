// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/links/link_session.hpp>
#include "test_support.hpp"

using namespace ferry::links;

TEST_CASE("make_batch keeps raw text and every URL", "[links]") {
    auto batch = make_batch("a https://x.com/1 b https://x.com/1 c");
    CHECK(batch.raw_content == "a https://x.com/1 b https://x.com/1 c");
    CHECK(batch.extracted_urls.size() == 2);
}

TEST_CASE("clean_links", "[links]") {
    SECTION("Sorted and unique") {
        auto batch = make_batch("https://b.com/2 https://a.com/1 https://b.com/2");
        CHECK(clean_links(batch) == "https://a.com/1\nhttps://b.com/2");
    }

    SECTION("Placeholder when nothing was found") {
        CHECK(clean_links(make_batch("no links")) == NO_LINKS_TEXT);
    }

    SECTION("Truncated to the message limit") {
        std::string text;
        for (int i = 0; i < 500; ++i) {
            text += "https://example.com/file-" + std::to_string(i) + ".zip ";
        }
        auto clean = clean_links(make_batch(text));
        CHECK(clean.size() == ferry::core::CLEAN_TEXT_LIMIT);
    }
}

TEST_CASE("read_text_document", "[links]") {
    ferry::test::TempDir dir;
    ferry::test::write_file(dir / "links.txt", "https://a.com/x.zip\n");

    auto text = read_text_document(dir / "links.txt");
    REQUIRE(text.has_value());
    CHECK(*text == "https://a.com/x.zip\n");

    auto missing = read_text_document(dir / "absent.txt");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().is(ferry::core::TaskErrc::resource_error));
}

TEST_CASE("LinkSessionStore keys by chat and message", "[links]") {
    LinkSessionStore store;
    store.put(1, 10, make_batch("https://a.com/x"));
    store.put(1, 11, make_batch("https://b.com/y"));
    store.put(2, 10, make_batch(""));

    CHECK(store.size() == 3);
    REQUIRE(store.get(1, 11).has_value());
    CHECK(store.get(1, 11)->extracted_urls.front() == "https://b.com/y");
    CHECK_FALSE(store.get(3, 10).has_value());

    CHECK(store.erase(1, 10));
    CHECK_FALSE(store.erase(1, 10));
    CHECK(store.size() == 2);
}
