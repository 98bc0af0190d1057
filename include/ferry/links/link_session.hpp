// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/error.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ferry::links {

using ChatId = std::int64_t;
using MessageId = std::int64_t;

// Links pulled from one inbound message. Raw text is not deduplicated.
struct LinkBatch {
    std::string raw_content;
    std::vector<std::string> extracted_urls;
};

// Build a batch from message text
[[nodiscard]] LinkBatch make_batch(std::string text);

// Read a text document (bytes kept as-is, invalid UTF-8 tolerated)
[[nodiscard]] std::expected<std::string, core::Failure>
read_text_document(const std::filesystem::path& path);

constexpr std::string_view NO_LINKS_TEXT = "No valid URLs found.";

// Sorted unique URLs joined by newlines, capped at CLEAN_TEXT_LIMIT characters.
// NO_LINKS_TEXT for an empty batch.
[[nodiscard]] std::string clean_links(const LinkBatch& batch);

// Batches remembered per (chat, message) so follow-up actions reuse the parse
class LinkSessionStore {
public:
    using Key = std::pair<ChatId, MessageId>;

    void put(ChatId chat, MessageId message, LinkBatch batch);
    [[nodiscard]] std::optional<LinkBatch> get(ChatId chat, MessageId message) const;
    bool erase(ChatId chat, MessageId message);

    [[nodiscard]] std::size_t size() const;

private:
    std::map<Key, LinkBatch> batches_;
    mutable std::mutex mutex_;
};

} // namespace ferry::links
