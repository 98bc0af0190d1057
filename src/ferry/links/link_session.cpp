// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/links/link_session.hpp>
#include <ferry/links/link_classifier.hpp>
#include <ferry/core/config.hpp>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <set>

namespace ferry::links {

LinkBatch make_batch(std::string text) {
    LinkBatch batch;
    batch.extracted_urls = find_links(text);
    batch.raw_content = std::move(text);
    return batch;
}

std::expected<std::string, core::Failure>
read_text_document(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(core::Failure(core::TaskErrc::resource_error,
                                             "cannot open " + path.string()));
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::string clean_links(const LinkBatch& batch) {
    if (batch.extracted_urls.empty()) {
        return std::string(NO_LINKS_TEXT);
    }

    std::set<std::string> unique(batch.extracted_urls.begin(), batch.extracted_urls.end());

    std::string text;
    for (const auto& url : unique) {
        if (!text.empty()) text += '\n';
        text += url;
    }
    if (text.size() > core::CLEAN_TEXT_LIMIT) {
        text.resize(core::CLEAN_TEXT_LIMIT);
    }
    return text;
}

void LinkSessionStore::put(ChatId chat, MessageId message, LinkBatch batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    batches_[{chat, message}] = std::move(batch);
}

std::optional<LinkBatch> LinkSessionStore::get(ChatId chat, MessageId message) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = batches_.find({chat, message});
    if (it == batches_.end()) return std::nullopt;
    return it->second;
}

bool LinkSessionStore::erase(ChatId chat, MessageId message) {
    std::lock_guard<std::mutex> lock(mutex_);
    return batches_.erase({chat, message}) > 0;
}

std::size_t LinkSessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return batches_.size();
}

} // namespace ferry::links
