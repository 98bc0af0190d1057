// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/http_session.hpp>
#include <ferry/core/random_id.hpp>
#include <ferry/core/config.hpp>
#include <ferry/core/log.hpp>
#include <ferry/core/url.hpp>
#include <curl/curl.h>
#include <cstdio>
#include <exception>
#include <memory>

namespace ferry::core {

namespace fs = std::filesystem;

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

struct FileCloser {
    void operator()(std::FILE* f) const noexcept { if (f) std::fclose(f); }
};

using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

// Header callback: a new status line starts a new header block (redirects)
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);
    if (header.starts_with("HTTP/")) {
        headers->clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    (*headers)[to_lower(name)] = std::string(value);
    return total;
}

struct TextSink {
    std::string body;
    bool overflow{false};
};

std::size_t text_write_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* sink = static_cast<TextSink*>(userdata);
    std::size_t total = size * nitems;
    if (sink->body.size() + total > MAX_MANIFEST_SIZE) {
        sink->overflow = true;
        return 0;
    }
    sink->body.append(ptr, total);
    return total;
}

// Streams the body to a file that is opened on the first chunk, once the
// final response headers (and so the server-provided name) are known.
struct FileSink {
    const DownloadRequest* request{nullptr};
    std::map<std::string, std::string> headers;
    FilePtr file;
    fs::path path;
    std::uint64_t written{0};
    bool write_failed{false};
    std::string error;

    bool open() {
        std::string header_name;
        auto cd = headers.find("content-disposition");
        if (cd != headers.end()) {
            header_name = HttpSession::parse_content_disposition(cd->second);
        }

        auto name = HttpSession::resolve_filename(header_name, request->url, request->fallback_name);
        path = request->dest_dir / name;

        // Never clobber an earlier item of the same batch
        for (int i = 1; fs::exists(path) && i < 1000; ++i) {
            auto stem = fs::path(name).stem().string();
            auto ext = fs::path(name).extension().string();
            path = request->dest_dir / (stem + " (" + std::to_string(i) + ")" + ext);
        }

        file.reset(std::fopen(path.c_str(), "wb"));
        if (!file) {
            error = "cannot open " + path.string();
            return false;
        }
        return true;
    }
};

std::size_t file_write_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* sink = static_cast<FileSink*>(userdata);
    std::size_t total = size * nitems;

    if (!sink->file && !sink->open()) {
        sink->write_failed = true;
        return 0;
    }

    if (std::fwrite(ptr, 1, total, sink->file.get()) != total) {
        sink->write_failed = true;
        sink->error = "write failed for " + sink->path.string();
        return 0;
    }
    sink->written += total;
    return total;
}

struct ProgressContext {
    const ProgressFn* progress{nullptr};
    std::exception_ptr error;  // Thrown by the callback, rethrown after the transfer
};

int xferinfo_callback(void* userdata, curl_off_t dltotal, curl_off_t dlnow,
                      curl_off_t, curl_off_t) {
    auto* ctx = static_cast<ProgressContext*>(userdata);
    // Only Content-Length-driven progress is reported
    if (ctx->progress && *ctx->progress && dltotal > 0) {
        // Exceptions must not unwind through libcurl
        try {
            (*ctx->progress)(static_cast<std::uint64_t>(dlnow), static_cast<std::uint64_t>(dltotal));
        } catch (...) {
            ctx->error = std::current_exception();
            return 1;
        }
    }
    return 0;
}

void apply_common_options(CURL* curl, const std::string& url, const std::string& user_agent,
                          char* error_buffer) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(CONNECTION_TIMEOUT_SEC));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(STALL_TIMEOUT_SEC));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
}

Failure map_curl_error(CURL* curl, CURLcode code, const char* error_buffer) {
    std::string detail = (error_buffer && *error_buffer) ? error_buffer : curl_easy_strerror(code);

    if (code == CURLE_HTTP_RETURNED_ERROR) {
        long http_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
        return Failure{TaskErrc::http_error, "HTTP " + std::to_string(http_code)};
    }
    if (code == CURLE_URL_MALFORMAT || code == CURLE_UNSUPPORTED_PROTOCOL) {
        return Failure{TaskErrc::invalid_url, detail};
    }
    return Failure{TaskErrc::network_error, detail};
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

std::expected<std::string, Failure> HttpSession::fetch_text(const std::string& url) {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(Failure{TaskErrc::network_error, "curl_easy_init failed"});
    }

    char error_buffer[CURL_ERROR_SIZE] = {0};
    TextSink sink;

    apply_common_options(curl.ptr, url, user_agent_, error_buffer);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, text_write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl.ptr, CURLOPT_ACCEPT_ENCODING, "");

    CURLcode result = curl_easy_perform(curl.ptr);
    if (sink.overflow) {
        return std::unexpected(Failure{TaskErrc::manifest_invalid, "response exceeds size limit"});
    }
    if (result != CURLE_OK) {
        auto failure = map_curl_error(curl.ptr, result, error_buffer);
        logger("http")->warn("GET {} failed: {}", url, failure.message());
        return std::unexpected(std::move(failure));
    }

    return std::move(sink.body);
}

std::expected<fs::path, Failure>
HttpSession::download(const DownloadRequest& request, const ProgressFn& progress) {
    std::error_code ec;
    fs::create_directories(request.dest_dir, ec);
    if (ec) {
        return std::unexpected(Failure{TaskErrc::resource_error, ec.message()});
    }

    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(Failure{TaskErrc::network_error, "curl_easy_init failed"});
    }

    char error_buffer[CURL_ERROR_SIZE] = {0};
    FileSink sink;
    sink.request = &request;
    ProgressContext progress_ctx{&progress};

    apply_common_options(curl.ptr, request.url, user_agent_, error_buffer);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &sink.headers);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, file_write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &progress_ctx);
    curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(READ_CHUNK_SIZE));

    logger("http")->debug("GET {}", request.url);
    CURLcode result = curl_easy_perform(curl.ptr);

    auto discard_partial = [&sink] {
        sink.file.reset();
        if (!sink.path.empty()) {
            std::error_code rm_ec;
            fs::remove(sink.path, rm_ec);
        }
    };

    if (progress_ctx.error) {
        discard_partial();
        std::rethrow_exception(progress_ctx.error);
    }
    if (sink.write_failed) {
        discard_partial();
        return std::unexpected(Failure{TaskErrc::resource_error, sink.error});
    }
    if (result != CURLE_OK) {
        auto failure = map_curl_error(curl.ptr, result, error_buffer);
        discard_partial();
        return std::unexpected(std::move(failure));
    }

    // Empty body: still materialize the (empty) file
    if (!sink.file && !sink.open()) {
        return std::unexpected(Failure{TaskErrc::resource_error, sink.error});
    }

    if (std::fflush(sink.file.get()) != 0) {
        discard_partial();
        return std::unexpected(Failure{TaskErrc::resource_error, "flush failed"});
    }
    sink.file.reset();

    if (progress && sink.written > 0) {
        progress(sink.written, sink.written);
    }

    logger("http")->info("saved {} ({})", sink.path.filename().string(), human_bytes(sink.written));
    return sink.path;
}

std::string HttpSession::parse_content_disposition(std::string_view value) {
    auto trim = [](std::string_view v, std::string_view chars) {
        auto first = v.find_first_not_of(chars);
        if (first == std::string_view::npos) return std::string_view{};
        auto last = v.find_last_not_of(chars);
        return v.substr(first, last - first + 1);
    };

    std::string plain;
    std::string extended;

    std::size_t pos = 0;
    while (pos <= value.size()) {
        auto semi = value.find(';', pos);
        if (semi == std::string_view::npos) semi = value.size();
        auto param = value.substr(pos, semi - pos);
        pos = semi + 1;

        auto eq = param.find('=');
        if (eq == std::string_view::npos) continue;
        auto key = to_lower(trim(param.substr(0, eq), " \t"));
        auto val = trim(param.substr(eq + 1), " \t");

        if (key == "filename*") {
            // charset'language'percent-encoded
            auto q1 = val.find('\'');
            auto q2 = q1 == std::string_view::npos ? q1 : val.find('\'', q1 + 1);
            if (q2 == std::string_view::npos) continue;
            auto decoded = percent_decode(val.substr(q2 + 1));
            extended = std::string(trim(decoded, "\" "));
        } else if (key == "filename" && plain.empty()) {
            plain = std::string(trim(val, "\" "));
        }
    }
    return extended.empty() ? plain : extended;
}

std::string HttpSession::resolve_filename(std::string_view header_name,
                                          std::string_view url,
                                          std::string_view fallback) {
    // Only the last component is ever used; no traversal out of dest_dir
    auto sanitize = [](std::string_view name) -> std::string {
        auto slash = name.find_last_of("/\\");
        if (slash != std::string_view::npos) name = name.substr(slash + 1);
        if (name == "." || name == "..") return {};
        return std::string(name);
    };

    if (auto name = sanitize(header_name); !name.empty()) {
        return name;
    }

    auto base = strip_query_and_fragment(url);
    auto slash = base.rfind('/');
    auto scheme = base.find("://");
    if (slash != std::string_view::npos && (scheme == std::string_view::npos || slash > scheme + 2)) {
        if (auto name = sanitize(percent_decode(base.substr(slash + 1))); !name.empty()) {
            return name;
        }
    }

    if (auto name = sanitize(fallback); !name.empty()) {
        return name;
    }

    return "file_" + random_hex();
}

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace ferry::core
