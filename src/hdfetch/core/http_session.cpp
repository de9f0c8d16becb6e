// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hdfetch/core/http_session.hpp>
#include <hdfetch/core/config.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace hdfetch::core {

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

// Per-transfer state shared with the curl callbacks
struct Transfer {
    CURL* curl{nullptr};
    const ChunkSink* sink{nullptr};
    std::stop_token stoken;
    ByteRange range;
    std::uint64_t delivered{0};
    bool status_checked{false};
    std::error_code error;   // Set by a callback that aborted the transfer
};

// Header callback for HEAD responses
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);
    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    (*headers)[lower_name] = std::string(value);
    return total;
}

// Validates the response status on the first body byte, then forwards
// chunks to the sink. Returning anything but `bytes` aborts the transfer.
std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* t = static_cast<Transfer*>(userdata);
    std::size_t bytes = size * nmemb;

    if (t->stoken.stop_requested()) {
        t->error = make_error_code(FetchErrc::cancelled);
        return 0;
    }

    if (!t->status_checked) {
        t->status_checked = true;
        long status = 0;
        curl_easy_getinfo(t->curl, CURLINFO_RESPONSE_CODE, &status);

        if (auto ec = http_status_to_error(status)) {
            t->error = ec;
            return 0;
        }
        // 200 to a ranged request that does not start at 0 means the server
        // ignored the Range header and is sending the whole resource
        if (status == 200 && t->range.offset > 0) {
            t->error = make_error_code(FetchErrc::unsupported_range);
            return 0;
        }
    }

    if (t->range.bounded && t->delivered + bytes > t->range.length) {
        t->error = make_error_code(FetchErrc::unsupported_range);
        return 0;
    }

    try {
        auto ec = (*t->sink)(std::span<const std::byte>(reinterpret_cast<const std::byte*>(ptr), bytes));
        if (ec) {
            t->error = ec;
            return 0;
        }
    } catch (const std::bad_alloc&) {
        t->error = std::make_error_code(std::errc::not_enough_memory);
        return 0;
    }

    t->delivered += bytes;
    return bytes;
}

// Progress callback - aborts the transfer once stop is requested
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* t = static_cast<Transfer*>(userdata);
    return t->stoken.stop_requested() ? 1 : 0;
}

std::error_code curl_to_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OK:
            return {};
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(FetchErrc::timeout);
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
            return make_error_code(FetchErrc::connection_lost);
        case CURLE_ABORTED_BY_CALLBACK:
            return make_error_code(FetchErrc::cancelled);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return make_error_code(FetchErrc::http_error);
        default:
            return make_error_code(FetchErrc::network_error);
    }
}

void common_options(CURL* curl, const std::string& address) {
    curl_easy_setopt(curl, CURLOPT_URL, address.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(CONNECTION_TIMEOUT_SEC));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
}

} // namespace

std::error_code http_status_to_error(long status) noexcept {
    if (status >= 200 && status < 300) return {};
    if (status == 404 || status == 410) return make_error_code(FetchErrc::not_found);
    if (status == 408) return make_error_code(FetchErrc::timeout);
    if (status == 429 || status >= 500) return make_error_code(FetchErrc::server_error);
    return make_error_code(FetchErrc::http_error);
}

//=============================================================================
// HttpSession
//=============================================================================

std::expected<ResourceInfo, std::error_code>
HttpSession::probe(const std::string& address) {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(FetchErrc::network_error));
    }

    std::map<std::string, std::string> headers;
    common_options(curl.ptr, address);
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &headers);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        spdlog::debug("HEAD {} failed: {}", address, curl_easy_strerror(result));
        return std::unexpected(curl_to_error(result));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    if (auto ec = http_status_to_error(http_code)) {
        return std::unexpected(ec);
    }

    ResourceInfo info;
    info.status_code = static_cast<std::int32_t>(http_code);
    parse_headers(headers, info);
    return info;
}

std::error_code HttpSession::fetch(const std::string& address, const ByteRange& range,
                                   const ChunkSink& sink, std::stop_token stoken) {
    if (range.empty()) {
        return {};
    }
    if (stoken.stop_requested()) {
        return make_error_code(FetchErrc::cancelled);
    }

    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return make_error_code(FetchErrc::network_error);
    }

    Transfer transfer;
    transfer.curl = curl.ptr;
    transfer.sink = &sink;
    transfer.stoken = stoken;
    transfer.range = range;

    common_options(curl.ptr, address);

    // A plain GET for the whole resource, a Range header otherwise
    std::string range_value;
    if (range.bounded || range.offset > 0) {
        range_value = range.header_value();
        curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range_value.c_str());
    }

    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &transfer);
    curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

    // Stall detection
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(STALL_TIMEOUT_SEC));
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);

    curl_easy_setopt(curl.ptr, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(READ_BUFFER_SIZE));
    curl_easy_setopt(curl.ptr, CURLOPT_TCP_NODELAY, 1L);

    CURLcode result = curl_easy_perform(curl.ptr);

    // An error raised inside a callback explains the abort better than curl can
    if (transfer.error) {
        return transfer.error;
    }
    if (result != CURLE_OK) {
        spdlog::debug("GET {} [{}] failed: {}", address, range_value, curl_easy_strerror(result));
        return curl_to_error(result);
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    if (auto ec = http_status_to_error(http_code)) {
        return ec;
    }

    if (range.bounded && transfer.delivered < range.length) {
        return make_error_code(FetchErrc::short_read);
    }

    return {};
}

void HttpSession::parse_headers(const std::map<std::string, std::string>& headers,
                                ResourceInfo& info) noexcept {
    auto cl_it = headers.find("content-length");
    if (cl_it != headers.end() && !cl_it->second.empty()) {
        char* end = nullptr;
        unsigned long long val = std::strtoull(cl_it->second.c_str(), &end, 10);
        if (end == cl_it->second.c_str() + cl_it->second.size()) {
            info.content_length = static_cast<std::uint64_t>(val);
        }
    }

    auto ct_it = headers.find("content-type");
    if (ct_it != headers.end()) {
        info.content_type = ct_it->second;
    }

    auto ar_it = headers.find("accept-ranges");
    info.accepts_ranges = (ar_it != headers.end() && ar_it->second.find("bytes") != std::string::npos);
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace hdfetch::core
