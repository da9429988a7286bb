// Copyright (c) 2026 changcheng967. All rights reserved.

#include <stitch/core/http_session.hpp>
#include <stitch/core/config.hpp>
#include <curl/curl.h>
#include <cctype>
#include <cstdlib>
#include <string_view>

namespace stitch::core {

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

// Header callback for HEAD/GET responses
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);

    // A new status line starts a new header block (redirects)
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
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n')) {
        value.remove_suffix(1);
    }

    try {
        std::string lower_name;
        lower_name.reserve(name.size());
        for (char c : name) {
            lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        (*headers)[lower_name] = std::string(value);
    } catch (const std::bad_alloc&) {
        return 0;  // Exceptions must not cross libcurl frames
    }
    return total;
}

struct WriteData {
    const BodySink* sink{nullptr};
    std::uint64_t total_written{0};
    bool aborted{false};
};

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* wd = static_cast<WriteData*>(userdata);
    std::size_t total = size * nitems;
    if (!wd || !wd->sink || !*wd->sink) return total;

    if (!(*wd->sink)(reinterpret_cast<const std::byte*>(ptr), total)) {
        // Returning a short count makes curl fail with CURLE_WRITE_ERROR
        wd->aborted = true;
        return 0;
    }
    wd->total_written += total;
    return total;
}

std::error_code status_to_error(long http_code) noexcept {
    if (http_code == 404 || http_code == 410) return make_error_code(FetchErrc::not_found);
    if (http_code == 401 || http_code == 403) return make_error_code(FetchErrc::permission_denied);
    if (http_code == 416) return make_error_code(FetchErrc::invalid_range);
    if (http_code >= 500) return make_error_code(FetchErrc::server_error);
    return make_error_code(FetchErrc::http_error);
}

std::error_code curl_to_error(CURLcode code, long http_code) noexcept {
    switch (code) {
        case CURLE_OK:                      return {};
        case CURLE_HTTP_RETURNED_ERROR:     return status_to_error(http_code);
        case CURLE_OPERATION_TIMEDOUT:      return make_error_code(FetchErrc::timeout);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:   return make_error_code(FetchErrc::dns_error);
        case CURLE_TOO_MANY_REDIRECTS:      return make_error_code(FetchErrc::too_many_redirects);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:    return make_error_code(FetchErrc::invalid_url);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:      return make_error_code(FetchErrc::ssl_error);
        case CURLE_PARTIAL_FILE:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:             return make_error_code(FetchErrc::connection_lost);
        case CURLE_WRITE_ERROR:             return make_error_code(FetchErrc::write_failed);
        case CURLE_RANGE_ERROR:             return make_error_code(FetchErrc::invalid_range);
        default:                            return make_error_code(FetchErrc::network_error);
    }
}

void apply_common_options(CURL* curl, const std::string& url, const std::string& user_agent) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());

    if constexpr (FOLLOW_REDIRECTS) {
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    }

    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(CONNECTION_TIMEOUT_SEC));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(STALL_TIMEOUT_SEC));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);          // Required for multi-threaded use
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);       // >= 400 is an error, no body delivered
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);
    curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(READ_BUFFER_SIZE));

    if (!user_agent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent.c_str());
    }
}

void fill_response(CURL* curl, HttpResponse& response) {
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);

    curl_off_t cl = -1;
    if (curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &cl) == CURLE_OK && cl >= 0) {
        response.content_length = static_cast<std::uint64_t>(cl);
    } else {
        // CURLINFO_CONTENT_LENGTH_DOWNLOAD_T is not set for HEAD
        auto cl_it = response.headers.find("content-length");
        if (cl_it != response.headers.end() && !cl_it->second.empty()) {
            char* end = nullptr;
            unsigned long long val = std::strtoull(cl_it->second.c_str(), &end, 10);
            if (end == cl_it->second.c_str() + cl_it->second.size()) {
                response.content_length = static_cast<std::uint64_t>(val);
            }
        }
    }

    char* ct = nullptr;
    if (curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &ct) == CURLE_OK && ct) {
        response.content_type = ct;
    }
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

std::expected<HttpResponse, std::error_code>
HttpSession::head(const std::string& url) noexcept {
    try {
        CurlHandle curl(curl_easy_init());
        if (!curl.ptr) {
            return std::unexpected(make_error_code(FetchErrc::network_error));
        }

        HttpResponse response{};

        apply_common_options(curl.ptr, url, user_agent_);
        curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response.headers);

        CURLcode result = curl_easy_perform(curl.ptr);
        fill_response(curl.ptr, response);

        if (result != CURLE_OK) {
            return std::unexpected(curl_to_error(result, response.status_code));
        }
        if (response.status_code < 200 || response.status_code >= 300) {
            return std::unexpected(status_to_error(response.status_code));
        }
        return response;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(FetchErrc::network_error));
    }
}

std::expected<HttpResponse, std::error_code>
HttpSession::get(const std::string& url,
                 const BodySink& sink,
                 std::uint64_t offset,
                 std::uint64_t size) noexcept {
    try {
        CurlHandle curl(curl_easy_init());
        if (!curl.ptr) {
            return std::unexpected(make_error_code(FetchErrc::network_error));
        }

        HttpResponse response{};
        WriteData wd;
        wd.sink = &sink;

        apply_common_options(curl.ptr, url, user_agent_);

        // Range header
        std::string range;
        if (size > 0) {
            range = std::to_string(offset) + "-" + std::to_string(offset + size - 1);
            curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());
        }

        curl_easy_setopt(curl.ptr, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response.headers);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &wd);

        CURLcode result = curl_easy_perform(curl.ptr);
        fill_response(curl.ptr, response);
        response.body_bytes = wd.total_written;

        if (result != CURLE_OK) {
            return std::unexpected(curl_to_error(result, response.status_code));
        }
        if (response.status_code < 200 || response.status_code >= 300) {
            return std::unexpected(status_to_error(response.status_code));
        }
        // A server that ignores Range answers 200 with the full entity
        if (size > 0 && response.status_code != 206) {
            return std::unexpected(make_error_code(FetchErrc::invalid_range));
        }
        return response;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(FetchErrc::network_error));
    }
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

} // namespace stitch::core
