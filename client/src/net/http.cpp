#include "net/http.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <curl/curl.h>

#include "errors.hpp"
#include "log.hpp"

constexpr const char* USER_AGENT = "urlstream/1.0 (libcurl)";

namespace {
void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

// Callback function to write response headers. A new status line starts a new
// header block, so only the final response of a redirect chain is kept.
size_t header_callback(char* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    if (total_size >= 5 && std::strncmp(contents, "HTTP/", 5) == 0) {
        userp->clear();
    }
    userp->append(contents, total_size);
    return total_size;
}

// Helper function to convert string to lowercase
std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// Helper function to trim whitespace
std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t");
    if (first == std::string::npos)
        return "";
    size_t last = str.find_last_not_of(" \t");
    return str.substr(first, (last - first + 1));
}

void apply_common_options(CURL* handle) {
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(handle, CURLOPT_USERAGENT, USER_AGENT);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    // Prefer HTTP/2 over TLS if available (falls back automatically)
    curl_easy_setopt(handle, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    // Byte ranges must address the stored representation, never a re-encoded one
    curl_easy_setopt(handle, CURLOPT_ACCEPT_ENCODING, nullptr);
}
} // namespace

struct http_client::body_sink {
    std::string* text = nullptr;
    std::uint8_t* dest = nullptr;
    std::size_t capacity = 0;
    std::size_t written = 0;
    bool overflow = false;
    bool headers_only = false;
    bool stopped_early = false;

    static size_t write(char* contents, size_t size, size_t nmemb, body_sink* sink) {
        size_t total_size = size * nmemb;
        if (sink->headers_only) {
            sink->stopped_early = true;
            return 0;
        }
        if (sink->dest) {
            if (total_size > sink->capacity - sink->written) {
                sink->overflow = true;
                return 0;
            }
            std::memcpy(sink->dest + sink->written, contents, total_size);
        } else if (sink->text) {
            sink->text->append(contents, total_size);
        }
        sink->written += total_size;
        return total_size;
    }
};

class http_client::impl {
public:
    impl() : curl_handle(nullptr), timeout_seconds(60), connect_timeout_seconds(10) {
        ensure_curl_global_init();
        curl_handle = curl_easy_init();
        if (!curl_handle) {
            throw std::runtime_error("Failed to initialize curl handle");
        }

        curl_easy_setopt(curl_handle, CURLOPT_WRITEFUNCTION, body_sink::write);
        curl_easy_setopt(curl_handle, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl_handle, CURLOPT_TIMEOUT, timeout_seconds);
        curl_easy_setopt(curl_handle, CURLOPT_CONNECTTIMEOUT, connect_timeout_seconds);
        apply_common_options(curl_handle);
    }

    ~impl() {
        if (curl_handle) {
            curl_easy_cleanup(curl_handle);
        }
    }

    impl(const impl&) = delete;
    impl& operator=(const impl&) = delete;

    CURL* curl_handle;
    long timeout_seconds;
    long connect_timeout_seconds;
};

http_client::http_client() : pimpl(std::make_unique<impl>()) {}

http_client::~http_client() = default;

http_client::http_client(http_client&&) noexcept = default;
http_client& http_client::operator=(http_client&&) noexcept = default;

http_client::response http_client::get(const request& req) {
    std::string body;
    body_sink sink;
    sink.text = &body;
    sink.headers_only = req.headers_only;
    response resp = perform_request(req, sink);
    resp.body = std::move(body);
    return resp;
}

http_client::response http_client::get_into(const request& req, std::uint8_t* dest,
                                            std::size_t capacity) {
    body_sink sink;
    sink.dest = dest;
    sink.capacity = capacity;
    return perform_request(req, sink);
}

void http_client::set_timeout(long timeout_seconds) {
    pimpl->timeout_seconds = timeout_seconds;
    curl_easy_setopt(pimpl->curl_handle, CURLOPT_TIMEOUT, timeout_seconds);
}

void http_client::set_connect_timeout(long timeout_seconds) {
    pimpl->connect_timeout_seconds = timeout_seconds;
    curl_easy_setopt(pimpl->curl_handle, CURLOPT_CONNECTTIMEOUT, timeout_seconds);
}

http_client::response http_client::perform_request(const request& req, body_sink& sink) {
    response resp;
    std::string response_headers;

    print_request_details(req);

    curl_easy_setopt(pimpl->curl_handle, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(pimpl->curl_handle, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(pimpl->curl_handle, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(pimpl->curl_handle, CURLOPT_HEADERDATA, &response_headers);

    // Set custom headers
    struct curl_slist* header_list = nullptr;
    for (const auto& header : req.headers) {
        std::string header_string = header.first + ": " + header.second;
        header_list = curl_slist_append(header_list, header_string.c_str());
    }
    curl_easy_setopt(pimpl->curl_handle, CURLOPT_HTTPHEADER, header_list);

    CURLcode res = curl_easy_perform(pimpl->curl_handle);

    // Clear the list from the handle to avoid a dangling pointer across requests
    curl_easy_setopt(pimpl->curl_handle, CURLOPT_HTTPHEADER, nullptr);
    curl_slist_free_all(header_list);

    resp.bytes_received = sink.written;
    resp.body_overflow = sink.overflow;

    bool abandoned_on_purpose = res == CURLE_WRITE_ERROR && sink.stopped_early;
    if (res != CURLE_OK && !abandoned_on_purpose && !sink.overflow) {
        resp.error = curl_easy_strerror(res);
        URLSTREAM_LOG(std::cerr << "[HTTP] curl_easy_perform() failed: " << resp.error
                                << std::endl);
        return resp;
    }

    long status_code = 0;
    curl_easy_getinfo(pimpl->curl_handle, CURLINFO_RESPONSE_CODE, &status_code);
    resp.status_code = static_cast<int>(status_code);
    if (sink.overflow) {
        resp.error = "response body larger than " + std::to_string(sink.capacity) + " bytes";
    }

    parse_response_headers(response_headers, resp);
    print_response_details(resp);
    return resp;
}

void http_client::parse_response_headers(const std::string& header_string, response& resp) {
    std::istringstream stream(header_string);
    std::string line;

    while (std::getline(stream, line)) {
        // Remove carriage return if present
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        size_t colon_pos = line.find(':');
        if (colon_pos != std::string::npos) {
            std::string header_name = trim(line.substr(0, colon_pos));
            std::string header_value = trim(line.substr(colon_pos + 1));
            resp.headers[to_lower(header_name)] = header_value;
        }
    }
}

void http_client::print_request_details(const request& req) {
    URLSTREAM_LOG(std::cout << "[HTTP] GET " << req.url << std::endl);
    for (const auto& header : req.headers) {
        URLSTREAM_LOG(std::cout << "[HTTP]   " << header.first << ": " << header.second
                                << std::endl);
    }
}

void http_client::print_response_details(const response& resp) {
    URLSTREAM_LOG(std::cout << "[HTTP] Status " << resp.status_code << ", "
                            << resp.bytes_received << " bytes" << std::endl);
    for (const auto& header : resp.headers) {
        URLSTREAM_LOG(std::cout << "[HTTP]   " << header.first << ": " << header.second
                                << std::endl);
    }
}

class http_body_stream::impl {
public:
    static constexpr std::size_t high_water = 1024 * 1024;

    impl() : multi(nullptr), easy(nullptr), pending_offset(0), paused(false), done(false),
             result(CURLE_OK), status_code(0) {}

    ~impl() {
        if (multi && easy) {
            curl_multi_remove_handle(multi, easy);
        }
        if (easy) {
            curl_easy_cleanup(easy);
        }
        if (multi) {
            curl_multi_cleanup(multi);
        }
    }

    std::size_t available() const {
        return pending.size() - pending_offset;
    }

    static size_t write(char* contents, size_t size, size_t nmemb, impl* self) {
        size_t total_size = size * nmemb;
        if (self->status_code == 0) {
            long code = 0;
            curl_easy_getinfo(self->easy, CURLINFO_RESPONSE_CODE, &code);
            self->status_code = static_cast<int>(code);
        }
        if (self->status_code >= 400) {
            return 0;
        }
        if (self->available() >= high_water) {
            self->paused = true;
            return CURL_WRITEFUNC_PAUSE;
        }
        if (self->pending_offset > 0) {
            self->pending.erase(self->pending.begin(),
                                self->pending.begin() +
                                    static_cast<std::ptrdiff_t>(self->pending_offset));
            self->pending_offset = 0;
        }
        self->pending.insert(self->pending.end(), contents, contents + total_size);
        return total_size;
    }

    void pump() {
        int running = 0;
        CURLMcode mc = curl_multi_perform(multi, &running);
        if (mc != CURLM_OK) {
            throw fetch_error(std::string("curl_multi_perform() failed: ") +
                              curl_multi_strerror(mc));
        }

        int left = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi, &left)) {
            if (msg->msg == CURLMSG_DONE) {
                done = true;
                result = msg->data.result;
            }
        }

        if (!done && running) {
            curl_multi_poll(multi, nullptr, 0, 1000, nullptr);
        } else if (!running) {
            done = true;
        }
    }

    CURLM* multi;
    CURL* easy;
    std::vector<std::uint8_t> pending;
    std::size_t pending_offset;
    bool paused;
    bool done;
    CURLcode result;
    int status_code;
    std::string url;
};

http_body_stream::http_body_stream(const std::string& url, long connect_timeout_seconds,
                                   long stall_timeout_seconds)
    : pimpl(std::make_unique<impl>()) {
    ensure_curl_global_init();
    pimpl->url = url;
    pimpl->multi = curl_multi_init();
    pimpl->easy = curl_easy_init();
    if (!pimpl->multi || !pimpl->easy) {
        throw std::runtime_error("Failed to initialize curl handle");
    }

    apply_common_options(pimpl->easy);
    curl_easy_setopt(pimpl->easy, CURLOPT_URL, url.c_str());
    curl_easy_setopt(pimpl->easy, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(pimpl->easy, CURLOPT_CONNECTTIMEOUT, connect_timeout_seconds);
    // A whole-object stream may legitimately run for hours; only stalls are fatal
    curl_easy_setopt(pimpl->easy, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(pimpl->easy, CURLOPT_LOW_SPEED_TIME, stall_timeout_seconds);
    curl_easy_setopt(pimpl->easy, CURLOPT_WRITEFUNCTION, impl::write);
    curl_easy_setopt(pimpl->easy, CURLOPT_WRITEDATA, pimpl.get());
    curl_multi_add_handle(pimpl->multi, pimpl->easy);

    URLSTREAM_LOG(std::cout << "[HTTP] Streaming GET " << url << std::endl);
}

http_body_stream::~http_body_stream() = default;

std::size_t http_body_stream::read(std::uint8_t* dest, std::size_t capacity) {
    if (capacity == 0)
        return 0;

    while (pimpl->available() == 0 && !pimpl->done) {
        if (pimpl->paused) {
            pimpl->paused = false;
            curl_easy_pause(pimpl->easy, CURLPAUSE_CONT);
            continue;
        }
        pimpl->pump();
    }

    if (pimpl->available() == 0) {
        if (pimpl->status_code == 0) {
            long code = 0;
            curl_easy_getinfo(pimpl->easy, CURLINFO_RESPONSE_CODE, &code);
            pimpl->status_code = static_cast<int>(code);
        }
        if (pimpl->status_code >= 400) {
            throw fetch_error("http status " + std::to_string(pimpl->status_code) + " for " +
                                  pimpl->url,
                              fetch_error::no_part, pimpl->status_code);
        }
        if (pimpl->result != CURLE_OK) {
            throw fetch_error(std::string("streaming GET failed: ") +
                              curl_easy_strerror(pimpl->result));
        }
        return 0;
    }

    std::size_t n = std::min(capacity, pimpl->available());
    std::memcpy(dest, pimpl->pending.data() + pimpl->pending_offset, n);
    pimpl->pending_offset += n;
    return n;
}
