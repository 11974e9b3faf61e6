// src/http/curl_transport.cpp
#include "pipeflow/http/http_client.h"
#include "pipeflow/core/errors.h"
#include "common/utils.h"
#include <curl/curl.h>
#include <iostream>
#include <mutex>

namespace pipeflow {

namespace {

struct ResponseData {
    std::string body;
    HeaderMap headers;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* data = static_cast<ResponseData*>(userdata);
    size_t total = size * nmemb;
    data->body.append(ptr, total);
    return total;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* data = static_cast<ResponseData*>(userdata);
    size_t total = size * nitems;

    std::string header(buffer, total);
    while (!header.empty() && (header.back() == '\r' || header.back() == '\n')) {
        header.pop_back();
    }

    // A new status line (redirect, 100-continue) starts a fresh header block
    if (header.rfind("HTTP/", 0) == 0) {
        data->headers.clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon != std::string::npos) {
        data->headers[to_lower(header.substr(0, colon))] = trim(header.substr(colon + 1));
    }
    return total;
}

void ensure_curl_global_init() {
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

} // namespace

struct CurlHttpTransport::Impl {
    HttpClientOptions options;
    CURL* curl = nullptr;
    std::mutex mutex;

    void configure() {
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.verify_ssl ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.verify_ssl ? 2L : 0L);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, options.timeout_ms);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, options.connect_timeout_ms);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, options.user_agent.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    }
};

CurlHttpTransport::CurlHttpTransport(HttpClientOptions options)
    : impl_(std::make_unique<Impl>()) {
    ensure_curl_global_init();
    impl_->options = std::move(options);
    impl_->curl = curl_easy_init();
    if (impl_->curl == nullptr) {
        throw NetworkError("Failed to initialize libcurl handle");
    }
}

CurlHttpTransport::~CurlHttpTransport() {
    if (impl_ && impl_->curl) {
        curl_easy_cleanup(impl_->curl);
    }
}

HttpResponse CurlHttpTransport::send(const HttpRequest& request) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    CURL* curl = impl_->curl;

    curl_easy_reset(curl);
    impl_->configure();

    const std::string method = to_upper(request.method);
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    if (method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else if (method == "HEAD") {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    }
    const std::optional<std::string> payload = request_payload(request);
    if (payload.has_value()) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload->size()));
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : request.headers) {
        std::string header = key + ": " + value;
        header_list = curl_slist_append(header_list, header.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);

    ResponseData data;
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &data);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &data);

    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(header_list);

    if (res != CURLE_OK) {
        throw NetworkError(std::string("Network Error: ") + curl_easy_strerror(res));
    }

    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);

    HttpResponse response;
    response.status = static_cast<int>(code);
    response.status_text = status_text_for(response.status);
    response.headers = std::move(data.headers);
    response.data = parse_response_body(response.headers, data.body);
    return response;
}

std::optional<std::string> find_header(const HeaderMap& headers, const std::string& name) {
    const std::string wanted = to_lower(name);
    for (const auto& [key, value] : headers) {
        if (to_lower(key) == wanted) return value;
    }
    return std::nullopt;
}

Value parse_response_body(const HeaderMap& headers, const std::string& body) {
    if (body.empty()) return nullptr;

    auto content_type = find_header(headers, "content-type");
    bool declared_json = content_type && to_lower(*content_type).find("json") != std::string::npos;

    Value parsed = Value::parse(body, nullptr, false);
    if (!parsed.is_discarded()) {
        return parsed;
    }
    if (declared_json) {
        std::cerr << "[WARNING] Response declared JSON but did not parse; keeping raw text" << std::endl;
    }
    return body;
}

std::string status_text_for(int status) {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 422: return "Unprocessable Entity";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "Unknown";
    }
}

std::optional<std::string> request_payload(const HttpRequest& request) {
    if (request.body.has_value()) return request.body;
    const std::string method = to_upper(request.method);
    if (method == "POST" || method == "PUT" || method == "PATCH") {
        // Sent as Content-Length: 0 so the server does not wait for a body
        return std::string();
    }
    return std::nullopt;
}

Value response_envelope(const HttpResponse& response) {
    return Value{
        {"status", response.status},
        {"statusText", response.status_text},
        {"headers", response.headers},
        {"data", response.data}
    };
}

} // namespace pipeflow
