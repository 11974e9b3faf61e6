// pipeflow/http/http_client.h
#ifndef PIPEFLOW_HTTP_HTTP_CLIENT_H
#define PIPEFLOW_HTTP_HTTP_CLIENT_H

#include "common/types.h"
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace pipeflow {

using HeaderMap = std::map<std::string, std::string>;

struct HttpClientOptions {
    long timeout_ms = 60000;
    long connect_timeout_ms = 10000;
    bool verify_ssl = true;
    std::string user_agent = "pipeflow/1.0";
};

struct HttpRequestConfig {
    HeaderMap headers;
    std::optional<std::string> method; // overrides the verb implied by get/post
};

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    HeaderMap headers;
    std::optional<std::string> body;
};

struct HttpResponse {
    int status = 0;
    std::string status_text;
    HeaderMap headers;
    Value data = nullptr; // JSON when the body parses, raw text otherwise

    bool ok() const { return status >= 200 && status < 300; }
};

// Client for relative (backend) endpoints. Non-2xx responses are returned, not thrown;
// connection failures throw NetworkError.
class ApiClient {
public:
    virtual ~ApiClient() = default;
    virtual HttpResponse get(const std::string& url, const HttpRequestConfig& config = {}) = 0;
    virtual HttpResponse post(const std::string& url, const Value& body, const HttpRequestConfig& config = {}) = 0;
};

// Native request primitive used for absolute URLs
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

class CurlHttpTransport : public HttpTransport {
public:
    explicit CurlHttpTransport(HttpClientOptions options = {});
    ~CurlHttpTransport() override;

    CurlHttpTransport(const CurlHttpTransport&) = delete;
    CurlHttpTransport& operator=(const CurlHttpTransport&) = delete;

    HttpResponse send(const HttpRequest& request) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ApiClient that prefixes relative URLs with a base URL and sends through a transport
class CurlApiClient : public ApiClient {
public:
    explicit CurlApiClient(std::string base_url, HttpClientOptions options = {});
    CurlApiClient(std::string base_url, std::shared_ptr<HttpTransport> transport);

    HttpResponse get(const std::string& url, const HttpRequestConfig& config = {}) override;
    HttpResponse post(const std::string& url, const Value& body, const HttpRequestConfig& config = {}) override;

    const std::string& base_url() const { return base_url_; }

private:
    std::string full_url(const std::string& url) const;

    std::string base_url_;
    std::shared_ptr<HttpTransport> transport_;
};

// Case-insensitive header lookup
std::optional<std::string> find_header(const HeaderMap& headers, const std::string& name);

// Response body -> Value: JSON by content type, else JSON if it parses, else text
Value parse_response_body(const HeaderMap& headers, const std::string& body);

std::string status_text_for(int status);

// Bytes to upload: the request body, or "" for POST/PUT/PATCH without one; nullopt for bodiless verbs
std::optional<std::string> request_payload(const HttpRequest& request);

// {status, statusText, headers, data}
Value response_envelope(const HttpResponse& response);

} // namespace pipeflow

#endif // PIPEFLOW_HTTP_HTTP_CLIENT_H
