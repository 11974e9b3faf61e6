// src/http/api_client.cpp
#include "pipeflow/http/http_client.h"
#include "common/utils.h"

namespace pipeflow {

CurlApiClient::CurlApiClient(std::string base_url, HttpClientOptions options)
    : base_url_(std::move(base_url)),
      transport_(std::make_shared<CurlHttpTransport>(std::move(options))) {}

CurlApiClient::CurlApiClient(std::string base_url, std::shared_ptr<HttpTransport> transport)
    : base_url_(std::move(base_url)), transport_(std::move(transport)) {}

std::string CurlApiClient::full_url(const std::string& url) const {
    if (is_absolute_url(url) || base_url_.empty()) return url;
    if (!base_url_.empty() && base_url_.back() == '/' && !url.empty() && url.front() == '/') {
        return base_url_ + url.substr(1);
    }
    if (base_url_.back() != '/' && !url.empty() && url.front() != '/') {
        return base_url_ + "/" + url;
    }
    return base_url_ + url;
}

HttpResponse CurlApiClient::get(const std::string& url, const HttpRequestConfig& config) {
    HttpRequest request;
    request.method = config.method.value_or("GET");
    request.url = full_url(url);
    request.headers = config.headers;
    return transport_->send(request);
}

HttpResponse CurlApiClient::post(const std::string& url, const Value& body, const HttpRequestConfig& config) {
    HttpRequest request;
    request.method = config.method.value_or("POST");
    request.url = full_url(url);
    request.headers = config.headers;
    if (!body.is_null()) {
        if (body.is_string()) {
            request.body = body.get<std::string>();
        } else {
            request.body = body.dump();
            if (!find_header(request.headers, "Content-Type")) {
                request.headers["Content-Type"] = "application/json";
            }
        }
    }
    return transport_->send(request);
}

} // namespace pipeflow
