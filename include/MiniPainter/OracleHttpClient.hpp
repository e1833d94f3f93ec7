#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace MiniPainter {

// Small JSON-over-HTTP client for the segmentation oracle, using libcurl.
// - GET and JSON POST against baseUrl + path
// - Response carries status, body and any libcurl error; transport failures
//   never throw
// - Each call uses its own easy handle, so calls may run on worker threads
class OracleHttpClient {
public:
    struct Response {
        long httpCode = 0;
        std::string body;
        std::string curlError; // empty when the transfer completed
        bool transportOk() const { return curlError.empty(); }
        bool ok() const { return transportOk() && (httpCode >= 200 && httpCode < 300); }
    };

    OracleHttpClient();
    explicit OracleHttpClient(const std::string& baseUrl);

    void setBaseUrl(const std::string& url) { baseUrl_ = url; }
    const std::string& baseUrl() const { return baseUrl_; }
    void setTimeoutSeconds(long seconds) { timeoutSeconds_ = seconds; }
    long timeoutSeconds() const { return timeoutSeconds_; }
    void setConnectTimeoutSeconds(long seconds) { connectTimeoutSeconds_ = seconds; }

    // Headers applied to every request
    void setDefaultHeaders(const std::vector<std::string>& headers) { defaultHeaders_ = headers; }
    void addDefaultHeader(const std::string& h){ defaultHeaders_.push_back(h); }

    // GET baseUrl + path (path may include leading "/"); timeout overrides the
    // client timeout when positive
    Response get(const std::string& path, long timeoutSeconds = 0) const;

    // POST a JSON body with Content-Type: application/json
    Response postJson(const std::string& path, const std::string& jsonBody) const;
    Response postJson(const std::string& path, const nlohmann::json& jsonBody) const { return postJson(path, jsonBody.dump()); }

    std::string buildUrl(const std::string& path) const;

private:
    std::string baseUrl_ = "http://localhost:5000";
    long timeoutSeconds_ = 30;
    long connectTimeoutSeconds_ = 5;
    std::vector<std::string> defaultHeaders_;
};

} // namespace MiniPainter
