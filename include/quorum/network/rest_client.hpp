#pragma once
// ============================================================================
// QUORUM SCAN ENGINE - REST Client
// ============================================================================
// Blocking HTTPS client for the brokerage REST API (Boost.Beast + OpenSSL)
// One connection per request; callers serialize through the rate limiter
// ============================================================================

#include "quorum/core/types.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace quorum::network {

// ============================================================================
// HTTP Types
// ============================================================================

enum class HttpMethod {
    GET,
    POST
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string path;
    std::map<std::string, std::string> query_params;
    std::map<std::string, std::string> headers;
    std::string body;
};

struct HttpResponse {
    int status_code = 0;        // -1 when the transport failed; body holds the error
    std::map<std::string, std::string> headers;
    std::string body;
    Timestamp received_at;

    [[nodiscard]] bool is_success() const { return status_code >= 200 && status_code < 300; }
    [[nodiscard]] bool is_rate_limited() const { return status_code == 429; }
    [[nodiscard]] bool is_transport_error() const { return status_code < 0; }
};

// ============================================================================
// REST Client Configuration
// ============================================================================

struct RestClientConfig {
    std::string base_url = "https://api.groww.in";
    std::chrono::seconds request_timeout{30};
    std::string user_agent = "QuorumScan/1.0";
    bool verify_peer = true;
};

// ============================================================================
// REST Client Interface
// ============================================================================

class IRestClient {
public:
    virtual ~IRestClient() = default;

    /// Execute request synchronously. Transport failures are reported
    /// through HttpResponse::status_code == -1, never thrown
    [[nodiscard]] virtual HttpResponse request(const HttpRequest& request) = 0;

    [[nodiscard]] HttpResponse get(std::string_view path,
                                   const std::map<std::string, std::string>& params = {},
                                   const std::map<std::string, std::string>& headers = {}) {
        HttpRequest req;
        req.method = HttpMethod::GET;
        req.path = std::string(path);
        req.query_params = params;
        req.headers = headers;
        return request(req);
    }

    [[nodiscard]] HttpResponse post(std::string_view path, std::string_view body,
                                    const std::map<std::string, std::string>& headers = {}) {
        HttpRequest req;
        req.method = HttpMethod::POST;
        req.path = std::string(path);
        req.body = std::string(body);
        req.headers = headers;
        return request(req);
    }
};

// ============================================================================
// REST Client Implementation
// ============================================================================

class RestClient : public IRestClient {
public:
    explicit RestClient(const RestClientConfig& config);
    ~RestClient() override;

    // Non-copyable
    RestClient(const RestClient&) = delete;
    RestClient& operator=(const RestClient&) = delete;

    [[nodiscard]] HttpResponse request(const HttpRequest& request) override;

    [[nodiscard]] const std::string& host() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Rate Limiter
// ============================================================================

/// Sliding-window limiter: at most max_requests in any window
class RateLimiter {
public:
    RateLimiter(int max_requests, std::chrono::seconds window);
    ~RateLimiter();

    /// Try to acquire a permit. Returns true if allowed.
    [[nodiscard]] bool try_acquire();

    /// Wait until a permit is available or `timeout` elapses.
    /// Returns false on timeout.
    [[nodiscard]] bool acquire(std::chrono::milliseconds timeout);

    /// Get remaining permits in current window
    [[nodiscard]] int remaining() const;

    /// Get time until the oldest permit leaves the window
    [[nodiscard]] std::chrono::milliseconds time_until_reset() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Helpers
// ============================================================================

[[nodiscard]] std::string url_encode(std::string_view value);

/// key=value pairs joined by '&', keys in map order, both sides url-encoded
[[nodiscard]] std::string build_query_string(const std::map<std::string, std::string>& params);

/// Lowercase hex SHA-256 digest
[[nodiscard]] std::string sha256_hex(std::string_view data);

/// Host part of "https://host[:port]/..."
[[nodiscard]] std::string host_of(std::string_view url);

}  // namespace quorum::network
