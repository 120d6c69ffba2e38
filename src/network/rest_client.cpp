// ============================================================================
// QUORUM SCAN ENGINE - REST Client Implementation
// ============================================================================
// Boost.Beast HTTPS client, one TLS session per request
// ============================================================================

#include "quorum/network/rest_client.hpp"
#include "quorum/utils/logger.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <cctype>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace quorum::network {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

// ============================================================================
// Helpers
// ============================================================================

std::string sha256_hex(std::string_view data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    unsigned int digest_len = 0;

    EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha256(), nullptr);

    std::ostringstream ss;
    for (unsigned int i = 0; i < digest_len; ++i) {
        ss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(digest[i]);
    }
    return ss.str();
}

std::string url_encode(std::string_view value) {
    std::ostringstream escaped;
    escaped << std::hex << std::uppercase << std::setfill('0');

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

std::string build_query_string(const std::map<std::string, std::string>& params) {
    std::ostringstream ss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) ss << '&';
        ss << url_encode(key) << '=' << url_encode(value);
        first = false;
    }
    return ss.str();
}

std::string host_of(std::string_view url) {
    if (auto scheme = url.find("://"); scheme != std::string_view::npos) {
        url.remove_prefix(scheme + 3);
    }
    if (auto slash = url.find('/'); slash != std::string_view::npos) {
        url = url.substr(0, slash);
    }
    if (auto colon = url.find(':'); colon != std::string_view::npos) {
        url = url.substr(0, colon);
    }
    return std::string(url);
}

// ============================================================================
// REST Client Implementation
// ============================================================================

struct RestClient::Impl {
    using https_stream = beast::ssl_stream<beast::tcp_stream>;

    explicit Impl(const RestClientConfig& config)
        : config_(config)
        , ssl_context_(ssl::context::tlsv12_client)
        , host_(host_of(config.base_url)) {

        ssl_context_.set_default_verify_paths();
        ssl_context_.set_verify_mode(config_.verify_peer ? ssl::verify_peer : ssl::verify_none);
    }

    HttpResponse request(const HttpRequest& req) {
        try {
            net::io_context io_context;
            tcp::resolver resolver(io_context);
            https_stream stream(io_context, ssl_context_);

            auto results = resolver.resolve(host_, "443");

            beast::get_lowest_layer(stream).expires_after(config_.request_timeout);
            beast::get_lowest_layer(stream).connect(results);

            // SNI
            if (!SSL_set_tlsext_host_name(stream.native_handle(), host_.c_str())) {
                throw std::runtime_error("Failed to set SNI hostname");
            }
            stream.handshake(ssl::stream_base::client);

            http::request<http::string_body> http_req;
            http_req.version(11);

            std::string target = req.path;
            if (!req.query_params.empty()) {
                target += "?" + build_query_string(req.query_params);
            }
            http_req.target(target);

            switch (req.method) {
                case HttpMethod::GET:  http_req.method(http::verb::get); break;
                case HttpMethod::POST: http_req.method(http::verb::post); break;
            }

            http_req.set(http::field::host, host_);
            http_req.set(http::field::user_agent, config_.user_agent);
            http_req.set(http::field::accept, "application/json");
            http_req.set(http::field::content_type, "application/json");

            for (const auto& [name, value] : req.headers) {
                http_req.set(name, value);
            }

            if (!req.body.empty()) {
                http_req.body() = req.body;
                http_req.prepare_payload();
            }

            http::write(stream, http_req);

            beast::flat_buffer buffer;
            http::response<http::string_body> http_res;
            http::read(stream, buffer, http_res);

            HttpResponse response;
            response.status_code = http_res.result_int();
            response.body = http_res.body();
            response.received_at = now();

            for (const auto& header : http_res) {
                response.headers[std::string(header.name_string())] = std::string(header.value());
            }

            // Servers often drop the connection without close_notify
            beast::error_code ec;
            stream.shutdown(ec);
            if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
                LOG_DEBUG("TLS shutdown with {}: {}", host_, ec.message());
            }

            return response;

        } catch (const std::exception& e) {
            HttpResponse error_response;
            error_response.status_code = -1;
            error_response.body = e.what();
            error_response.received_at = now();
            return error_response;
        }
    }

    RestClientConfig config_;
    ssl::context ssl_context_;
    std::string host_;
};

// ============================================================================
// RestClient Public Interface
// ============================================================================

RestClient::RestClient(const RestClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

RestClient::~RestClient() = default;

HttpResponse RestClient::request(const HttpRequest& request) {
    return impl_->request(request);
}

const std::string& RestClient::host() const noexcept {
    return impl_->host_;
}

}  // namespace quorum::network
