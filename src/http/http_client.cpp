#include "pgshift/http/http_client.hpp"

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/err.h>
#include <openssl/evp.h>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/url.hpp>
#include <stdexcept>

#include "pgshift/api/types.hpp"
#include "pgshift/log/logger.hpp"

namespace pgshift::http {

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {

using Request = bhttp::request<bhttp::string_body>;

template <typename Stream>
HttpResponse exchange(Stream& stream, const Request& req) {
    bhttp::write(stream, req);

    beast::flat_buffer buffer;
    bhttp::response<bhttp::string_body> res;
    bhttp::read(stream, buffer, res);

    return HttpResponse{res.result_int(), res.body()};
}

}  // namespace

std::string base64_encode(const std::string& input) {
    BIO* bio = BIO_new(BIO_s_mem());
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_push(b64, bio);

    BIO_write(bio, input.data(), static_cast<int>(input.size()));
    BIO_flush(bio);

    BUF_MEM* buffer_ptr;
    BIO_get_mem_ptr(bio, &buffer_ptr);

    std::string result(buffer_ptr->data, buffer_ptr->length);
    BIO_free_all(bio);
    return result;
}

std::string error_message(const HttpResponse& response) {
    auto parsed = nlohmann::json::parse(response.body, nullptr, false);
    if (parsed.is_object()) {
        for (const char* key : {"error", "message"}) {
            auto it = parsed.find(key);
            if (it != parsed.end() && it->is_string()) {
                return it->get<std::string>();
            }
        }
    }
    if (response.body.empty()) {
        return "HTTP " + std::to_string(response.status);
    }
    return "HTTP " + std::to_string(response.status) + ": " + response.body;
}

HttpClient::HttpClient(const std::string& base_url,
                       std::chrono::seconds timeout, std::string user_agent)
    : timeout_(timeout), user_agent_(std::move(user_agent)) {
    auto parsed = boost::urls::parse_uri(base_url);
    if (!parsed) {
        throw std::invalid_argument("Invalid URL: " + base_url);
    }
    boost::urls::url_view u = *parsed;

    const std::string scheme(u.scheme());
    if (scheme != "http" && scheme != "https") {
        throw std::invalid_argument("Unsupported URL scheme: " + scheme);
    }
    secure_ = scheme == "https";

    host_ = std::string(u.host());
    if (host_.empty()) {
        throw std::invalid_argument("URL has no host: " + base_url);
    }
    port_ = u.has_port() ? std::string(u.port()) : (secure_ ? "443" : "80");

    base_path_ = std::string(u.path());
    while (!base_path_.empty() && base_path_.back() == '/') {
        base_path_.pop_back();
    }

    if (u.has_userinfo()) {
        set_basic_auth(std::string(u.user()), std::string(u.password()));
    }
}

void HttpClient::set_basic_auth(const std::string& user,
                                const std::string& password) {
    authorization_ = "Basic " + base64_encode(user + ":" + password);
}

std::string HttpClient::make_target(const std::string& path,
                                    const QueryParams& query) const {
    boost::urls::url target;
    target.set_path(base_path_ + path);
    for (const auto& [key, value] : query) {
        target.params().append({key, value});
    }
    return std::string(target.buffer());
}

HttpResponse HttpClient::send(verb method, const std::string& path,
                              const QueryParams& query,
                              const std::string& body,
                              const std::string& content_type) const {
    Request req{method, make_target(path, query), 11 /* HTTP/1.1 */};
    req.set(bhttp::field::host, host_);
    req.set(bhttp::field::user_agent, user_agent_);
    req.set(bhttp::field::accept, "application/json");
    if (!authorization_.empty()) {
        req.set(bhttp::field::authorization, authorization_);
    }
    if (!body.empty()) {
        req.set(bhttp::field::content_type, content_type);
        req.body() = body;
    }
    req.prepare_payload();

    PGSHIFT_LOG_TRACE << bhttp::to_string(method) << " " << host_
                      << req.target();

    net::io_context ioc;
    tcp::resolver resolver(ioc);
    auto const results = resolver.resolve(host_, port_);

    if (!secure_) {
        beast::tcp_stream stream(ioc);
        stream.expires_after(timeout_);
        stream.connect(results);

        auto response = exchange(stream, req);

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        if (ec && ec != beast::errc::not_connected) {
            PGSHIFT_LOG_TRACE << "Socket shutdown: " << ec.message();
        }
        return response;
    }

    ssl::context ctx(ssl::context::tls_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), host_.c_str())) {
        beast::error_code ec{static_cast<int>(::ERR_get_error()),
                             net::error::get_ssl_category()};
        throw beast::system_error{ec};
    }
    stream.set_verify_callback(ssl::host_name_verification(host_));

    beast::get_lowest_layer(stream).expires_after(timeout_);
    beast::get_lowest_layer(stream).connect(results);
    stream.handshake(ssl::stream_base::client);

    auto response = exchange(stream, req);

    // Servers commonly close without close_notify
    beast::error_code ec;
    stream.shutdown(ec);
    if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
        PGSHIFT_LOG_TRACE << "TLS shutdown: " << ec.message();
    }
    return response;
}

nlohmann::json HttpClient::send_json(verb method, const std::string& path,
                                     const QueryParams& query,
                                     const nlohmann::json* body) const {
    auto response = send(method, path, query, body ? body->dump() : "");
    if (!response.ok()) {
        throw api::ApiError(response.status, error_message(response),
                            response.body);
    }
    if (response.body.empty()) {
        return nlohmann::json();
    }
    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw api::ApiError(response.status,
                            "Malformed JSON response from " + host_ + ": " +
                                e.what(),
                            response.body);
    }
}

}  // namespace pgshift::http
