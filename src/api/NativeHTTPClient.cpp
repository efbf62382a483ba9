#include "api/NativeHTTPClient.h"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <regex>
#include <sys/socket.h>
#include <sys/time.h>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace SheetCalc {

namespace {

// Enough for a full sheet read of a large workbook
constexpr std::uint64_t kBodyLimit = 16 * 1024 * 1024;

http::verb verbFor(const std::string& method)
{
    return method == "PUT" ? http::verb::put : http::verb::get;
}

template <class Stream>
void exchange(Stream& stream,
              const std::string& method,
              const std::string& host,
              const std::string& target,
              const std::string& body,
              const std::map<std::string, std::string>& headers,
              NativeHTTPClient::Response& response)
{
    http::request<http::string_body> req;
    req.method(verbFor(method));
    req.target(target);
    req.version(11);
    req.set(http::field::host, host);
    req.set(http::field::user_agent, "SheetCalc/1.0");

    for (const auto& [key, value] : headers) {
        req.set(key, value);
    }

    if (!body.empty() || method == "PUT") {
        req.body() = body;
        req.prepare_payload();
    }

    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(kBodyLimit);
    http::read(stream, buffer, parser);
    http::response<http::string_body> res = parser.release();

    response.statusCode = res.result_int();
    response.body = res.body();
    for (auto const& field : res) {
        response.headers[std::string(field.name_string())] = std::string(field.value());
    }
    response.success = (response.statusCode >= 200 && response.statusCode < 300);
}

// tcp_stream expiry only covers async operations; blocking calls need
// kernel send/receive timeouts
void applySocketTimeout(tcp::socket& socket, int seconds)
{
    if (seconds <= 0)
        return;
    timeval tv{};
    tv.tv_sec = seconds;
    ::setsockopt(socket.native_handle(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(socket.native_handle(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

} // namespace

struct NativeHTTPClient::Impl {
    net::io_context ioc;
};

NativeHTTPClient::NativeHTTPClient()
    : m_impl(std::make_unique<Impl>())
    , m_timeout(30)
    , m_verifyPeer(true)
{
}

NativeHTTPClient::~NativeHTTPClient() = default;

void NativeHTTPClient::setTimeout(int seconds)
{
    m_timeout = seconds;
}

NativeHTTPClient::Response NativeHTTPClient::get(const std::string& url,
                                                 const std::map<std::string, std::string>& headers)
{
    return makeRequest("GET", url, "", headers);
}

NativeHTTPClient::Response NativeHTTPClient::put(const std::string& url,
                                                 const std::string& body,
                                                 const std::map<std::string, std::string>& headers)
{
    return makeRequest("PUT", url, body, headers);
}

NativeHTTPClient::Response NativeHTTPClient::makeRequest(const std::string& method,
                                                         const std::string& url,
                                                         const std::string& body,
                                                         const std::map<std::string, std::string>& headers)
{
    Response response;

    try {
        // Parse URL: protocol://host:port/path
        static const std::regex urlRegex(R"(^(https?)://([^:/]+)(?::(\d+))?(/.*)?$)");
        std::smatch match;

        if (!std::regex_match(url, match, urlRegex)) {
            response.error = "Invalid URL format";
            return response;
        }

        std::string protocol = match[1].str();
        std::string host = match[2].str();
        std::string port = match[3].str();
        std::string target = match[4].str();

        if (target.empty()) target = "/";
        if (port.empty()) {
            port = (protocol == "https") ? "443" : "80";
        }

        tcp::resolver resolver(m_impl->ioc);
        auto const results = resolver.resolve(host, port);

        if (protocol == "https") {
            ssl::context ctx(ssl::context::tlsv12_client);
            ctx.set_default_verify_paths();
            ctx.set_verify_mode(m_verifyPeer ? ssl::verify_peer : ssl::verify_none);

            beast::ssl_stream<beast::tcp_stream> stream(m_impl->ioc, ctx);
            // A trusted chain is not enough; the leaf certificate must name this host
            if (m_verifyPeer)
                stream.set_verify_callback(ssl::host_name_verification(host));

            // SNI
            if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
                throw beast::system_error(
                    beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()),
                    "Failed to set SNI hostname"
                );
            }

            beast::get_lowest_layer(stream).connect(results);
            applySocketTimeout(beast::get_lowest_layer(stream).socket(), m_timeout);
            stream.handshake(ssl::stream_base::client);

            exchange(stream, method, host, target, body, headers, response);

            beast::error_code ec;
            stream.shutdown(ec);
            // "stream truncated" on shutdown is expected from many servers
        } else {
            beast::tcp_stream stream(m_impl->ioc);
            stream.connect(results);
            applySocketTimeout(stream.socket(), m_timeout);

            exchange(stream, method, host, target, body, headers, response);

            beast::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        }

    } catch (std::exception const& e) {
        response.statusCode = 0;
        response.error = e.what();
        response.success = false;
    }

    return response;
}

} // namespace SheetCalc
