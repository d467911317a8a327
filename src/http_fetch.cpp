#include "huginn/http_fetch.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <chrono>
#include <fstream>
#include <limits>
#include <vector>

namespace huginn {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

constexpr std::size_t READ_BUFFER_SIZE = 64 * 1024;
const char* USER_AGENT = "huginn/1.0";

struct Transfer {
    std::ofstream* out = nullptr;       // null for HEAD
    const FetchProgress* progress = nullptr;
    std::chrono::milliseconds stall_timeout{30000};
    std::uint64_t total = 0;
    std::uint64_t done = 0;
    std::string location;               // Set when the server redirects
};

/**
 * @brief Run one asynchronous step to completion on the request's io_context
 *
 * tcp_stream deadlines only apply to asynchronous operations, so every
 * network step goes through here. A peer that stays silent past the
 * deadline completes the step with beast::error::timeout.
 */
template <class Start>
beast::error_code run_step(net::io_context& ioc, Start&& start) {
    beast::error_code result = net::error::would_block;
    start([&result](beast::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    return result;
}

void expect(const beast::error_code& ec, const Url& url, const Transfer& transfer) {
    if (!ec) return;
    if (ec == beast::error::timeout) {
        throw std::runtime_error("No response from " + url.host + " for " +
                                 std::to_string(transfer.stall_timeout.count()) + " ms");
    }
    throw beast::system_error{ec};
}

// One request/response exchange on an already connected stream
template <class Stream>
void exchange(net::io_context& ioc, Stream& stream, const Url& url, http::verb verb, Transfer& transfer) {
    auto& socket = beast::get_lowest_layer(stream);

    http::request<http::empty_body> req{verb, url.target, 11};
    req.set(http::field::host, url.host);
    req.set(http::field::user_agent, USER_AGENT);
    socket.expires_after(transfer.stall_timeout);
    expect(run_step(ioc, [&](auto handler) { http::async_write(stream, req, std::move(handler)); }),
           url, transfer);

    beast::flat_buffer buffer;
    http::response_parser<http::buffer_body> parser;
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());
    if (verb == http::verb::head) {
        parser.skip(true);
    }
    socket.expires_after(transfer.stall_timeout);
    expect(run_step(ioc, [&](auto handler) { http::async_read_header(stream, buffer, parser, std::move(handler)); }),
           url, transfer);

    const unsigned status = parser.get().result_int();
    if (status >= 300 && status < 400) {
        auto location = parser.get()[http::field::location];
        if (location.empty()) {
            throw std::runtime_error("Redirect without location from " + url.host + url.target);
        }
        transfer.location = std::string(location);
        return;
    }
    if (status != 200) {
        throw std::runtime_error("HTTP " + std::to_string(status) + " for " +
                                 url.scheme + "://" + url.host + url.target);
    }

    transfer.total = parser.content_length() ? *parser.content_length() : 0;
    if (verb == http::verb::head || !transfer.out) {
        return;
    }

    std::vector<char> chunk(READ_BUFFER_SIZE);
    while (!parser.is_done()) {
        parser.get().body().data = chunk.data();
        parser.get().body().size = chunk.size();

        // The deadline covers each piece, not the whole body
        socket.expires_after(transfer.stall_timeout);
        beast::error_code ec = run_step(ioc, [&](auto handler) {
            http::async_read(stream, buffer, parser, std::move(handler));
        });
        if (ec == http::error::need_buffer) {
            ec = {};
        }
        expect(ec, url, transfer);

        const std::size_t n = chunk.size() - parser.get().body().size;
        transfer.out->write(chunk.data(), static_cast<std::streamsize>(n));
        if (!*transfer.out) {
            throw std::runtime_error("Write failed while downloading " + url.target);
        }
        transfer.done += n;

        if (transfer.progress && *transfer.progress &&
            !(*transfer.progress)(transfer.done, transfer.total)) {
            throw FetchAborted("Download aborted: " + url.target);
        }
    }
}

void request_once(const Url& url, http::verb verb, Transfer& transfer) {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    auto const results = resolver.resolve(url.host, url.port);

    if (url.scheme == "https") {
        ssl::context ctx(ssl::context::tls_client);
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(ssl::verify_peer);

        beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
            beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
            throw beast::system_error{ec};
        }
        stream.set_verify_callback(ssl::host_name_verification(url.host));

        auto& socket = beast::get_lowest_layer(stream);
        socket.expires_after(transfer.stall_timeout);
        expect(run_step(ioc, [&](auto handler) { socket.async_connect(results, std::move(handler)); }),
               url, transfer);
        socket.expires_after(transfer.stall_timeout);
        expect(run_step(ioc, [&](auto handler) {
                   stream.async_handshake(ssl::stream_base::client, std::move(handler));
               }),
               url, transfer);

        exchange(ioc, stream, url, verb, transfer);

        // Servers commonly skip close_notify; a truncated or slow shutdown is not an error here
        socket.expires_after(transfer.stall_timeout);
        run_step(ioc, [&](auto handler) { stream.async_shutdown(std::move(handler)); });
        return;
    }

    beast::tcp_stream stream(ioc);
    stream.expires_after(transfer.stall_timeout);
    expect(run_step(ioc, [&](auto handler) { stream.async_connect(results, std::move(handler)); }),
           url, transfer);
    exchange(ioc, stream, url, verb, transfer);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
}

// Resolve a Location header against the URL it came from
Url follow(const Url& from, const std::string& location) {
    if (location.rfind("http://", 0) == 0 || location.rfind("https://", 0) == 0) {
        return parse_url(location);
    }
    Url next = from;
    next.target = location.empty() || location[0] != '/' ? "/" + location : location;
    return next;
}

void run(const std::string& url, http::verb verb, Transfer& transfer, int max_redirects) {
    Url current = parse_url(url);
    for (int hop = 0; hop <= max_redirects; ++hop) {
        transfer.location.clear();
        request_once(current, verb, transfer);
        if (transfer.location.empty()) {
            return;
        }
        current = follow(current, transfer.location);
    }
    throw std::runtime_error("Too many redirects for " + url);
}

} // anonymous namespace

Url parse_url(const std::string& url) {
    Url parsed;
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw std::invalid_argument("Not an absolute URL: " + url);
    }
    parsed.scheme = url.substr(0, scheme_end);
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        throw std::invalid_argument("Unsupported URL scheme: " + parsed.scheme);
    }

    auto host_start = scheme_end + 3;
    auto path_start = url.find('/', host_start);
    std::string authority = url.substr(host_start, path_start == std::string::npos
                                                       ? std::string::npos
                                                       : path_start - host_start);
    parsed.target = path_start == std::string::npos ? "/" : url.substr(path_start);

    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        parsed.host = authority.substr(0, colon);
        parsed.port = authority.substr(colon + 1);
    } else {
        parsed.host = authority;
        parsed.port = parsed.scheme == "https" ? "443" : "80";
    }

    if (parsed.host.empty()) {
        throw std::invalid_argument("URL has no host: " + url);
    }
    return parsed;
}

std::uint64_t fetch_to_file(const std::string& url,
                            const std::string& path,
                            const FetchProgress& progress,
                            int max_redirects,
                            std::chrono::milliseconds stall_timeout)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot open for writing: " + path);
    }

    Transfer transfer;
    transfer.out = &out;
    transfer.progress = &progress;
    transfer.stall_timeout = stall_timeout;
    run(url, http::verb::get, transfer, max_redirects);

    out.flush();
    if (!out) {
        throw std::runtime_error("Write failed: " + path);
    }
    return transfer.done;
}

std::uint64_t fetch_content_length(const std::string& url, int max_redirects,
                                   std::chrono::milliseconds stall_timeout)
{
    Transfer transfer;
    transfer.stall_timeout = stall_timeout;
    run(url, http::verb::head, transfer, max_redirects);
    return transfer.total;
}

} // namespace huginn
