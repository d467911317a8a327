#pragma once

#include "export.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

namespace huginn {

/**
 * @brief Parsed http(s) URL
 */
struct Url {
    std::string scheme;     // "http" or "https"
    std::string host;
    std::string port;       // Defaults to 80 / 443
    std::string target;     // Path and query, starting with '/'
};

/**
 * @brief Split an absolute http(s) URL
 * @throws std::invalid_argument for other schemes or a missing host
 */
HUGINN_API Url parse_url(const std::string& url);

/**
 * @brief Byte progress of a transfer; return false to abort it
 */
using FetchProgress = std::function<bool(std::uint64_t done, std::uint64_t total)>;

/**
 * @brief Thrown when a progress callback aborts a transfer
 */
class HUGINN_API FetchAborted : public std::runtime_error {
public:
    explicit FetchAborted(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Blocking HTTP GET of `url` into `path`
 *
 * Follows up to `max_redirects` redirects, verifies TLS peers against the
 * system trust store and streams the body to disk in 64 KB pieces. Every
 * network step (connect, handshake, request, each body piece) must make
 * progress within `stall_timeout` or the transfer fails.
 *
 * @return Bytes written
 * @throws FetchAborted if `progress` returned false
 * @throws std::runtime_error on network, TLS, HTTP status, stall or file errors
 */
HUGINN_API std::uint64_t fetch_to_file(const std::string& url,
                                       const std::string& path,
                                       const FetchProgress& progress = nullptr,
                                       int max_redirects = 5,
                                       std::chrono::milliseconds stall_timeout = std::chrono::seconds(30));

/**
 * @brief Content length reported by a HEAD request (after redirects)
 * @return 0 if the server does not report one
 * @throws std::runtime_error on network or HTTP status errors
 */
HUGINN_API std::uint64_t fetch_content_length(const std::string& url, int max_redirects = 5,
                                              std::chrono::milliseconds stall_timeout = std::chrono::seconds(30));

} // namespace huginn
