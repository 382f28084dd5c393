#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace hostwatch::infra {

/**
 * @brief Components of an http or https URL.
 */
struct Url {
    std::string scheme;      ///< "http" or "https"
    std::string host;        ///< Host name or IP literal, without brackets
    uint16_t port{0};        ///< Explicit port or the scheme default
    std::string target{"/"}; ///< Path and query sent in the request line
};

/**
 * @brief Response data from an HTTP exchange.
 */
struct HttpResponse {
    int statusCode{0};        ///< HTTP status code (e.g., 200, 404).
    std::string body;         ///< Response body content.
    std::string errorMessage; ///< Error message if the exchange failed.
    bool completed{false};    ///< True if a complete response was received.
    bool success{false};      ///< True if completed with a 2xx status.
};

/**
 * @brief Blocking HTTP client built on libcurl.
 *
 * Every call uses its own easy handle on the calling thread. The timeout
 * bounds both the connection (TLS handshake included) and the whole
 * exchange. Certificates of https servers are verified. Proxies from the
 * environment are not used. Errors are reported in the returned
 * HttpResponse; no call throws on network failure.
 */
class HttpClient {
public:
    HttpClient();

    /**
     * @brief Splits a URL into its components.
     * @param url URL of the form scheme://host[:port][/target].
     * @return Parsed URL, or std::nullopt if the URL is malformed or the scheme
     *         is neither http nor https.
     */
    static std::optional<Url> parseUrl(const std::string& url);

    /**
     * @brief Performs a GET request.
     * @param url Target http or https URL.
     * @param timeout Connect timeout and total exchange timeout.
     * @return Response with completed set once the whole response was received.
     */
    HttpResponse get(const std::string& url, std::chrono::milliseconds timeout);

    /**
     * @brief Performs a POST request.
     * @param url Target http or https URL.
     * @param payload Request body content.
     * @param headers HTTP headers to include in the request.
     * @param timeout Connect timeout and total exchange timeout.
     * @return Response with success set for a 2xx status.
     */
    HttpResponse post(const std::string& url, const std::string& payload,
                      const std::map<std::string, std::string>& headers,
                      std::chrono::milliseconds timeout);

private:
    HttpResponse perform(const std::string& url, const std::string* payload,
                         const std::map<std::string, std::string>& headers,
                         std::chrono::milliseconds timeout);
};

} // namespace hostwatch::infra
