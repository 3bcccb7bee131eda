// Heal Downloader - HTTP Client
// Streaming HTTP GET interface used by the transfer engine

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace heal::utils {

/**
 * @brief Response headers keyed by lower-cased field name
 */
using HttpHeaders = std::map<std::string, std::string>;

/**
 * @brief Parsed "Content-Range: bytes <start>-<end>/<total>" value
 *
 * total is nullopt when the server sent '*' as the length. The 416 form,
 * which carries '*' in place of the range, leaves start and end unset.
 */
struct ContentRange {
    std::optional<int64_t> start;
    std::optional<int64_t> end;
    std::optional<int64_t> total;
};

/**
 * @brief HTTP response summary returned once a streamed request ends
 */
struct HttpResponse {
    int statusCode{0};
    HttpHeaders headers;
    std::string error;         // transport error, empty on success

    bool isSuccess() const {
        return statusCode >= 200 && statusCode < 300;
    }

    bool isPartialContent() const { return statusCode == 206; }
    bool isRangeNotSatisfiable() const { return statusCode == 416; }

    std::optional<std::string> header(const std::string& name) const;
};

/**
 * @brief HTTP request options
 */
struct HttpOptions {
    HttpHeaders headers;          // sent verbatim, original case preserved
    int timeoutSeconds{30};       // max time without receiving data
    int connectTimeoutSeconds{10};
    bool followRedirects{true};
    std::string userAgent{"Heal-Downloader/1.0"};
};

/**
 * @brief Callbacks driven while a response is streamed
 *
 * onResponse runs once, after the final response headers arrived and before
 * the first body byte. onData receives the body in arbitrary slices.
 * Returning false from either aborts the transfer.
 */
struct HttpStreamHandlers {
    std::function<bool(int statusCode, const HttpHeaders& headers)> onResponse;
    std::function<bool(const char* data, size_t size)> onData;
};

/**
 * @brief Streaming HTTP client
 *
 * Implementations must be safe to call from several threads at once, each
 * call owning its own connection.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    /**
     * Perform a GET and stream the body through the handlers.
     * Never throws for network conditions; failures are reported in the
     * returned HttpResponse.
     */
    virtual HttpResponse streamGet(const std::string& url,
                                   const HttpOptions& options,
                                   const HttpStreamHandlers& handlers) = 0;

    // Header helpers
    static std::optional<ContentRange> parseContentRange(const std::string& value);
    static std::optional<int64_t> parseContentLength(const std::string& value);

    /**
     * Parse one raw header line into headers. A status line resets the map
     * (redirect chains) and returns its status code through statusCode.
     */
    static void parseHeaderLine(const std::string& line, HttpHeaders& headers, int& statusCode);

    // URL utilities
    static std::string urlPath(const std::string& url);
    static std::string urlBasename(const std::string& url);
};

} // namespace heal::utils
