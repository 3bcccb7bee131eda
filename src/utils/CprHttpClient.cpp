/**
 * CprHttpClient.cpp
 * 
 * Streaming GET through cpr. Header lines are collected through a header
 * callback so the response status and sizes are known before the first
 * body byte is handed to the caller.
 */

#include "CprHttpClient.hpp"

#include <cpr/cpr.h>

namespace heal::utils {

HttpResponse CprHttpClient::streamGet(const std::string& url,
                                      const HttpOptions& options,
                                      const HttpStreamHandlers& handlers) {
    HttpResponse result;
    bool responseDelivered = false;
    // A handler asked to stop the transfer
    bool aborted = false;

    auto deliverResponse = [&]() -> bool {
        if (responseDelivered) return true;
        responseDelivered = true;
        if (handlers.onResponse && !handlers.onResponse(result.statusCode, result.headers)) {
            aborted = true;
            return false;
        }
        return true;
    };

    try {
        cpr::Header headers;
        for (const auto& [key, value] : options.headers) headers[key] = value;

        std::string ua = options.userAgent.empty() ? "Heal-Downloader/1.0" : options.userAgent;
        int timeout = options.timeoutSeconds > 0 ? options.timeoutSeconds : 30;
        int connectTimeout = options.connectTimeoutSeconds > 0 ? options.connectTimeoutSeconds : 10;

        cpr::Response response = cpr::Get(
            cpr::Url{url},
            headers,
            cpr::UserAgent{ua},
            cpr::ConnectTimeout{std::chrono::seconds(connectTimeout)},
            // Abort when fewer than 1 byte/s arrives for `timeout` seconds
            cpr::LowSpeed{1, timeout},
            cpr::Redirect{options.followRedirects},
            cpr::HeaderCallback([&](const auto& header, intptr_t) -> bool {
                HttpClient::parseHeaderLine(std::string(header.data(), header.size()),
                                            result.headers, result.statusCode);
                return true;
            }),
            cpr::WriteCallback([&](const auto& data, intptr_t) -> bool {
                if (!deliverResponse()) {
                    return false;
                }
                if (handlers.onData && !handlers.onData(data.data(), data.size())) {
                    aborted = true;
                    return false;
                }
                return true;
            })
        );

        if (result.statusCode == 0) {
            result.statusCode = static_cast<int>(response.status_code);
        }

        if (response.error.code != cpr::ErrorCode::OK && !aborted) {
            result.error = response.error.message.empty()
                ? "transfer failed"
                : response.error.message;
        }

        // Empty bodies never reach the write callback
        if (result.error.empty() && !aborted && result.statusCode > 0) {
            deliverResponse();
        }

    } catch (const std::exception& e) {
        result.error = e.what();
    }

    return result;
}

} // namespace heal::utils
