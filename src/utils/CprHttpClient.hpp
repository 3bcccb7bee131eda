// Heal Downloader - cpr HTTP backend
// HttpClient implementation on top of cpr (libcurl)

#pragma once

#include "HttpClient.hpp"

namespace heal::utils {

/**
 * @brief HttpClient backed by cpr
 *
 * Each streamGet call runs its own cpr session, so one instance can be
 * shared by every transfer thread.
 */
class CprHttpClient : public HttpClient {
public:
    CprHttpClient() = default;
    ~CprHttpClient() override = default;

    CprHttpClient(const CprHttpClient&) = delete;
    CprHttpClient& operator=(const CprHttpClient&) = delete;

    HttpResponse streamGet(const std::string& url,
                           const HttpOptions& options,
                           const HttpStreamHandlers& handlers) override;
};

} // namespace heal::utils
