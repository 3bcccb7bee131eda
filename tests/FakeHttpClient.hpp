// Heal Downloader - in-memory HTTP server for tests

#pragma once

#include "utils/HttpClient.hpp"
#include "utils/StringUtils.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace heal::test {

/**
 * @brief HttpClient serving registered URLs from memory
 *
 * Honors "Range: bytes=N-" with 206/416 answers like a real server and can
 * be scripted to fail, drop the connection or hold the body until released.
 */
class FakeHttpClient : public utils::HttpClient {
public:
    struct Resource {
        std::string body;
        bool supportsRange{true};
        bool sendContentLength{true};

        // Content-Length sent instead of the real remaining size
        std::optional<int64_t> announcedLength;

        // Next N requests fail: with failStatus, or a transport error when 0
        int failuresRemaining{0};
        int failStatus{0};

        // Drop the connection after this many body bytes, on the next request only
        std::optional<int64_t> disconnectAfter;

        // Body slice size and pause before each slice
        size_t sliceSize{1024};
        std::chrono::milliseconds sliceDelay{0};
    };

    struct Request {
        std::string url;
        utils::HttpHeaders headers;   // lower-cased names
    };

    ~FakeHttpClient() override { releaseAll(); }

    Resource& serve(const std::string& url, std::string body) {
        std::lock_guard<std::mutex> lock(m_mutex);
        Resource& resource = m_resources[url];
        resource = Resource{};
        resource.body = std::move(body);
        return resource;
    }

    Resource& resource(const std::string& url) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_resources.at(url);
    }

    /**
     * While held, every request blocks after its response headers until
     * releaseAll()
     */
    void hold() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_held = true;
    }

    void releaseAll() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_held = false;
        }
        m_releaseCondition.notify_all();
    }

    std::vector<Request> requests() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_requests;
    }

    size_t requestCount(const std::string& url) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<size_t>(std::count_if(m_requests.begin(), m_requests.end(),
            [&url](const Request& request) { return request.url == url; }));
    }

    std::vector<std::string> rangeHeaders(const std::string& url) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<std::string> ranges;
        for (const auto& request : m_requests) {
            if (request.url != url) continue;
            auto it = request.headers.find("range");
            ranges.push_back(it != request.headers.end() ? it->second : "");
        }
        return ranges;
    }

    utils::HttpResponse streamGet(const std::string& url,
                                  const utils::HttpOptions& options,
                                  const utils::HttpStreamHandlers& handlers) override {
        utils::HttpResponse response;
        Resource resource;
        bool found = false;
        bool failing = false;
        std::optional<int64_t> disconnectAfter;
        std::optional<int64_t> requested;

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            Request request;
            request.url = url;
            for (const auto& [name, value] : options.headers) {
                request.headers[utils::StringUtils::toLower(name)] = value;
            }
            auto range = request.headers.find("range");
            if (range != request.headers.end() && utils::StringUtils::startsWith(range->second, "bytes=")) {
                std::string spec = range->second.substr(6);
                if (!spec.empty() && spec.back() == '-') spec.pop_back();
                requested = utils::StringUtils::parseInt64(spec);
            }
            m_requests.push_back(std::move(request));

            auto it = m_resources.find(url);
            if (it != m_resources.end()) {
                found = true;
                resource = it->second;
                if (it->second.failuresRemaining > 0) {
                    --it->second.failuresRemaining;
                    failing = true;
                }
                disconnectAfter = it->second.disconnectAfter;
                it->second.disconnectAfter.reset();
            }
        }

        if (!found) {
            response.statusCode = 404;
            deliver(handlers, response);
            return response;
        }

        if (failing) {
            if (resource.failStatus == 0) {
                response.error = "Connection refused";
                return response;
            }
            response.statusCode = resource.failStatus;
            response.headers["content-length"] = "0";
            deliver(handlers, response);
            return response;
        }

        const int64_t size = static_cast<int64_t>(resource.body.size());
        int64_t offset = 0;
        response.statusCode = 200;

        if (requested && resource.supportsRange) {
            if (*requested >= size) {
                response.statusCode = 416;
                response.headers["content-range"] = "bytes */" + std::to_string(size);
                deliver(handlers, response);
                return response;
            }
            offset = *requested;
            response.statusCode = 206;
            response.headers["content-range"] = "bytes " + std::to_string(offset) + "-" +
                                                std::to_string(size - 1) + "/" + std::to_string(size);
        }
        if (resource.sendContentLength) {
            response.headers["content-length"] = std::to_string(resource.announcedLength.value_or(size - offset));
        }

        if (!deliver(handlers, response)) {
            return response;
        }

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_releaseCondition.wait(lock, [this]() { return !m_held; });
        }

        int64_t served = 0;
        while (offset < size) {
            if (resource.sliceDelay.count() > 0) {
                std::this_thread::sleep_for(resource.sliceDelay);
            }

            int64_t length = std::min<int64_t>(static_cast<int64_t>(resource.sliceSize), size - offset);
            if (disconnectAfter) {
                length = std::min<int64_t>(length, *disconnectAfter - served);
                if (length <= 0) {
                    response.error = "Connection reset by peer";
                    return response;
                }
            }

            if (handlers.onData && !handlers.onData(resource.body.data() + offset, static_cast<size_t>(length))) {
                return response;
            }
            offset += length;
            served += length;
        }

        return response;
    }

private:
    static bool deliver(const utils::HttpStreamHandlers& handlers, const utils::HttpResponse& response) {
        return !handlers.onResponse || handlers.onResponse(response.statusCode, response.headers);
    }

    mutable std::mutex m_mutex;
    std::condition_variable m_releaseCondition;
    std::map<std::string, Resource> m_resources;
    std::vector<Request> m_requests;
    bool m_held{false};
};

} // namespace heal::test
