/**
 * HttpClient.cpp
 * 
 * Backend-independent HTTP helpers: header and URL parsing.
 */

#include "HttpClient.hpp"
#include "StringUtils.hpp"

namespace heal::utils {

// -- HttpResponse --

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    auto it = headers.find(StringUtils::toLower(name));
    if (it == headers.end()) return std::nullopt;
    return it->second;
}

// -- Header parsing --

std::optional<ContentRange> HttpClient::parseContentRange(const std::string& value) {
    std::string trimmed = StringUtils::trim(value);
    std::string lower = StringUtils::toLower(trimmed);
    if (!StringUtils::startsWith(lower, "bytes")) return std::nullopt;

    std::string rangeSpec = StringUtils::trim(trimmed.substr(5));
    auto slash = rangeSpec.find('/');
    if (slash == std::string::npos) return std::nullopt;

    std::string rangePart = StringUtils::trim(rangeSpec.substr(0, slash));
    std::string totalPart = StringUtils::trim(rangeSpec.substr(slash + 1));

    ContentRange range;

    if (totalPart != "*") {
        range.total = StringUtils::parseInt64(totalPart);
        if (!range.total) return std::nullopt;
    }

    if (rangePart == "*") {
        // Unsatisfied-range form only makes sense with a known total
        if (!range.total) return std::nullopt;
        return range;
    }

    auto dash = rangePart.find('-');
    if (dash == std::string::npos) return std::nullopt;

    range.start = StringUtils::parseInt64(rangePart.substr(0, dash));
    range.end = StringUtils::parseInt64(rangePart.substr(dash + 1));
    if (!range.start || !range.end || *range.end < *range.start) return std::nullopt;

    return range;
}

std::optional<int64_t> HttpClient::parseContentLength(const std::string& value) {
    return StringUtils::parseInt64(value);
}

void HttpClient::parseHeaderLine(const std::string& line, HttpHeaders& headers, int& statusCode) {
    std::string trimmed = StringUtils::trim(line);
    if (trimmed.empty()) return;

    if (StringUtils::startsWith(trimmed, "HTTP/")) {
        headers.clear();
        auto parts = StringUtils::split(trimmed, ' ');
        if (parts.size() >= 2) {
            auto code = StringUtils::parseInt64(parts[1]);
            statusCode = code ? static_cast<int>(*code) : 0;
        }
        return;
    }

    auto colon = trimmed.find(':');
    if (colon == std::string::npos) return;

    std::string name = StringUtils::toLower(StringUtils::trim(trimmed.substr(0, colon)));
    headers[name] = StringUtils::trim(trimmed.substr(colon + 1));
}

// -- URL utilities --

std::string HttpClient::urlPath(const std::string& url) {
    std::string rest = url;

    auto scheme = rest.find("://");
    if (scheme != std::string::npos) {
        rest = rest.substr(scheme + 3);
        auto slash = rest.find('/');
        rest = slash == std::string::npos ? "" : rest.substr(slash);
    }

    auto end = rest.find_first_of("?#");
    if (end != std::string::npos) {
        rest = rest.substr(0, end);
    }
    return rest;
}

std::string HttpClient::urlBasename(const std::string& url) {
    std::string path = urlPath(url);
    auto slash = path.find_last_of('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    name = StringUtils::urlDecode(name);

    // A decoded name must not escape the download directory
    if (name == "." || name == ".." || name.find('/') != std::string::npos ||
        name.find('\\') != std::string::npos) {
        return "";
    }
    return name;
}

} // namespace heal::utils
