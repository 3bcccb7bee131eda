// Heal Downloader - String Utilities
// String helpers shared by the HTTP layer, the engine and the CLI

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace heal::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    // Trimming
    static std::string trim(const std::string& str);

    // Case handling
    static std::string toLower(const std::string& str);
    static bool equalsIgnoreCase(const std::string& a, const std::string& b);

    // Splitting and searching
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static bool startsWith(const std::string& str, const std::string& prefix);

    // Formatting
    static std::string formatBytes(int64_t bytes);
    static std::string formatDuration(std::chrono::seconds duration);

    // Parsing. Accepts only an optional surrounding whitespace and decimal digits.
    static std::optional<int64_t> parseInt64(const std::string& str);

    // Percent-decoding of URL path segments ('+' is left alone)
    static std::string urlDecode(const std::string& str);
};

} // namespace heal::utils
