#pragma once

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <openssl/evp.h>

namespace heal::utils {

/**
 * Digest algorithms accepted for transfer verification
 */
enum class HashAlgorithm {
    Md5,
    Sha1,
    Sha256
};

class HashUtils {
public:
    static std::string algorithmName(HashAlgorithm algorithm) {
        switch (algorithm) {
            case HashAlgorithm::Md5:    return "md5";
            case HashAlgorithm::Sha1:   return "sha1";
            case HashAlgorithm::Sha256: return "sha256";
        }
        return "md5";
    }

    static std::optional<HashAlgorithm> algorithmFromName(const std::string& name) {
        std::string lower;
        for (char c : name) {
            lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (lower == "md5") return HashAlgorithm::Md5;
        if (lower == "sha1" || lower == "sha-1") return HashAlgorithm::Sha1;
        if (lower == "sha256" || lower == "sha-256") return HashAlgorithm::Sha256;
        return std::nullopt;
    }

    /**
     * Hex digest of a file's contents, or nullopt if the file can't be read
     */
    static std::optional<std::string> hashFile(const std::filesystem::path& filePath,
                                               HashAlgorithm algorithm) {
        std::ifstream file(filePath, std::ios::binary);
        if (!file.is_open()) return std::nullopt;

        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        if (!ctx) return std::nullopt;

        if (EVP_DigestInit_ex(ctx, toEvp(algorithm), nullptr) != 1) {
            EVP_MD_CTX_free(ctx);
            return std::nullopt;
        }

        char buffer[8192];
        while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
            if (EVP_DigestUpdate(ctx, buffer, static_cast<size_t>(file.gcount())) != 1) {
                EVP_MD_CTX_free(ctx);
                return std::nullopt;
            }
        }

        if (file.bad()) {
            EVP_MD_CTX_free(ctx);
            return std::nullopt;
        }

        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;
        int ok = EVP_DigestFinal_ex(ctx, hash, &hashLen);
        EVP_MD_CTX_free(ctx);
        if (ok != 1) return std::nullopt;

        return toHex(hash, hashLen);
    }

    static std::string hashString(const std::string& data, HashAlgorithm algorithm) {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;
        EVP_Digest(data.data(), data.size(), hash, &hashLen, toEvp(algorithm), nullptr);
        return toHex(hash, hashLen);
    }

    static std::string md5String(const std::string& data) {
        return hashString(data, HashAlgorithm::Md5);
    }

private:
    static const EVP_MD* toEvp(HashAlgorithm algorithm) {
        switch (algorithm) {
            case HashAlgorithm::Md5:    return EVP_md5();
            case HashAlgorithm::Sha1:   return EVP_sha1();
            case HashAlgorithm::Sha256: return EVP_sha256();
        }
        return EVP_md5();
    }

    static std::string toHex(const unsigned char* hash, unsigned int hashLen) {
        std::ostringstream oss;
        for (unsigned int i = 0; i < hashLen; ++i) {
            oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
        }
        return oss.str();
    }
};

} // namespace heal::utils
