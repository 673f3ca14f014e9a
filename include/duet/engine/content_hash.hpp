#pragma once

#include <iomanip>
#include <nlohmann/json.hpp>
#include <openssl/sha.h>
#include <sstream>
#include <string>

namespace duet {
namespace engine {

/// Lowercase hex SHA-256 of `data`.
inline std::string sha256_hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

/**
 * @brief Content address of a query: sha256(query ":" canonical(variables)).
 *
 * Object keys serialize in sorted order, so equal variable maps hash equally
 * regardless of construction order. Null variables count as `{}`.
 */
inline std::string query_content_hash(const std::string& query, const nlohmann::json& variables) {
    const nlohmann::json canonical = variables.is_null() ? nlohmann::json::object() : variables;
    return sha256_hex(query + ":" + canonical.dump());
}

} // namespace engine
} // namespace duet
