#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "data/data.hpp"

namespace nip98
{
namespace cryptography
{
/**
 * @brief Hashes request bodies for the `payload` tag of an HTTP auth event.
 */
class PayloadHasher
{
public:
    /**
     * @brief Hashes a structured request body.
     * @param payload The request body.
     * @param encoding How the body is serialized before hashing.
     * @returns The lowercase hex-encoded sha256 of the compact JSON serialization of the body.
     * @remark With `PayloadEncoding::InsertionOrder`, two objects that differ only in key order
     * hash differently.  This matches what a JavaScript verifier computes with `JSON.stringify`.
     */
    static std::string hash(
        const nlohmann::ordered_json& payload,
        data::PayloadEncoding encoding = data::PayloadEncoding::InsertionOrder);

    /**
     * @brief Hashes a raw byte sequence.
     * @returns The lowercase hex-encoded sha256 of the bytes.
     */
    static std::string hashBytes(const std::string& bytes);

    /**
     * @brief Produces the exact bytes that `hash` digests.
     */
    static std::string serialize(const nlohmann::ordered_json& payload, data::PayloadEncoding encoding);
};
} // namespace cryptography
} // namespace nip98
