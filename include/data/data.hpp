#pragma once

#include <chrono>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace nip98
{
namespace data
{
/**
 * @brief A Nostr event.
 * @remark The same structure serves as the unsigned template handed to a signer and as the
 * signed event returned by it.  On a template, the `pubkey`, `sig`, and `id` fields are empty.
 * The significance of an HTTP auth event is carried entirely by its `tags`; the `content` field
 * is always empty.
 */
struct Event
{
    std::string id; ///< SHA-256 hash of the event data.  Optional on the wire.
    std::string pubkey; ///< Public key of the event creator.
    std::time_t createdAt = 0; ///< Unix timestamp of the event creation.
    int kind = 0; ///< Event kind.
    std::vector<std::vector<std::string>> tags; ///< Ordered event metadata.
    std::string content; ///< Event content.
    std::string sig; ///< Event signature created with the private key of the event creator.

    /**
     * @brief Serializes the event to a JSON object.
     * @returns A stringified JSON object representing the event.
     * @throws `std::invalid_argument` if the event object is invalid.
     * @remark Keys are emitted in the order `kind`, `created_at`, `content`, `tags`, `pubkey`,
     * `sig`, followed by `id` when the event has one.
     */
    std::string serialize() const;

    /**
     * @brief Deserializes the event from a JSON string.
     * @param jsonString A stringified JSON object representing the event.
     * @returns An event instance created from the JSON string.
     * @throws `std::invalid_argument` if the string is not a JSON object of the expected shape.
     */
    static Event fromString(const std::string& jsonString);

    /**
     * @brief Deserializes the event from a JSON object.
     * @param j A JSON object representing the event.
     * @returns An event instance created from the JSON object.
     * @throws `std::invalid_argument` if `kind` or `created_at` is not a number, `content` is not
     * a string, or `tags` is not an array of arrays of strings.  `pubkey`, `sig`, and `id` are
     * optional, but must be strings when present.
     */
    static Event fromJson(const nlohmann::json& j);

    /**
     * @brief Generates the NIP-01 ID for the event.
     * @return The 32-byte lowercase hex-encoded sha256 of `[0, pubkey, created_at, kind, tags,
     * content]`.
     */
    std::string generateId() const;

    /**
     * @brief Finds the value of the first tag with the given name.
     * @returns The second element of the first tag whose first element equals `key`, or
     * `std::nullopt` if there is no such tag or the first such tag has no value.
     */
    std::optional<std::string> tagValue(const std::string& key) const;

private:
    /**
     * @brief Reads `created_at`, flooring fractional seconds.
     * @throws `std::invalid_argument` if the value does not fit in a `std::time_t`.
     */
    static std::time_t _readTimestamp(const nlohmann::json& value);
};

/**
 * @brief A generated token held by a client for reuse across requests.
 */
struct AuthToken
{
    std::string token; ///< The encoded token string.
    Event event; ///< The signed event carried by the token.
    std::chrono::system_clock::time_point createdAt; ///< Wall-clock time the record was created.
};

/**
 * @brief Options for token generation.
 */
struct TokenOptions
{
    ///< Prefix the token with the `Nostr ` scheme label.  Falls back to the configured default.
    std::optional<bool> includeAuthorizationScheme;

    ///< Request body to bind into the token via a `payload` tag.
    std::optional<nlohmann::ordered_json> payload;
};

/**
 * @brief Controls how structured payloads are serialized before hashing.
 */
enum class PayloadEncoding
{
    InsertionOrder, ///< Keys are kept in insertion order, matching `JSON.stringify`.
    Canonical ///< Object keys are sorted recursively.
};

/**
 * @brief Tunables for token generation and validation.
 * @remark Every key in the JSON form is optional; missing keys keep their defaults.
 */
struct AuthConfig
{
    std::chrono::seconds maxEventAge = std::chrono::seconds(60);
    std::chrono::seconds maxClockSkew = std::chrono::seconds(5);
    std::chrono::milliseconds tokenCacheMaxAge = std::chrono::milliseconds(60000);
    bool includeAuthorizationScheme = false;
    PayloadEncoding payloadEncoding = PayloadEncoding::InsertionOrder;

    /**
     * @brief Reads a configuration from a JSON string.
     * @throws `std::invalid_argument` if the string is not valid JSON or a value is mistyped or
     * out of range.
     */
    static AuthConfig fromString(const std::string& jsonString);

    /**
     * @brief Reads a configuration from a JSON object with the keys `max_event_age_seconds`,
     * `max_clock_skew_seconds`, `token_cache_max_age_ms`, `include_authorization_scheme`, and
     * `payload_encoding` (`"insertion_order"` or `"canonical"`).
     * @throws `std::invalid_argument` if a value is mistyped or out of range.
     */
    static AuthConfig fromJson(const nlohmann::json& j);
};
} // namespace data
} // namespace nip98
