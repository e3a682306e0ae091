#include <sstream>
#include <stdexcept>

#include "data/data.hpp"

using namespace nlohmann;
using namespace nip98::data;
using namespace std;

/**
 * @brief Reads an optional non-negative integer setting.
 * @returns The value of the setting, or `fallback` if the key is absent.
 */
static long long _readDuration(const json& j, const string& key, long long fallback)
{
    if (!j.contains(key))
    {
        return fallback;
    }

    const json& value = j.at(key);
    if (!value.is_number_integer() || value.get<long long>() < 0)
    {
        ostringstream oss;
        oss << "AuthConfig::fromJson: '" << key << "' must be a non-negative integer.";
        throw invalid_argument(oss.str());
    }

    return value.get<long long>();
};

AuthConfig AuthConfig::fromString(const string& jstr)
{
    json j;
    try
    {
        j = json::parse(jstr);
    }
    catch (const json::parse_error& pe)
    {
        ostringstream oss;
        oss << "AuthConfig::fromString: The string is not valid JSON: " << pe.what();
        throw invalid_argument(oss.str());
    }

    return AuthConfig::fromJson(j);
};

AuthConfig AuthConfig::fromJson(const json& j)
{
    if (!j.is_object())
    {
        throw invalid_argument("AuthConfig::fromJson: The configuration must be a JSON object.");
    }

    AuthConfig config;

    config.maxEventAge = chrono::seconds(
        _readDuration(j, "max_event_age_seconds", config.maxEventAge.count()));
    config.maxClockSkew = chrono::seconds(
        _readDuration(j, "max_clock_skew_seconds", config.maxClockSkew.count()));
    config.tokenCacheMaxAge = chrono::milliseconds(
        _readDuration(j, "token_cache_max_age_ms", config.tokenCacheMaxAge.count()));

    if (config.maxEventAge.count() == 0)
    {
        throw invalid_argument("AuthConfig::fromJson: 'max_event_age_seconds' must be positive.");
    }

    if (j.contains("include_authorization_scheme"))
    {
        const json& value = j.at("include_authorization_scheme");
        if (!value.is_boolean())
        {
            throw invalid_argument("AuthConfig::fromJson: 'include_authorization_scheme' must be a boolean.");
        }
        config.includeAuthorizationScheme = value.get<bool>();
    }

    if (j.contains("payload_encoding"))
    {
        const json& value = j.at("payload_encoding");
        string encoding = value.is_string() ? value.get<string>() : string();
        if (encoding == "insertion_order")
        {
            config.payloadEncoding = PayloadEncoding::InsertionOrder;
        }
        else if (encoding == "canonical")
        {
            config.payloadEncoding = PayloadEncoding::Canonical;
        }
        else
        {
            throw invalid_argument(
                "AuthConfig::fromJson: 'payload_encoding' must be \"insertion_order\" or \"canonical\".");
        }
    }

    return config;
};
