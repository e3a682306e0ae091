#include <algorithm>
#include <vector>

#include <openssl/evp.h>
#include <openssl/sha.h>

#include "cryptography/payload_hasher.hpp"
#include "hex.hpp"

using namespace std;
using namespace nip98::cryptography;
using namespace nip98::data;

using nlohmann::ordered_json;

/**
 * @brief Copies a JSON value with the keys of every nested object sorted bytewise.
 */
static ordered_json _sortKeys(const ordered_json& value)
{
    if (value.is_object())
    {
        vector<string> keys;
        for (auto& item : value.items())
        {
            keys.push_back(item.key());
        }
        sort(keys.begin(), keys.end());

        ordered_json sorted = ordered_json::object();
        for (const string& key : keys)
        {
            sorted[key] = _sortKeys(value.at(key));
        }

        return sorted;
    }

    if (value.is_array())
    {
        ordered_json sorted = ordered_json::array();
        for (const auto& element : value)
        {
            sorted.push_back(_sortKeys(element));
        }

        return sorted;
    }

    return value;
};

string PayloadHasher::hash(const ordered_json& payload, PayloadEncoding encoding)
{
    return PayloadHasher::hashBytes(PayloadHasher::serialize(payload, encoding));
};

string PayloadHasher::hashBytes(const string& bytes)
{
    unsigned char hash[SHA256_DIGEST_LENGTH];
    EVP_Digest(bytes.data(), bytes.size(), hash, NULL, EVP_sha256(), NULL);

    return toHex(hash, SHA256_DIGEST_LENGTH);
};

string PayloadHasher::serialize(const ordered_json& payload, PayloadEncoding encoding)
{
    switch (encoding)
    {
    case PayloadEncoding::Canonical:
        return _sortKeys(payload).dump();

    case PayloadEncoding::InsertionOrder:
    default:
        return payload.dump();
    }
};
