#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

#include <openssl/evp.h>

#include "cryptography/base64.hpp"

using namespace std;
using namespace nip98::cryptography;

string Base64::encode(const string& str)
{
    // EVP_EncodeBlock writes a terminating null after the encoded data.
    vector<uint8_t> encodedData(Base64::encodedSize(str.size()) + 1);

    int encodedSize = EVP_EncodeBlock(
        encodedData.data(),
        reinterpret_cast<const uint8_t*>(str.data()),
        static_cast<int>(str.size())
    );

    return string(reinterpret_cast<char*>(encodedData.data()), encodedSize);
};

string Base64::decode(const string& str)
{
    if (str.empty() || str.size() % 4 != 0)
    {
        throw invalid_argument("Base64::decode: The input length must be a non-zero multiple of four.");
    }

    // OpenSSL tolerates surrounding whitespace, so the alphabet is checked here first.
    size_t padding = 0;
    for (size_t i = 0; i < str.size(); i++)
    {
        const unsigned char c = static_cast<unsigned char>(str[i]);
        if (c == '=')
        {
            padding++;
            continue;
        }

        bool inAlphabet = isalnum(c) || c == '+' || c == '/';
        if (!inAlphabet || padding > 0)
        {
            throw invalid_argument("Base64::decode: The input contains an invalid character.");
        }
    }

    if (padding > 2)
    {
        throw invalid_argument("Base64::decode: The input contains too much padding.");
    }

    vector<uint8_t> decodedData((str.size() / 4) * 3);

    int decodedSize = EVP_DecodeBlock(
        decodedData.data(),
        reinterpret_cast<const uint8_t*>(str.data()),
        static_cast<int>(str.size())
    );

    if (decodedSize < 0)
    {
        throw invalid_argument("Base64::decode: The input could not be decoded.");
    }

    // EVP_DecodeBlock counts padding characters as zero bytes.
    return string(reinterpret_cast<char*>(decodedData.data()), decodedSize - padding);
};
