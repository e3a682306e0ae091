#include <iomanip>
#include <sstream>

#include "hex.hpp"

using namespace std;

namespace nip98
{
namespace cryptography
{
static int _hexDigitValue(char c)
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f')
    {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F')
    {
        return c - 'A' + 10;
    }

    return -1;
};

string toHex(const uint8_t* data, size_t length)
{
    stringstream ss;
    for (size_t i = 0; i < length; i++)
    {
        ss << hex << setw(2) << setfill('0') << static_cast<int>(data[i]);
    }

    return ss.str();
};

bool fromHex(const string& hex, uint8_t* output, size_t length)
{
    if (hex.size() != length * 2)
    {
        return false;
    }

    for (size_t i = 0; i < length; i++)
    {
        int high = _hexDigitValue(hex[i * 2]);
        int low = _hexDigitValue(hex[i * 2 + 1]);
        if (high < 0 || low < 0)
        {
            return false;
        }

        output[i] = static_cast<uint8_t>((high << 4) | low);
    }

    return true;
};
} // namespace cryptography
} // namespace nip98
