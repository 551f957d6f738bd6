#include "lib/common/decoders.hpp"

#include <algorithm>

namespace tigerscore
{
namespace ledger
{

int b58_decode_char(char input)
{
    static const std::string alphabet =
        "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
    const size_t pos = alphabet.find(input);
    if (pos == std::string::npos)
        THROW_EXCEPTION(kDecodingError,
                        "Invalid base58 character '" + std::string(1, input) + "'");
    return static_cast<int>(pos);
}

std::vector<uint8_t> b58_decode(const std::string &b58_string)
{
    size_t ones = 0;
    while (ones < b58_string.size() && b58_string[ones] == '1')
        ones++;

    // log(58) / log(256) ~= 0.733, rounded up
    std::vector<uint8_t> bytes((b58_string.size() - ones) * 733 / 1000 + 1, 0);
    size_t length = 0;
    for (size_t i = ones; i < b58_string.size(); i++)
    {
        int carry = b58_decode_char(b58_string[i]);
        size_t j = 0;
        for (auto it = bytes.rbegin(); (carry != 0 || j < length) && it != bytes.rend();
             ++it, ++j)
        {
            carry += 58 * (*it);
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        length = j;
    }

    auto it = bytes.begin() + static_cast<long>(bytes.size() - length);
    while (it != bytes.end() && *it == 0)
        ++it;

    std::vector<uint8_t> output(ones, 0);
    output.insert(output.end(), it, bytes.end());
    return output;
}

PublicKey public_key_from_bytes(const std::string &bytes)
{
    if (bytes.size() != TIGER_PUBKEY_LEN)
        THROW_EXCEPTION(kInvalidInput,
                        "Public key has incorrect size " + std::to_string(bytes.size()));

    PublicKey key;
    std::copy(bytes.begin(), bytes.end(), key.begin());
    return key;
}

PublicKey public_key_from_string(const std::string &b58_string)
{
    const std::vector<uint8_t> bytes = b58_decode(b58_string);
    if (bytes.size() != TIGER_PUBKEY_LEN)
        THROW_EXCEPTION(kInvalidInput, "\"" + b58_string + "\" is not a 32 byte base58 key");

    PublicKey key;
    std::copy(bytes.begin(), bytes.end(), key.begin());
    return key;
}

} // namespace ledger
} // namespace tigerscore
