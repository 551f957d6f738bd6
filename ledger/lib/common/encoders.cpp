#include "lib/common/encoders.hpp"

#include <algorithm>

namespace tigerscore
{
namespace ledger
{

static const char b58_alphabet[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

std::string hex_encode(const uint8_t *data, size_t size)
{
    static const char hex_digits[] = "0123456789abcdef";

    std::string output;
    output.reserve(size * 2);
    for (size_t i = 0; i < size; i++)
    {
        output.push_back(hex_digits[data[i] >> 4]);
        output.push_back(hex_digits[data[i] & 15]);
    }
    return output;
}

std::string b58_encode(const std::vector<uint8_t> &bytes)
{
    // Leading zero bytes are encoded as '1' each
    size_t zeros = 0;
    while (zeros < bytes.size() && bytes[zeros] == 0)
        zeros++;

    // log(256) / log(58) ~= 1.37, rounded up
    std::vector<uint8_t> digits((bytes.size() - zeros) * 138 / 100 + 1, 0);
    size_t length = 0;
    for (size_t i = zeros; i < bytes.size(); i++)
    {
        int carry = bytes[i];
        size_t j = 0;
        for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend();
             ++it, ++j)
        {
            carry += 256 * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }

    auto it = digits.begin() + static_cast<long>(digits.size() - length);
    while (it != digits.end() && *it == 0)
        ++it;

    std::string output(zeros, '1');
    output.reserve(zeros + static_cast<size_t>(digits.end() - it));
    for (; it != digits.end(); ++it)
        output.push_back(b58_alphabet[*it]);
    return output;
}

std::string public_key_to_string(const PublicKey &key)
{
    return b58_encode(std::vector<uint8_t>(key.begin(), key.end()));
}

} // namespace ledger
} // namespace tigerscore
