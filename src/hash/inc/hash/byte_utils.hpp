#ifndef POWMINER_HASH_BYTE_UTILS_HPP
#define POWMINER_HASH_BYTE_UTILS_HPP

#include <vector>
#include <string>
#include <cstdint>
#include <cstdlib>

static std::vector<unsigned char> HexStringToBytes(const std::string& hexStr)
{
    //the endianness of the byte vector is the same as the endianess of the input string
    std::vector<unsigned char> bytes;
    for (std::size_t i = 0; i + 1 < hexStr.length(); i += 2) {
        std::string byteString = hexStr.substr(i, 2);
        unsigned char byte = static_cast<unsigned char>(strtol(byteString.c_str(), NULL, 16));
        bytes.push_back(byte);
    }
    return bytes;
}

static bool IsHexString(const std::string& hexStr)
{
    if (hexStr.length() % 2 != 0)
    {
        return false;
    }
    for (auto c : hexStr)
    {
        bool const digit = (c >= '0' && c <= '9');
        bool const lower = (c >= 'a' && c <= 'f');
        bool const upper = (c >= 'A' && c <= 'F');
        if (!digit && !lower && !upper)
        {
            return false;
        }
    }
    return true;
}

template <typename Iterator>
static std::string BytesToHexString(Iterator first, Iterator last)
{
    //lowercase, no separators
    static constexpr char hex_digits[] = "0123456789abcdef";
    std::string result;
    for (; first != last; ++first) {
        auto const b = static_cast<unsigned char>(*first);
        result.push_back(hex_digits[b >> 4]);
        result.push_back(hex_digits[b & 0x0F]);
    }
    return result;
}

template <typename T>
static std::string BytesToHexString(const std::vector<T>& bytes)
{
    return BytesToHexString(bytes.begin(), bytes.end());
}

template <typename T>
static std::vector<unsigned char> IntToBytes(T x, int len = sizeof(T))
//convert an integer to an array of bytes len bytes long. Bytes are stored little endian.
{
    std::vector<unsigned char> bytes;
    if (len <= static_cast<int>(sizeof(x)))
    {
        for (auto i = 0; i < len; i++)
        {
            unsigned char b = x & 0xFF;
            bytes.push_back(b);
            x >>= 8;
        }
    }
    return bytes;
}


#endif
