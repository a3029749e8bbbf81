#include "ctaphid/common/helpers.hpp"
#include <sstream>
#include <iomanip>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace ctaphid {

std::string bytesToHex(const uint8_t* data, size_t len)
{
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string bytesToHex(const std::vector<uint8_t>& data)
{
    return bytesToHex(data.data(), data.size());
}

namespace {

int hex_value(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::optional<std::vector<uint8_t>> hexToBytes(const std::string& text)
{
    std::string digits;
    digits.reserve(text.size());
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        if (hex_value(c) < 0) {
            return std::nullopt;
        }
        digits.push_back(c);
    }

    if (digits.size() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(digits.size() / 2);
    for (size_t i = 0; i < digits.size(); i += 2) {
        bytes.push_back(static_cast<uint8_t>((hex_value(digits[i]) << 4) | hex_value(digits[i + 1])));
    }
    return bytes;
}

std::optional<unsigned long> parseDecimal(const std::string& text, unsigned long max)
{
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
        return std::nullopt;
    }

    errno = 0;
    char* end = nullptr;
    unsigned long value = std::strtoul(text.c_str(), &end, 10);
    if (errno == ERANGE || end == nullptr || *end != '\0' || value > max) {
        return std::nullopt;
    }
    return value;
}

} // namespace ctaphid
