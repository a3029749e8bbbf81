#pragma once

#include <vector>
#include <string>
#include <optional>
#include <stdint.h>
#include <stddef.h>

namespace ctaphid {

std::string bytesToHex(const uint8_t* data, size_t len);
std::string bytesToHex(const std::vector<uint8_t>& data);

// Accepts "0a1B" and "0A 1B"; nullopt on odd digit count or a non-hex char
std::optional<std::vector<uint8_t>> hexToBytes(const std::string& text);

// Whole string must be a decimal number no greater than max
std::optional<unsigned long> parseDecimal(const std::string& text, unsigned long max);

} // namespace ctaphid
