#pragma once
#include <cstdint>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::string sha256_hex(const std::vector<std::uint8_t>& data);
std::string sha256_hex(const std::string& data);

// "1.5 MB" style sizes for status lines.
std::string format_bytes(uint64_t bytes);
std::string format_percent(double percent);

std::string guess_mime_type(const std::string& filename);
std::string make_file_id(const std::string& sender_id, int64_t millis, const std::string& filename);
std::string percent_encode(const std::string& value);
std::string percent_decode(const std::string& value);

int64_t unix_millis_now();
