#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);
std::vector<unsigned char> hmac_sha256(const std::string& key, const std::string& message);

std::vector<unsigned char> random_bytes(std::size_t count);
std::string random_hex(std::size_t byte_count);

std::string base64_encode(const std::vector<unsigned char>& data);
std::string base64_encode(const std::string& data);
// Throws std::invalid_argument on malformed input.
std::vector<unsigned char> base64_decode(const std::string& text);
std::string base64url_encode(const std::vector<unsigned char>& data);

using TimePoint = std::chrono::system_clock::time_point;

// Current time truncated to milliseconds so it survives a text round trip.
TimePoint utc_now();
std::string format_rfc3339(TimePoint tp);
std::optional<TimePoint> parse_rfc3339(const std::string& text);

std::vector<std::string> split(const std::string& text, char sep);
std::string short_id(const std::string& id, std::size_t len = 8);
