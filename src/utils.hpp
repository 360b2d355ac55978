#pragma once
#include <cstddef>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> random_bytes(std::size_t count);

// 128 random bits formatted as 8-4-4-4-12 lowercase hex.
std::string make_download_id();

bool starts_with(const std::string& value, const std::string& prefix);
std::string to_lower_copy(std::string value);
bool is_hex_string(const std::string& value);
