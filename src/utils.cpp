#include "utils.hpp"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> random_bytes(std::size_t count){
    std::vector<unsigned char> out(count);
    if(count == 0) return out;
    if(RAND_bytes(out.data(), static_cast<int>(count)) != 1){
        throw std::runtime_error("RAND_bytes failed: " + std::to_string(ERR_get_error()));
    }
    return out;
}

std::string make_download_id(){
    auto bytes = random_bytes(16);
    // RFC 4122 version 4 / variant bits
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);
    std::string hex = hex_from_bytes(bytes);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20);
}

bool starts_with(const std::string& value, const std::string& prefix){
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

std::string to_lower_copy(std::string value){
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
    return value;
}

bool is_hex_string(const std::string& value){
    return !value.empty() && std::all_of(value.begin(), value.end(),
        [](unsigned char ch){ return std::isxdigit(ch) != 0; });
}
