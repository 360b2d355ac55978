#include "magnet_uri.hpp"

#include <cctype>
#include <cstdint>
#include <sstream>
#include <vector>

#include "errors.hpp"
#include "utils.hpp"

namespace {

constexpr const char* kMagnetPrefix = "magnet:?";
constexpr const char* kBtihPrefix = "urn:btih:";

std::string percent_decode(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for(std::size_t i = 0; i < value.size(); ++i) {
    char ch = value[i];
    if(ch == '+') {
      out.push_back(' ');
    } else if(ch == '%' && i + 2 < value.size() &&
              std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
              std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
      out.push_back(static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16)));
      i += 2;
    } else {
      out.push_back(ch);
    }
  }
  return out;
}

// RFC 4648 base32 (no padding) of a 20 byte hash -> hex.
std::string base32_hash_to_hex(const std::string& value) {
  std::vector<unsigned char> bytes;
  bytes.reserve(20);
  uint32_t buffer = 0;
  int bits = 0;
  for(char raw : value) {
    char ch = static_cast<char>(std::toupper(static_cast<unsigned char>(raw)));
    int digit = -1;
    if(ch >= 'A' && ch <= 'Z') digit = ch - 'A';
    else if(ch >= '2' && ch <= '7') digit = ch - '2' + 26;
    if(digit < 0) {
      throw InvalidMagnetError("info-hash is not valid base32: " + value);
    }
    buffer = (buffer << 5) | static_cast<uint32_t>(digit);
    bits += 5;
    if(bits >= 8) {
      bits -= 8;
      bytes.push_back(static_cast<unsigned char>((buffer >> bits) & 0xff));
    }
  }
  return hex_from_bytes(bytes);
}

std::string normalize_info_hash(const std::string& value) {
  if(value.size() == 40 && is_hex_string(value)) {
    return to_lower_copy(value);
  }
  if(value.size() == 32) {
    return base32_hash_to_hex(value);
  }
  throw InvalidMagnetError("info-hash must be 40 hex or 32 base32 characters, got '" + value + "'");
}

} // namespace

bool looks_like_info_hash(const std::string& value) {
  return value.size() == 40 && is_hex_string(value);
}

MagnetLink parse_magnet(const std::string& uri) {
  MagnetLink link;
  if(looks_like_info_hash(uri)) {
    link.info_hash = to_lower_copy(uri);
    link.uri = std::string(kMagnetPrefix) + "xt=" + kBtihPrefix + link.info_hash;
    return link;
  }

  if(!starts_with(to_lower_copy(uri.substr(0, 8)), kMagnetPrefix)) {
    throw InvalidMagnetError("not a magnet URI: " + uri);
  }

  std::istringstream query(uri.substr(8));
  std::string param;
  while(std::getline(query, param, '&')) {
    auto eq = param.find('=');
    if(eq == std::string::npos) continue;
    std::string key = to_lower_copy(param.substr(0, eq));
    std::string value = param.substr(eq + 1);
    if(key == "xt") {
      std::string decoded = percent_decode(value);
      if(starts_with(to_lower_copy(decoded), kBtihPrefix) && link.info_hash.empty()) {
        link.info_hash = normalize_info_hash(decoded.substr(9));
      }
    } else if(key == "dn") {
      link.display_name = percent_decode(value);
    } else if(key == "tr") {
      link.trackers.push_back(percent_decode(value));
    }
  }

  if(link.info_hash.empty()) {
    throw InvalidMagnetError("magnet URI has no urn:btih info-hash: " + uri);
  }
  link.uri = uri;
  return link;
}
