#pragma once

#include <string>
#include <vector>

struct MagnetLink {
  std::string uri;        // canonical magnet URI handed to the swarm engine
  std::string info_hash;  // 40 lowercase hex characters
  std::string display_name;
  std::vector<std::string> trackers;
};

// Accepts "magnet:?xt=urn:btih:<40 hex | 32 base32>..." or a bare 40-hex
// info-hash. Throws InvalidMagnetError on anything else.
MagnetLink parse_magnet(const std::string& uri);

bool looks_like_info_hash(const std::string& value);
