#pragma once

#include <string>

#include "download_types.hpp"

// magnet: or a bare 40-hex info-hash -> Peer; http:// or https:// -> Http.
// Anything else throws UnsupportedSchemeError.
TransportKind classify_url(const std::string& url);
