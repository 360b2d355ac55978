#include "url_classifier.hpp"

#include "errors.hpp"
#include "magnet_uri.hpp"
#include "utils.hpp"

TransportKind classify_url(const std::string& url) {
  std::string lowered = to_lower_copy(url);
  if(starts_with(lowered, "magnet:") || looks_like_info_hash(url)) {
    return TransportKind::Peer;
  }
  if(starts_with(lowered, "http://") || starts_with(lowered, "https://")) {
    if(lowered.find("://") + 3 >= lowered.size()) {
      throw UnsupportedSchemeError("URL has no host: " + url);
    }
    return TransportKind::Http;
  }
  auto colon = url.find(':');
  std::string scheme = colon == std::string::npos ? std::string("<none>") : url.substr(0, colon);
  throw UnsupportedSchemeError("no transport for scheme '" + scheme + "' in " + url);
}
