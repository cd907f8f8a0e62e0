#pragma once
#include <map>
#include <string>
#include <string_view>

namespace dockgate {

// RFC 3986 unreserved characters pass through, everything else is %XX.
std::string url_encode(std::string_view s);

// %XX and '+' decoding. Malformed escapes are kept literally.
std::string url_decode(std::string_view s);

// "a=1&b=x%20y" → {a:1, b:"x y"}. Repeated keys: last one wins.
std::map<std::string, std::string> parse_query(std::string_view query);

} // namespace dockgate
