#pragma once
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dockgate {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// connection, proxy-connection, keep-alive, transfer-encoding, te, trailer,
// upgrade, host. Any casing.
bool is_hop_by_hop(std::string_view name);

// Drops hop-by-hop headers, keeps everything else untouched and in order.
// Applying it twice gives the same result as applying it once.
HeaderList filter_hop_by_hop(const HeaderList& headers);

// Case-insensitive lookup of the first header with this name.
const std::string* find_header(const HeaderList& headers, std::string_view name);

} // namespace dockgate
