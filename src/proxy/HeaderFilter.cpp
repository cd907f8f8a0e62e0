#include "proxy/HeaderFilter.hpp"
#include <boost/beast/core/string.hpp>

using namespace dockgate;
namespace beast = boost::beast;

static constexpr const char* HOP_BY_HOP[] = {
    "connection",
    "proxy-connection",
    "keep-alive",
    "transfer-encoding",
    "te",
    "trailer",
    "upgrade",
    "host",
};

bool dockgate::is_hop_by_hop(std::string_view name) {
    beast::string_view n(name.data(), name.size());
    for (const char* h : HOP_BY_HOP) {
        if (beast::iequals(n, h)) return true;
    }
    return false;
}

HeaderList dockgate::filter_hop_by_hop(const HeaderList& headers) {
    HeaderList out;
    out.reserve(headers.size());
    for (const auto& h : headers) {
        if (!is_hop_by_hop(h.first)) out.push_back(h);
    }
    return out;
}

const std::string* dockgate::find_header(const HeaderList& headers, std::string_view name) {
    beast::string_view n(name.data(), name.size());
    for (const auto& h : headers) {
        if (beast::iequals(h.first, n)) return &h.second;
    }
    return nullptr;
}
