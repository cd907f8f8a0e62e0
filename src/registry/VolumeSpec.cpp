#include "registry/VolumeSpec.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

using namespace dockgate;

// "C:\..." or "C:/...": the first colon belongs to the host path.
static bool has_drive_letter(const std::string& s) {
    return s.size() >= 3 &&
           std::isalpha(static_cast<unsigned char>(s[0])) &&
           s[1] == ':' &&
           (s[2] == '\\' || s[2] == '/');
}

std::vector<VolumeBind> dockgate::parse_volumes(const std::vector<std::string>& specs) {
    std::vector<VolumeBind> out;

    for (const auto& spec : specs) {
        const size_t floor = has_drive_letter(spec) ? 2 : 0;

        size_t last = spec.rfind(':');
        if (last == std::string::npos || last < floor || (floor && last == 1)) {
            std::cerr << "[VOLUME] Skipping malformed spec '" << spec << "'\n";
            continue;
        }

        VolumeBind bind;
        size_t prev = last > floor ? spec.rfind(':', last - 1) : std::string::npos;
        if (prev == std::string::npos || prev < floor || (floor && prev == 1)) {
            bind.host_path      = spec.substr(0, last);
            bind.container_path = spec.substr(last + 1);
            bind.mode           = "rw";
        } else {
            bind.host_path      = spec.substr(0, prev);
            bind.container_path = spec.substr(prev + 1, last - prev - 1);
            bind.mode           = spec.substr(last + 1);
        }

        if (bind.host_path.empty() || bind.container_path.empty()) {
            std::cerr << "[VOLUME] Skipping malformed spec '" << spec << "'\n";
            continue;
        }

        std::transform(bind.mode.begin(), bind.mode.end(), bind.mode.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (bind.mode != "ro" && bind.mode != "rw") bind.mode = "rw";

        auto existing = std::find_if(out.begin(), out.end(), [&](const VolumeBind& v) {
            return v.host_path == bind.host_path;
        });
        if (existing != out.end()) *existing = std::move(bind);
        else out.push_back(std::move(bind));
    }
    return out;
}
