#pragma once
#include <string>
#include <vector>

#include "docker/ContainerRuntime.hpp"

namespace dockgate {

// ---------------------------------------------------------------------------
// "host:container[:mode]" → VolumeBind.
//
//   /srv/data:/data:ro     → {/srv/data, /data, ro}
//   /logs:/var/log         → {/logs, /var/log, rw}
//   C:\data:/data          → {C:\data, /data, rw}    drive letter kept on host side
//   /a:/b:RO               → mode lower-cased to ro
//   /a:/b:rwx              → unknown mode falls back to rw
//   nocolon                → skipped, the rest still parse
//
// Splitting is from the right, at most two splits. A later spec for the same
// host path replaces the earlier one in place.
// ---------------------------------------------------------------------------
std::vector<VolumeBind> parse_volumes(const std::vector<std::string>& specs);

} // namespace dockgate
