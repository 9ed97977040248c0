#pragma once

#include <string>

namespace platform {

// Directory holding config.json. Empty if neither XDG_CONFIG_HOME nor HOME is set.
std::string config_dir();

// Control socket path the daemon listens on and the client connects to.
std::string ipc_endpoint();

} // namespace platform
