#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

namespace {
constexpr const char* kAppName = "live-interpreter";
}

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/" + kAppName;
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/" + kAppName;
}

std::string ipc_endpoint() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && *xdg) return std::string(xdg) + "/" + kAppName + ".sock";
    return std::string("/tmp/") + kAppName + ".sock";
}

} // namespace platform
