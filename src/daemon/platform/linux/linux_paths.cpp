#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <format>
#include <unistd.h>

namespace platform {

namespace {

// XDG base directory lookup. Relative values are treated as unset.
std::string xdg_dir(const char* var, const char* home_suffix) {
    const char* xdg = std::getenv(var);
    if (xdg && xdg[0] == '/') return std::string(xdg) + "/tapedeck";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + home_suffix + "/tapedeck";
}

} // namespace

std::string config_dir() {
    return xdg_dir("XDG_CONFIG_HOME", "/.config");
}

std::string data_dir() {
    return xdg_dir("XDG_DATA_HOME", "/.local/share");
}

std::string ipc_endpoint() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && xdg[0] == '/') return std::string(xdg) + "/tapedeck.sock";
    return std::format("/tmp/tapedeck-{}.sock", getuid());
}

} // namespace platform
