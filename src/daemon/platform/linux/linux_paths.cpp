#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

namespace {

constexpr const char* kAppName = "streamscribe";

// $<xdg_var>/streamscribe, else $HOME/<home_fallback>/streamscribe.
std::string xdg_path(const char* xdg_var, const char* home_fallback) {
    if (const char* xdg = std::getenv(xdg_var)) {
        return std::string(xdg) + "/" + kAppName;
    }
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/" + home_fallback + "/" + kAppName;
}

} // namespace

std::string config_dir() {
    return xdg_path("XDG_CONFIG_HOME", ".config");
}

std::string data_dir() {
    return xdg_path("XDG_DATA_HOME", ".local/share");
}

std::string ipc_endpoint() {
    if (const char* xdg = std::getenv("XDG_RUNTIME_DIR")) {
        return std::string(xdg) + "/" + kAppName + ".sock";
    }
    return std::string("/tmp/") + kAppName + ".sock";
}

} // namespace platform
