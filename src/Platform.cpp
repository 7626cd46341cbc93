#include "Platform.h"
#include <cstdlib>

namespace {
    std::string env_or_empty(const char* name) {
        const char* v = std::getenv(name);
        return v ? std::string(v) : std::string();
    }
}

Platform current_platform() {
#if defined(_WIN32)
    return Platform::WINDOWS;
#elif defined(__APPLE__)
    return Platform::MACOS;
#elif defined(__linux__)
    return Platform::LINUX;
#else
    return Platform::OTHER;
#endif
}

std::string platform_name(Platform p) {
    switch (p) {
    case Platform::WINDOWS: return "win32";
    case Platform::LINUX:   return "linux";
    case Platform::MACOS:   return "darwin";
    default:                return "unknown";
    }
}

PlatformContext PlatformContext::current() {
    PlatformContext ctx;
    ctx.platform = current_platform();

    if (ctx.platform == Platform::WINDOWS) {
        ctx.home = env_or_empty("USERPROFILE");
        ctx.app_data = env_or_empty("APPDATA");
        ctx.local_app_data = env_or_empty("LOCALAPPDATA");
        std::string drive = env_or_empty("SystemDrive");
        if (!drive.empty()) ctx.system_drive = drive;
        if (ctx.home.empty()) ctx.home = ctx.system_drive + "\\Users\\Default";
        if (ctx.app_data.empty()) ctx.app_data = ctx.home / "AppData" / "Roaming";
        if (ctx.local_app_data.empty()) ctx.local_app_data = ctx.home / "AppData" / "Local";
    } else {
        ctx.home = env_or_empty("HOME");
        if (ctx.home.empty()) ctx.home = "/";
    }
    return ctx;
}
