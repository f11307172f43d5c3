#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace promptwarden::infrastructure {

namespace fs = std::filesystem;

namespace {

constexpr const char* kAppDir = "PromptWarden";

// $<xdgVar> if set, else $HOME/<homeRelative>, else the working directory.
fs::path XdgBase(const char* xdgVar, const fs::path& homeRelative) {
    const char* xdg = std::getenv(xdgVar);
    if (xdg && *xdg) {
        return fs::path(xdg);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / homeRelative;
    }
    return fs::current_path();
}

} // namespace

fs::path PathUtils::GetDataHome() {
    return XdgBase("XDG_DATA_HOME", fs::path(".local") / "share");
}

fs::path PathUtils::GetConfigHome() {
    return XdgBase("XDG_CONFIG_HOME", ".config");
}

fs::path PathUtils::GetModelsDir() {
    fs::path base = GetDataHome() / kAppDir / "models";
    std::error_code ec;
    fs::create_directories(base, ec);
    if (ec) {
        std::cerr << "[PathUtils] Cannot create " << base << ": " << ec.message() << std::endl;
    }
    return base;
}

fs::path PathUtils::GetDefaultConfigPath() {
    return GetConfigHome() / kAppDir / "settings.json";
}

fs::path PathUtils::GetDefaultAuditPath() {
    return GetDataHome() / kAppDir / "audit.jsonl";
}

} // namespace promptwarden::infrastructure
