#include "BrowserProfiles.h"
#include "TimeUtil.h"
#include "Logger.h"
#include <algorithm>
#include <re2/re2.h>

namespace fs = std::filesystem;

BrowserProfileDetector::BrowserProfileDetector(const PlatformContext& ctx) : m_ctx(ctx) {}

std::vector<BrowserRoot> BrowserProfileDetector::profile_roots() const {
    const fs::path& home = m_ctx.home;
    std::vector<BrowserRoot> roots;

    switch (m_ctx.platform) {
    case Platform::WINDOWS: {
        fs::path local = m_ctx.local_app_data.empty() ? home / "AppData" / "Local" : m_ctx.local_app_data;
        fs::path roaming = m_ctx.app_data.empty() ? home / "AppData" / "Roaming" : m_ctx.app_data;
        roots = {
            {"Chrome",   BrowserLayout::CHROMIUM, local / "Google" / "Chrome" / "User Data"},
            {"Chromium", BrowserLayout::CHROMIUM, local / "Chromium" / "User Data"},
            {"Edge",     BrowserLayout::CHROMIUM, local / "Microsoft" / "Edge" / "User Data"},
            {"Brave",    BrowserLayout::CHROMIUM, local / "BraveSoftware" / "Brave-Browser" / "User Data"},
            {"Vivaldi",  BrowserLayout::CHROMIUM, local / "Vivaldi" / "User Data"},
            {"Firefox",  BrowserLayout::GECKO,    roaming / "Mozilla" / "Firefox" / "Profiles"},
        };
        break;
    }
    case Platform::MACOS: {
        fs::path support = home / "Library" / "Application Support";
        roots = {
            {"Chrome",   BrowserLayout::CHROMIUM, support / "Google" / "Chrome"},
            {"Chromium", BrowserLayout::CHROMIUM, support / "Chromium"},
            {"Edge",     BrowserLayout::CHROMIUM, support / "Microsoft Edge"},
            {"Brave",    BrowserLayout::CHROMIUM, support / "BraveSoftware" / "Brave-Browser"},
            {"Vivaldi",  BrowserLayout::CHROMIUM, support / "Vivaldi"},
            {"Firefox",  BrowserLayout::GECKO,    support / "Firefox" / "Profiles"},
        };
        break;
    }
    default: {
        fs::path config = home / ".config";
        roots = {
            {"Chrome",   BrowserLayout::CHROMIUM, config / "google-chrome"},
            {"Chromium", BrowserLayout::CHROMIUM, config / "chromium"},
            {"Edge",     BrowserLayout::CHROMIUM, config / "microsoft-edge"},
            {"Brave",    BrowserLayout::CHROMIUM, config / "BraveSoftware" / "Brave-Browser"},
            {"Vivaldi",  BrowserLayout::CHROMIUM, config / "vivaldi"},
            {"Firefox",  BrowserLayout::GECKO,    home / ".mozilla" / "firefox"},
        };
        break;
    }
    }
    return roots;
}

bool BrowserProfileDetector::is_profile_dir_name(BrowserLayout layout, const std::string& name) {
    static const re2::RE2 chromium_re("^(Default|Profile \\d+|Guest Profile)$");
    static const re2::RE2 gecko_re("^[a-z0-9]{8}\\.[\\w-]+$");
    return re2::RE2::FullMatch(name, layout == BrowserLayout::CHROMIUM ? chromium_re : gecko_re);
}

const std::vector<KnownBrowserFile>& BrowserProfileDetector::known_files(BrowserLayout layout) {
    static const std::vector<KnownBrowserFile> chromium = {
        {"History",                 "history"},
        {"Visited Links",           "history"},
        {"Top Sites",               "history"},
        {"Shortcuts",               "history"},
        {"Favicons",                "history"},
        {"Cookies",                 "cookies"},
        {"Network/Cookies",         "cookies"},
        {"Extension Cookies",       "cookies"},
        {"Login Data",              "credentials"},
        {"Login Data For Account",  "credentials"},
        {"Web Data",                "autofill"},
        {"Bookmarks",               "bookmarks"},
        {"Sessions",                "session"},
        {"Current Session",         "session"},
        {"Preferences",             "preferences"},
    };
    static const std::vector<KnownBrowserFile> gecko = {
        {"places.sqlite",           "history"},
        {"favicons.sqlite",         "history"},
        {"cookies.sqlite",          "cookies"},
        {"webappsstore.sqlite",     "storage"},
        {"logins.json",             "credentials"},
        {"key4.db",                 "credentials"},
        {"cert9.db",                "certificates"},
        {"formhistory.sqlite",      "autofill"},
        {"sessionstore.jsonlz4",    "session"},
        {"permissions.sqlite",      "preferences"},
    };
    return layout == BrowserLayout::CHROMIUM ? chromium : gecko;
}

std::vector<BrowserArtifact> BrowserProfileDetector::collect_artifacts(const fs::path& profile_dir,
                                                                       BrowserLayout layout) {
    std::vector<BrowserArtifact> artifacts;
    for (const auto& known : known_files(layout)) {
        fs::path p = profile_dir / fs::path(known.relative_path);
        std::error_code ec;
        if (!fs::exists(p, ec)) continue;

        BrowserArtifact a;
        a.name = known.relative_path;
        a.path = p.string();
        a.semantic_type = known.semantic_type;
        // Sessions: каталог, размер не считаем
        if (fs::is_regular_file(p, ec)) {
            auto size = fs::file_size(p, ec);
            if (!ec) a.size_bytes = static_cast<uint64_t>(size);
        }
        auto mtime = fs::last_write_time(p, ec);
        if (!ec) a.last_modified_ms = to_epoch_ms(mtime);
        artifacts.push_back(std::move(a));
    }
    return artifacts;
}

void BrowserProfileDetector::scan_root(const BrowserRoot& root, std::vector<BrowserProfile>& out) const {
    std::error_code ec;
    if (!fs::is_directory(root.profiles_dir, ec)) return;

    std::vector<fs::path> candidates;
    for (fs::directory_iterator it(root.profiles_dir, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code sec;
        if (!it->is_directory(sec) || it->is_symlink(sec)) continue;
        if (is_profile_dir_name(root.layout, it->path().filename().string())) {
            candidates.push_back(it->path());
        }
    }
    if (ec) Logger::warn("Cannot list " + root.profiles_dir.string() + ": " + ec.message());

    // Порядок directory_iterator не определён
    std::sort(candidates.begin(), candidates.end());

    for (const auto& dir : candidates) {
        auto artifacts = collect_artifacts(dir, root.layout);
        if (artifacts.empty()) continue;

        BrowserProfile profile;
        profile.browser_family = root.family;
        profile.profile_name = dir.filename().string();
        profile.profile_path = dir.string();
        profile.artifacts = std::move(artifacts);
        out.push_back(std::move(profile));
    }
}

BrowserProfilesResult BrowserProfileDetector::scan() const {
    BrowserProfilesResult result;
    for (const auto& root : profile_roots()) {
        try {
            scan_root(root, result.profiles);
        }
        catch (const std::exception& e) {
            Logger::warn("Browser root " + root.profiles_dir.string() + " skipped: " + e.what());
        }
    }
    result.total_found = result.profiles.size();
    Logger::info("Browser profiles found: " + std::to_string(result.total_found));
    return result;
}
