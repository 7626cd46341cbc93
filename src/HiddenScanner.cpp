#include "HiddenScanner.h"
#include "ToolParsers.h"
#include "TimeUtil.h"
#include "Logger.h"
#include <algorithm>
#include <chrono>
#include <future>
#include <unordered_set>
#include <utility>

namespace fs = std::filesystem;

// === DiscoveryTechnique ===

// Ключ классификации: путь относительно корня сканирования с ведущим "/",
// чтобы папки выше корня не влияли на категорию. Пути вне корня
// (кусты реестра, $Recycle.Bin) классифицируются целиком
static std::string classification_key(const fs::path& root, const fs::path& p) {
    fs::path rel = p.lexically_normal().lexically_relative(root.lexically_normal());
    if (rel.empty() || rel == "." || *rel.begin() == "..") return p.string();
    return "/" + rel.generic_string();
}

std::optional<HiddenArtifact> DiscoveryTechnique::make_artifact(const fs::path& root,
                                                                const fs::path& p,
                                                                const std::string& tag,
                                                                const std::string& fallback_category) const {
    std::error_code ec;
    fs::file_status st = fs::symlink_status(p, ec);
    if (ec || !fs::exists(st)) return std::nullopt;

    HiddenArtifact a;
    a.path = p.string();
    a.display_name = p.filename().string();
    a.attribute_tag = tag;
    a.origin_platform = platform_name(m_ctx.platform.platform);
    a.is_directory = fs::is_directory(st);

    // Симлинк описывает сам себя: размер 0, цель не открываем
    if (fs::is_regular_file(st)) {
        auto size = fs::file_size(p, ec);
        a.size_bytes = ec ? 0 : static_cast<uint64_t>(size);
    }
    if (!fs::is_symlink(st)) {
        auto mtime = fs::last_write_time(p, ec);
        if (!ec) a.last_modified_ms = to_epoch_ms(mtime);
    }

    a.category = m_ctx.classifier.classify(classification_key(root, p), fallback_category);
    return a;
}

TechniqueResult DiscoveryTechnique::finish(std::string technique, std::vector<HiddenArtifact> found, size_t quota) {
    TechniqueResult r;
    r.technique = std::move(technique);
    r.discovered = found.size();
    std::stable_sort(found.begin(), found.end(), [](const HiddenArtifact& a, const HiddenArtifact& b) {
        return a.size_bytes > b.size_bytes;
    });
    if (found.size() > quota) found.resize(quota);
    r.artifacts = std::move(found);
    return r;
}

// Глубина path относительно root (1: непосредственный потомок), -1 если path вне root
static int depth_below(const fs::path& root, const fs::path& path) {
    fs::path rel = path.lexically_normal().lexically_relative(root.lexically_normal());
    if (rel.empty() || rel == ".") return 0;
    int depth = 0;
    for (const auto& part : rel) {
        if (part == "..") return -1;
        ++depth;
    }
    return depth;
}

// === Dot-prefix walk ===

TechniqueResult DotfileWalkTechnique::discover(const fs::path& root, size_t quota) const {
    std::vector<HiddenArtifact> found;
    const size_t budget = m_ctx.config.walk_node_budget;
    const auto deadline = std::chrono::steady_clock::now()
                        + std::chrono::seconds(m_ctx.config.walk_timeout_seconds);
    size_t visited = 0;
    bool exhausted = false;

    // Ручная рекурсия вместо recursive_directory_iterator: глубина и бюджет
    // контролируются явно, а ошибка в одной папке не обрывает весь обход
    std::vector<std::pair<fs::path, int>> pending{{root, 0}};
    while (!pending.empty() && !exhausted) {
        auto [dir, depth] = pending.back();
        pending.pop_back();

        std::error_code ec;
        fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
            if (++visited > budget || std::chrono::steady_clock::now() > deadline) {
                exhausted = true;
                break;
            }

            const fs::path& p = it->path();
            std::error_code sec;
            fs::file_status st = it->symlink_status(sec);
            if (sec) continue;

            const bool is_dir = fs::is_directory(st);  // false для симлинка на каталог
            const std::string fname = p.filename().string();
            if (!fname.empty() && fname[0] == '.') {
                auto a = make_artifact(root, p, TAG_DOT_PREFIX, is_dir ? "hidden-directory" : "dotfile");
                if (a) found.push_back(std::move(*a));
            }

            if (is_dir && depth + 1 < MAX_WALK_DEPTH) {
                pending.emplace_back(p, depth + 1);
            }
        }
    }

    if (exhausted) {
        Logger::warn("Dot-prefix walk stopped early under " + root.string() + " after "
                     + std::to_string(visited) + " entries (node budget or deadline)");
    }
    return finish(name(), std::move(found), quota);
}

// === OS hidden attribute ===

TechniqueResult NativeHiddenAttributeTechnique::discover(const fs::path& root, size_t quota) const {
    std::vector<HiddenArtifact> found;
    const auto timeout = std::chrono::seconds(m_ctx.config.hidden_attr_timeout_seconds);

    CommandResult res;
    switch (m_ctx.platform.platform) {
    case Platform::WINDOWS:
        res = m_ctx.runner.run("cmd", {"/c", "dir", "/a:h", "/s", "/b", root.string()}, timeout);
        break;
    case Platform::MACOS:
        res = m_ctx.runner.run("find", {root.string(), "-maxdepth", std::to_string(MAX_WALK_DEPTH),
                                        "-flags", "hidden"}, timeout);
        break;
    default:
        // Linux: отдельного атрибута нет, "скрытость" = точка в имени
        return finish(name(), {}, quota);
    }

    // dir и find завершаются с ненулевым кодом при частичном отказе в доступе,
    // но напечатанный список при этом корректен
    if (!res.launched || res.timed_out) {
        Logger::warn("Hidden attribute query produced no data for " + root.string());
        return finish(name(), {}, quota);
    }

    for (const auto& line : parse_line_list(res.output)) {
        fs::path p = line;
        int depth = depth_below(root, p);
        if (depth < 1 || depth > MAX_WALK_DEPTH) continue;
        auto a = make_artifact(root, p, TAG_HIDDEN_FLAG, "hidden");
        if (a) found.push_back(std::move(*a));
    }
    return finish(name(), std::move(found), quota);
}

// === Well-known sensitive paths ===

std::vector<fs::path> SensitivePathTechnique::candidate_paths(const fs::path& root) const {
    const PlatformContext& pc = m_ctx.platform;
    std::vector<fs::path> paths;

    switch (pc.platform) {
    case Platform::WINDOWS: {
        fs::path roaming = pc.app_data.empty() ? root / "AppData" / "Roaming" : pc.app_data;
        fs::path local = pc.local_app_data.empty() ? root / "AppData" / "Local" : pc.local_app_data;
        paths = {
            root / ".ssh",
            roaming / "Microsoft" / "Credentials",
            local / "Microsoft" / "Credentials",
            roaming / "Microsoft" / "Protect",
            roaming / "Microsoft" / "Windows" / "Recent",
            roaming / "Microsoft" / "Windows" / "PowerShell" / "PSReadLine" / "ConsoleHost_history.txt",
            local / "Microsoft" / "Windows" / "INetCache",
            local / "Microsoft" / "Windows" / "Explorer",
            fs::path(pc.system_drive + "\\") / "$Recycle.Bin",
        };
        break;
    }
    case Platform::MACOS:
        paths = {
            root / ".ssh",
            root / ".gnupg",
            root / ".aws" / "credentials",
            root / ".netrc",
            root / ".zsh_history",
            root / ".bash_history",
            root / ".Trash",
            root / "Library" / "Keychains",
            root / "Library" / "Cookies",
            root / "Library" / "Application Support" / "com.apple.sharedfilelist",
        };
        break;
    default:
        paths = {
            root / ".ssh",
            root / ".gnupg",
            root / ".aws" / "credentials",
            root / ".docker" / "config.json",
            root / ".kube" / "config",
            root / ".netrc",
            root / ".git-credentials",
            root / ".bash_history",
            root / ".zsh_history",
            root / ".python_history",
            root / ".local" / "share" / "Trash",
            root / ".local" / "share" / "recently-used.xbel",
            root / ".cache" / "thumbnails",
        };
        break;
    }
    return paths;
}

TechniqueResult SensitivePathTechnique::discover(const fs::path& root, size_t quota) const {
    std::vector<HiddenArtifact> found;

    for (const auto& candidate : candidate_paths(root)) {
        auto a = make_artifact(root, candidate, TAG_SENSITIVE_PATH, "system-hidden");
        if (!a) continue;
        const bool is_dir = a->is_directory;
        found.push_back(std::move(*a));
        if (!is_dir) continue;

        // Каталог раскрывается на один уровень
        std::error_code ec;
        fs::directory_iterator it(candidate, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
            auto child = make_artifact(root, it->path(), TAG_SENSITIVE_PATH, "system-hidden");
            if (child) found.push_back(std::move(*child));
        }
    }
    return finish(name(), std::move(found), quota);
}

// === Registry hives (Windows) ===

TechniqueResult RegistryHiveTechnique::discover(const fs::path& root, size_t quota) const {
    std::vector<HiddenArtifact> found;
    if (m_ctx.platform.platform != Platform::WINDOWS) return finish(name(), {}, quota);

    const PlatformContext& pc = m_ctx.platform;
    fs::path local = pc.local_app_data.empty() ? root / "AppData" / "Local" : pc.local_app_data;
    fs::path config_dir = fs::path(pc.system_drive + "\\") / "Windows" / "System32" / "config";

    const std::vector<fs::path> hives = {
        root / "NTUSER.DAT",
        local / "Microsoft" / "Windows" / "UsrClass.dat",
        config_dir / "SAM",
        config_dir / "SYSTEM",
        config_dir / "SOFTWARE",
        config_dir / "SECURITY",
    };
    for (const auto& hive : hives) {
        // Загруженный куст заблокирован системой, но метаданные доступны
        auto a = make_artifact(root, hive, TAG_REGISTRY_HIVE, "registry");
        if (a) found.push_back(std::move(*a));
    }
    return finish(name(), std::move(found), quota);
}

// === HiddenScanner ===

HiddenScanner::HiddenScanner(const PlatformContext& ctx, CommandRunner& runner, const ScanConfig& cfg)
    : m_platform(ctx), m_ctx{m_platform, runner, cfg, m_classifier} {
    m_classifier.prepare(cfg.classification_rules);

    m_techniques.push_back(std::make_unique<DotfileWalkTechnique>(m_ctx));
    m_techniques.push_back(std::make_unique<NativeHiddenAttributeTechnique>(m_ctx));
    m_techniques.push_back(std::make_unique<SensitivePathTechnique>(m_ctx));
    if (m_platform.platform == Platform::WINDOWS) {
        m_techniques.push_back(std::make_unique<RegistryHiveTechnique>(m_ctx));
    }
}

HiddenScanResult HiddenScanner::merge(std::vector<TechniqueResult> slots) {
    HiddenScanResult result;
    std::unordered_set<std::string> seen;
    size_t discovered = 0;
    size_t duplicates = 0;

    for (auto& slot : slots) {
        discovered += slot.discovered;
        for (auto& a : slot.artifacts) {
            if (!seen.insert(a.path).second) {
                ++duplicates;
                continue;
            }
            result.artifacts.push_back(std::move(a));
        }
    }

    std::stable_sort(result.artifacts.begin(), result.artifacts.end(),
                     [](const HiddenArtifact& a, const HiddenArtifact& b) {
                         return a.size_bytes > b.size_bytes;
                     });
    if (result.artifacts.size() > MAX_HIDDEN_ARTIFACTS) result.artifacts.resize(MAX_HIDDEN_ARTIFACTS);

    result.total_discovered = std::max(discovered - duplicates, result.artifacts.size());
    return result;
}

HiddenScanResult HiddenScanner::scan(const std::optional<std::string>& root) const {
    fs::path scan_root = root ? fs::path(*root) : m_platform.home;

    HiddenScanResult empty;
    empty.scan_root = scan_root.string();
    empty.timestamp = iso8601_now();
    if (scan_root.empty()) {
        empty.error = "No scan root given and home directory is unknown";
        return empty;
    }
    std::error_code ec;
    if (!fs::is_directory(scan_root, ec)) {
        empty.error = "Scan root is not an accessible directory: " + scan_root.string();
        return empty;
    }

    const size_t quota = MAX_HIDDEN_ARTIFACTS / m_techniques.size();
    Logger::info("Hidden scan: " + scan_root.string() + " (" + std::to_string(m_techniques.size())
                 + " techniques, quota " + std::to_string(quota) + ")");

    std::vector<std::future<TechniqueResult>> futures;
    for (const auto& technique : m_techniques) {
        const DiscoveryTechnique* t = technique.get();
        futures.push_back(std::async(std::launch::async, [t, scan_root, quota]() {
            try {
                return t->discover(scan_root, quota);
            }
            catch (const std::exception& e) {
                Logger::warn("Technique '" + t->name() + "' failed: " + e.what());
                TechniqueResult failed;
                failed.technique = t->name();
                return failed;
            }
        }));
    }

    // Слоты собираются в порядке техник, а не в порядке завершения
    std::vector<TechniqueResult> slots;
    for (auto& f : futures) slots.push_back(f.get());

    HiddenScanResult result = merge(std::move(slots));
    result.scan_root = scan_root.string();
    result.timestamp = iso8601_now();
    Logger::info("Hidden scan complete: " + std::to_string(result.artifacts.size()) + " of "
                 + std::to_string(result.total_discovered) + " artifacts kept");
    return result;
}
