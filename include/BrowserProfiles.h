#pragma once
// BrowserProfiles.h — поиск профилей браузеров и их файлов данных
//
// Читаются ТОЛЬКО метаданные (существование, размер, время изменения).
// Содержимое баз браузера никогда не открывается.
//
// Раскладки:
//   Chromium (Chrome, Chromium, Edge, Brave, Vivaldi):
//     <User Data>/Default, <User Data>/Profile 1, <User Data>/Guest Profile
//   Gecko (Firefox):
//     <Profiles>/abcd1234.default-release

#include <string>
#include <vector>
#include <filesystem>
#include "ScanTypes.h"
#include "Platform.h"

enum class BrowserLayout { CHROMIUM, GECKO };

// Корень профилей одного браузера на текущей ОС
struct BrowserRoot {
    std::string family;                 // "Chrome", "Firefox", ...
    BrowserLayout layout;
    std::filesystem::path profiles_dir;
};

// Файл из белого списка и его смысловой тип
struct KnownBrowserFile {
    const char* relative_path;          // Относительно папки профиля
    const char* semantic_type;          // history, cookies, credentials, autofill, ...
};

class BrowserProfileDetector {
public:
    explicit BrowserProfileDetector(const PlatformContext& ctx);

    BrowserProfilesResult scan() const;

    // Фиксированная таблица корней для платформы
    std::vector<BrowserRoot> profile_roots() const;

    static bool is_profile_dir_name(BrowserLayout layout, const std::string& name);
    static const std::vector<KnownBrowserFile>& known_files(BrowserLayout layout);

private:
    PlatformContext m_ctx;

    void scan_root(const BrowserRoot& root, std::vector<BrowserProfile>& out) const;
    static std::vector<BrowserArtifact> collect_artifacts(const std::filesystem::path& profile_dir,
                                                          BrowserLayout layout);
};
