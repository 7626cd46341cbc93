#include "generator/FixtureGenerator.h"
#include <fstream>
#include <stdexcept>

void FixtureGenerator::make_dir(const fs::path& p) {
    std::error_code ec;
    fs::create_directories(p, ec);
    if (ec) throw std::runtime_error("Cannot create " + p.string() + ": " + ec.message());
}

void FixtureGenerator::write_bytes(FixtureStats& stats, const fs::path& p, const std::string& data) {
    make_dir(p.parent_path());
    std::ofstream os(p, std::ios::binary | std::ios::trunc);
    if (!os) throw std::runtime_error("Cannot write " + p.string());
    os.write(data.data(), static_cast<std::streamsize>(data.size()));
    stats.total_files++;
    stats.total_bytes += data.size();
}

void FixtureGenerator::write_file(FixtureStats& stats, const fs::path& p, size_t size, char fill) {
    write_bytes(stats, p, std::string(size, fill));
}

void FixtureGenerator::make_symlink(FixtureStats& stats, const fs::path& target, const fs::path& link, bool to_dir) {
    std::error_code ec;
    if (to_dir) fs::create_directory_symlink(target, link, ec);
    else fs::create_symlink(target, link, ec);
    // Windows без прав разработчика симлинки не создаёт: это не ошибка фикстуры
    if (!ec) stats.symlinks++;
}

void FixtureGenerator::build_dotfiles(FixtureStats& stats, const fs::path& root, size_t extra_dotfiles) {
    // Разные размеры: проверка сортировки по убыванию
    const std::vector<std::pair<std::string, size_t>> top = {
        {".bashrc", 220},
        {".bash_history", 4096},
        {".profile", 807},
        {".gitconfig", 64},
        {".netrc", 48},
    };
    for (const auto& [name, size] : top) {
        write_file(stats, root / name, size);
        stats.dotfiles++;
        stats.expected_found.push_back(root / name);
    }

    make_dir(root / ".ssh");
    stats.hidden_dirs++;
    stats.expected_found.push_back(root / ".ssh");
    write_file(stats, root / ".ssh" / "id_rsa", 1679);
    write_file(stats, root / ".ssh" / "id_rsa.pub", 398);
    write_file(stats, root / ".ssh" / "known_hosts", 444);

    make_dir(root / ".config" / "app");
    stats.hidden_dirs++;
    stats.expected_found.push_back(root / ".config");
    write_file(stats, root / ".config" / "app" / "settings.ini", 128);

    for (size_t i = 0; i < extra_dotfiles; ++i) {
        write_file(stats, root / (".junk_" + std::to_string(i)), 10 + i % 50);
        stats.dotfiles++;
    }
}

void FixtureGenerator::build_nesting(FixtureStats& stats, const fs::path& root) {
    // Уровень 2
    write_file(stats, root / "projects" / ".env", 96);
    stats.dotfiles++;
    stats.expected_found.push_back(root / "projects" / ".env");

    // Уровень 3: каталог находится, но внутрь обход не спускается
    make_dir(root / "projects" / "app" / ".git");
    write_file(stats, root / "projects" / "app" / ".git" / ".keep", 8);
    stats.hidden_dirs++;
    stats.expected_found.push_back(root / "projects" / "app" / ".git");
    stats.expected_missed.push_back(root / "projects" / "app" / ".git" / ".keep");

    write_file(stats, root / "a" / "b" / ".level3", 300);
    stats.dotfiles++;
    stats.expected_found.push_back(root / "a" / "b" / ".level3");

    // Уровень 4
    write_file(stats, root / "a" / "b" / "c" / ".too_deep", 500);
    stats.expected_missed.push_back(root / "a" / "b" / "c" / ".too_deep");

    // Петли: a/.loop -> корень, a/b/cycle -> a
    make_symlink(stats, root, root / "a" / ".loop", true);
    make_symlink(stats, root / "a", root / "a" / "b" / "cycle", true);

    // Обычные файлы для предпросмотра
    write_bytes(stats, root / "notes" / "readme.txt", "privascan fixture\nline two\n");
    write_bytes(stats, root / "notes" / "blob.bin", std::string("MZ\0\x01ab", 6));
}

void FixtureGenerator::build_browsers(FixtureStats& stats, const fs::path& root) {
    const fs::path chrome = root / ".config" / "google-chrome";

    write_file(stats, chrome / "Default" / "History", 65536);
    write_file(stats, chrome / "Default" / "Cookies", 20480);
    write_file(stats, chrome / "Default" / "Login Data", 40960);
    write_file(stats, chrome / "Default" / "Preferences", 1024);
    stats.browser_profiles++;
    stats.browser_artifacts += 4;

    write_file(stats, chrome / "Profile 1" / "History", 32768);
    write_file(stats, chrome / "Profile 1" / "Bookmarks", 512);
    write_file(stats, chrome / "Profile 1" / "Network" / "Cookies", 8192);
    stats.browser_profiles++;
    stats.browser_artifacts += 3;

    // Пустой профиль отбрасывается, чужое имя игнорируется
    make_dir(chrome / "Guest Profile");
    write_file(stats, chrome / "System Profile" / "History", 100);
    write_file(stats, chrome / "Local State", 200);

    const fs::path firefox = root / ".mozilla" / "firefox";
    stats.hidden_dirs++;
    stats.expected_found.push_back(root / ".mozilla");

    write_file(stats, firefox / "abcd1234.default-release" / "places.sqlite", 5242880 / 8);
    write_file(stats, firefox / "abcd1234.default-release" / "cookies.sqlite", 98304);
    write_file(stats, firefox / "abcd1234.default-release" / "logins.json", 700);
    write_file(stats, firefox / "abcd1234.default-release" / "key4.db", 294912);
    stats.browser_profiles++;
    stats.browser_artifacts += 4;

    make_dir(firefox / "zzzzzzzz.empty");
    write_file(stats, firefox / "profiles.ini", 120);
}

FixtureStats FixtureGenerator::generate(const fs::path& root, size_t extra_dotfiles) {
    FixtureStats stats;
    make_dir(root);
    build_dotfiles(stats, root, extra_dotfiles);
    build_nesting(stats, root);
    build_browsers(stats, root);
    return stats;
}
