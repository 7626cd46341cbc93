#pragma once
#include <string>
#include <vector>
#include <cstddef>
#include <iostream>
#include <filesystem>

namespace fs = std::filesystem;

// Что было создано — эталон для тестов
struct FixtureStats {
    int dotfiles = 0;            // Файлы с точкой в пределах глубины 3
    int hidden_dirs = 0;         // Каталоги с точкой в пределах глубины 3
    int symlinks = 0;            // Созданные симлинки (на некоторых ФС не создаются)
    int browser_profiles = 0;    // Профили, в которых есть файлы из белого списка
    int browser_artifacts = 0;
    int total_files = 0;
    size_t total_bytes = 0;

    std::vector<fs::path> expected_found;    // Должны найтись обходом dot-prefix
    std::vector<fs::path> expected_missed;   // Глубже 3 уровней — не должны

    void print() const {
        std::cout << "===== FIXTURE HOME (Ground Truth) =====" << std::endl;
        std::cout << "Dotfiles: " << dotfiles << " | Hidden dirs: " << hidden_dirs
                  << " | Symlinks: " << symlinks << std::endl;
        std::cout << "Browser profiles: " << browser_profiles
                  << " | Browser artifacts: " << browser_artifacts << std::endl;
        std::cout << "Total Files: " << total_files << " | Total Size: " << total_bytes << " bytes" << std::endl;
        std::cout << "=======================================" << std::endl;
    }
};

// Синтетическая домашняя папка Linux-раскладки:
//   .bashrc, .bash_history, .ssh/, .config/ ...      — уровень 1
//   projects/.env, a/.loop -> <root> (петля)          — уровень 2
//   projects/app/.git/, a/b/.level3                   — уровень 3
//   a/b/c/.too_deep                                   — уровень 4 (не находится)
//   .config/google-chrome/{Default,Profile 1,Guest Profile}
//   .mozilla/firefox/{abcd1234.default-release,zzzzzzzz.empty}
class FixtureGenerator {
public:
    // extra_dotfiles — дополнительные .junk_N файлы в корне (проверка лимита 200)
    FixtureStats generate(const fs::path& root, size_t extra_dotfiles = 0);

private:
    void write_bytes(FixtureStats& stats, const fs::path& p, const std::string& data);
    void write_file(FixtureStats& stats, const fs::path& p, size_t size, char fill = 'x');
    void make_dir(const fs::path& p);
    void make_symlink(FixtureStats& stats, const fs::path& target, const fs::path& link, bool to_dir);

    void build_dotfiles(FixtureStats& stats, const fs::path& root, size_t extra_dotfiles);
    void build_nesting(FixtureStats& stats, const fs::path& root);
    void build_browsers(FixtureStats& stats, const fs::path& root);
};
