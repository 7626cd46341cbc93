#pragma once
// ScanConfig.h — настройки сканера (загружаются из privascan.json)
//
// Пример privascan.json:
// {
//   "command_timeout_seconds": 15,
//   "event_log_timeout_seconds": 30,
//   "walk_node_budget": 20000,
//   "reports_dir": "reports",
//   "classification_rules": [
//     { "category": "ssh", "pattern": "(^|/)\\.ssh(/|$)" }
//   ]
// }
//
// Жёсткие лимиты (200 артефактов, глубина 3, 50 каналов...) здесь не задаются —
// см. константы в ScanTypes.h.

#include <string>
#include <vector>
#include <cstddef>

// Правило классификации артефакта: первый совпавший паттерн задаёт категорию
struct ClassificationRule {
    std::string category;   // ssh, history, credentials, cache, config, registry, trash
    std::string pattern;    // RE2, сопоставляется с путём (разделители приведены к '/')
};

struct ScanConfig {
    // Таймауты внешних утилит (рекомендовано 10–45 секунд)
    int command_timeout_seconds = 15;
    int event_log_timeout_seconds = 30;
    int hidden_attr_timeout_seconds = 45;

    // Ограничения обхода дерева в технике dot-prefix
    size_t walk_node_budget = 20000;
    int walk_timeout_seconds = 30;

    std::string reports_dir = "reports";
    std::string log_dir = "logs";

    // Источники данных Linux (подменяются в тестах)
    std::string mount_table = "/proc/mounts";
    std::string swap_table = "/proc/swaps";
    std::vector<std::string> snapshot_dirs = {"/.snapshots", "/timeshift/snapshots"};

    // PEM-файл закрытого ключа. Пусто — ключ генерируется при каждом запуске
    std::string signing_key_path;

    std::vector<ClassificationRule> classification_rules = default_rules();

    static std::vector<ClassificationRule> default_rules();
};
