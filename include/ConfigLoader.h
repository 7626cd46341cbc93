#pragma once

#include <vector>
#include <string>
#include <set>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <re2/re2.h>
#include "ScanConfig.h"

class ConfigLoader {
public:
    // Missing file -> defaults. Bad entries are skipped with a warning, never fatal.
    static ScanConfig load(const std::string& filepath) {
        ScanConfig cfg;
        std::ifstream f(filepath);

        if (!f.is_open()) {
            std::cerr << "[ConfigLoader] Warning: Could not open " << filepath << ", using defaults\n";
            return cfg;
        }

        try {
            nlohmann::json j;
            f >> j;

            if (!j.is_object()) {
                std::cerr << "[ConfigLoader] Error: Root must be an object {}\n";
                return cfg;
            }

            read_timeout(j, "command_timeout_seconds", cfg.command_timeout_seconds);
            read_timeout(j, "event_log_timeout_seconds", cfg.event_log_timeout_seconds);
            read_timeout(j, "hidden_attr_timeout_seconds", cfg.hidden_attr_timeout_seconds);
            read_timeout(j, "walk_timeout_seconds", cfg.walk_timeout_seconds);

            if (j.contains("walk_node_budget")) {
                auto budget = j["walk_node_budget"].get<long long>();
                if (budget > 0) cfg.walk_node_budget = static_cast<size_t>(budget);
                else std::cerr << "[ConfigLoader] Warning: walk_node_budget must be positive\n";
            }

            cfg.reports_dir = j.value("reports_dir", cfg.reports_dir);
            cfg.log_dir = j.value("log_dir", cfg.log_dir);
            cfg.mount_table = j.value("mount_table", cfg.mount_table);
            cfg.swap_table = j.value("swap_table", cfg.swap_table);
            cfg.signing_key_path = j.value("signing_key_path", cfg.signing_key_path);

            if (j.contains("snapshot_dirs")) {
                cfg.snapshot_dirs.clear();
                for (const auto& d : j["snapshot_dirs"])
                    cfg.snapshot_dirs.push_back(d.get<std::string>());
            }

            if (j.contains("classification_rules")) {
                auto rules = load_rules(j["classification_rules"]);
                if (!rules.empty()) cfg.classification_rules = std::move(rules);
            }
        }
        catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] JSON Error: " << e.what() << "\n";
        }
        return cfg;
    }

private:
    static void read_timeout(const nlohmann::json& j, const char* key, int& target) {
        if (!j.contains(key)) return;
        int v = j[key].get<int>();
        if (v <= 0 || v > 600) {
            std::cerr << "[ConfigLoader] Warning: " << key << " out of range (" << v << "), ignored\n";
            return;
        }
        target = v;
    }

    static std::vector<ClassificationRule> load_rules(const nlohmann::json& arr) {
        std::vector<ClassificationRule> rules;
        if (!arr.is_array()) {
            std::cerr << "[ConfigLoader] Warning: classification_rules must be an array []\n";
            return rules;
        }

        for (size_t idx = 0; idx < arr.size(); ++idx) {
            const auto& item = arr[idx];
            if (!item.contains("category") || !item.contains("pattern")) {
                std::cerr << "[ConfigLoader] Warning: rule #" << idx
                          << " needs 'category' and 'pattern', skipped\n";
                continue;
            }
            ClassificationRule rule;
            rule.category = item["category"].get<std::string>();
            rule.pattern = item["pattern"].get<std::string>();

            re2::RE2 probe(rule.pattern, re2::RE2::Quiet);
            if (!probe.ok()) {
                std::cerr << "[ConfigLoader] Warning: rule '" << rule.category
                          << "' has invalid pattern: " << probe.error() << "\n";
                continue;
            }
            rules.push_back(rule);
        }

        // Several rules per category are fine, identical patterns are not
        std::set<std::string> patterns;
        for (const auto& r : rules) {
            if (!patterns.insert(r.pattern).second) {
                std::cerr << "[ConfigLoader] Warning: duplicate pattern for '"
                          << r.category << "'\n";
            }
        }
        return rules;
    }
};
