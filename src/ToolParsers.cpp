#include "ToolParsers.h"
#include "TextUtil.h"
#include <sstream>
#include <map>
#include <re2/re2.h>

namespace {
    std::vector<std::string> split_lines(const std::string& text) {
        std::vector<std::string> lines;
        std::istringstream in(text);
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            lines.push_back(line);
        }
        return lines;
    }

    std::vector<std::string> split_fields(const std::string& line) {
        std::vector<std::string> fields;
        std::istringstream in(line);
        std::string f;
        while (in >> f) fields.push_back(f);
        return fields;
    }

    // Value of a "Key:   value" line in manage-bde style output, empty if absent.
    std::string field_value(const std::string& text, const re2::RE2& re) {
        std::string value;
        if (re2::RE2::PartialMatch(text, re, &value)) return trim(value);
        return "";
    }

    int count_matches(const std::string& text, const re2::RE2& re) {
        int count = 0;
        re2::StringPiece input(text);
        while (re2::RE2::FindAndConsume(&input, re)) ++count;
        return count;
    }
}

// === /proc/mounts ===

std::string decode_mount_escapes(const std::string& field) {
    std::string out;
    out.reserve(field.size());
    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size()) {
            const char a = field[i + 1], b = field[i + 2], c = field[i + 3];
            if (a >= '0' && a <= '3' && b >= '0' && b <= '7' && c >= '0' && c <= '7') {
                out += static_cast<char>((a - '0') * 64 + (b - '0') * 8 + (c - '0'));
                i += 3;
                continue;
            }
        }
        out += field[i];
    }
    return out;
}

std::vector<MountEntry> parse_mount_table(const std::string& text) {
    std::vector<MountEntry> entries;
    for (const auto& line : split_lines(text)) {
        auto fields = split_fields(line);
        if (fields.size() < 3) continue;
        entries.push_back({decode_mount_escapes(fields[0]),
                           decode_mount_escapes(fields[1]),
                           fields[2]});
    }
    return entries;
}

bool is_physical_device(const std::string& device) {
    if (!starts_with(device, "/dev/")) return false;
    const std::string name = device.substr(5);
    if (name.empty()) return false;
    static const re2::RE2 virtual_re("^(loop|ram|zram|fd|nbd|sr)\\d*");
    return !re2::RE2::PartialMatch(name, virtual_re);
}

// === Encryption ===

LinuxEncryptionInfo parse_lsblk_crypt(const std::string& text) {
    LinuxEncryptionInfo info;
    for (const auto& line : split_lines(text)) {
        auto fields = split_fields(line);
        if (fields.empty()) continue;
        if (fields[0] == "crypt") info.dm_crypt = true;
        if (fields.size() > 1 && fields[1] == "crypto_LUKS") info.luks = true;
    }
    return info;
}

WindowsEncryptionInfo parse_manage_bde_status(const std::string& text) {
    static const re2::RE2 protection_re("(?m)^\\s*Protection Status:\\s*([^\\r\\n]*)");
    static const re2::RE2 conversion_re("(?m)^\\s*Conversion Status:\\s*([^\\r\\n]*)");
    static const re2::RE2 method_re("(?m)^\\s*Encryption Method:\\s*([^\\r\\n]*)");

    WindowsEncryptionInfo info;
    info.protection_status = field_value(text, protection_re);
    info.conversion_status = field_value(text, conversion_re);
    info.method = field_value(text, method_re);
    return info;
}

MacEncryptionInfo parse_fdesetup_status(const std::string& text) {
    static const re2::RE2 status_re("FileVault is (On|Off)");
    MacEncryptionInfo info;
    std::string state;
    if (re2::RE2::PartialMatch(text, status_re, &state)) {
        info.filevault_on = (state == "On");
    }
    return info;
}

// === Swap / snapshots ===

std::vector<std::string> parse_proc_swaps(const std::string& text) {
    std::vector<std::string> swaps;
    for (const auto& line : split_lines(text)) {
        auto fields = split_fields(line);
        if (fields.empty() || fields[0] == "Filename") continue;
        swaps.push_back(decode_mount_escapes(fields[0]));
    }
    return swaps;
}

int parse_vssadmin_shadow_count(const std::string& text) {
    static const re2::RE2 shadow_re("(?i)Shadow Copy ID:");
    return count_matches(text, shadow_re);
}

int parse_tmutil_snapshot_count(const std::string& text) {
    static const re2::RE2 snapshot_re("com\\.apple\\.TimeMachine\\.");
    return count_matches(text, snapshot_re);
}

std::vector<std::string> parse_line_list(const std::string& text) {
    std::vector<std::string> items;
    for (const auto& line : split_lines(text)) {
        auto t = trim(line);
        if (!t.empty()) items.push_back(t);
    }
    return items;
}

// === wevtutil /f:text ===

EventSeverity parse_severity(const std::string& level) {
    const std::string l = to_lower(trim(level));
    if (l == "critical")    return EventSeverity::CRITICAL;
    if (l == "error")       return EventSeverity::ERROR;
    if (l == "warning")     return EventSeverity::WARNING;
    if (l == "information" || l == "info") return EventSeverity::INFORMATION;
    return EventSeverity::UNKNOWN;
}

std::vector<EventLogEntry> parse_wevtutil_events(const std::string& text, const std::string& channel) {
    static const re2::RE2 header_re("^\\s*Event\\[\\d+\\]:\\s*$");
    static const re2::RE2 field_re("^\\s*([A-Za-z][A-Za-z ]*?):\\s*(.*)$");

    std::vector<std::vector<std::string>> blocks;
    for (const auto& line : split_lines(text)) {
        if (re2::RE2::FullMatch(line, header_re)) {
            blocks.emplace_back();
            continue;
        }
        if (!blocks.empty()) blocks.back().push_back(line);
    }

    std::vector<EventLogEntry> entries;
    for (const auto& block : blocks) {
        std::map<std::string, std::string> fields;
        std::string description;
        bool in_description = false;

        for (const auto& line : block) {
            if (in_description) {
                description += line;
                description += ' ';
                continue;
            }
            std::string key, value;
            if (!re2::RE2::FullMatch(line, field_re, &key, &value)) continue;
            if (key == "Description") {
                in_description = true;
                description = value + " ";
                continue;
            }
            fields.emplace(key, trim(value));
        }

        EventLogEntry entry;
        entry.event_id = fields.count("Event ID") ? fields["Event ID"] : "";
        entry.time_created = fields.count("Date") ? fields["Date"] : "";
        if (entry.event_id.empty() && entry.time_created.empty()) continue;

        entry.severity = parse_severity(fields.count("Level") ? fields["Level"] : "");
        entry.source = fields.count("Source") ? fields["Source"] : "";
        entry.channel = fields.count("Log Name") ? fields["Log Name"] : channel;
        entry.description = truncate_utf8(trim(collapse_whitespace(description)), MAX_DESCRIPTION_CHARS);
        entries.push_back(std::move(entry));
    }
    return entries;
}
