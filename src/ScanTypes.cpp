#include "ScanTypes.h"
#include <cmath>

namespace {
    template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
    template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
}

EncryptionStatus describe_encryption(const EncryptionInfo& info) {
    return std::visit(overloaded{
        [](const UnknownEncryptionInfo&) {
            return EncryptionStatus{false, "Unknown"};
        },
        [](const WindowsEncryptionInfo& w) {
            // Suspended protection still leaves the data encrypted on disk.
            bool on = w.protection_status.find("Protection On") != std::string::npos
                      || w.conversion_status.find("Encrypted") != std::string::npos;
            return on ? EncryptionStatus{true, "BitLocker"} : EncryptionStatus{false, ""};
        },
        [](const LinuxEncryptionInfo& l) {
            if (l.luks) return EncryptionStatus{true, "LUKS"};
            if (l.dm_crypt) return EncryptionStatus{true, "dm-crypt"};
            return EncryptionStatus{false, ""};
        },
        [](const MacEncryptionInfo& m) {
            return m.filevault_on ? EncryptionStatus{true, "FileVault"} : EncryptionStatus{false, ""};
        }
    }, info);
}

void Volume::set_capacity(uint64_t total, uint64_t free) {
    total_bytes = total;
    free_bytes = free > total ? total : free;
    used_bytes = total_bytes - free_bytes;
}

double Volume::usage_percent() const {
    if (total_bytes == 0) return 0.0;
    double pct = static_cast<double>(used_bytes) / static_cast<double>(total_bytes) * 100.0;
    return std::round(pct * 10.0) / 10.0;
}

std::string to_string(VolumeKind k) {
    return k == VolumeKind::DRIVE ? "drive" : "mount";
}

std::string to_string(EventSeverity s) {
    switch (s) {
    case EventSeverity::CRITICAL:    return "Critical";
    case EventSeverity::ERROR:       return "Error";
    case EventSeverity::WARNING:     return "Warning";
    case EventSeverity::INFORMATION: return "Information";
    default:                         return "Unknown";
    }
}

std::string to_string(PrivacyRisk r) {
    switch (r) {
    case PrivacyRisk::HIGH:   return "High";
    case PrivacyRisk::MEDIUM: return "Medium";
    default:                  return "Low";
    }
}

std::string to_string(RiskLevel r) {
    switch (r) {
    case RiskLevel::LOW:    return "LOW";
    case RiskLevel::MEDIUM: return "MEDIUM";
    case RiskLevel::HIGH:   return "HIGH";
    default:                return "UNKNOWN";
    }
}
