#include "VolumeProber.h"
#include "ToolParsers.h"
#include "Logger.h"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

VolumeAccess VolumeAccess::system() {
    VolumeAccess a;
    a.drive_present = [](const std::string& root) {
        std::error_code ec;
        return fs::is_directory(root, ec);
    };
    a.block_device = [](const std::string& device) {
        std::error_code ec;
        return fs::is_block_file(device, ec);
    };
    a.capacity = &VolumeProber::query_capacity;
    return a;
}

VolumeProber::VolumeProber(const PlatformContext& ctx, CommandRunner& runner, const ScanConfig& cfg,
                           VolumeAccess access)
    : m_ctx(ctx), m_runner(runner), m_cfg(cfg), m_access(std::move(access)) {}

std::vector<Volume> VolumeProber::list_volumes() const {
    try {
        switch (m_ctx.platform) {
        case Platform::WINDOWS: return probe_windows();
        case Platform::LINUX:   return probe_linux();
        default:                return probe_root_only();
        }
    }
    catch (const std::exception& e) {
        Logger::error(std::string("Volume probe failed: ") + e.what());
        return {};
    }
}

std::optional<std::pair<uint64_t, uint64_t>> VolumeProber::query_capacity(const std::string& path) {
    std::error_code ec;
    fs::space_info info = fs::space(path, ec);
    if (ec) return std::nullopt;
    // Same numbers as statfs: blocks * bsize and bavail * bsize
    return std::make_pair(static_cast<uint64_t>(info.capacity),
                          static_cast<uint64_t>(info.available));
}

void VolumeProber::apply_encryption(Volume& v, const EncryptionInfo& info) {
    EncryptionStatus status = describe_encryption(info);
    v.encrypted = status.encrypted;
    if (!status.mechanism.empty()) v.encryption_mechanism = status.mechanism;
}

// === Windows ===

std::vector<Volume> VolumeProber::probe_windows() const {
    std::vector<Volume> volumes;
    for (char letter = 'A'; letter <= 'Z'; ++letter) {
        const std::string drive = std::string(1, letter) + ":";
        const std::string root = drive + "\\";

        if (!m_access.drive_present(root)) continue;

        auto capacity = m_access.capacity(root);
        if (!capacity) {
            Logger::warn("Cannot read capacity of " + root);
            continue;
        }

        Volume v;
        v.identifier = drive;
        v.mount_path = root;
        v.kind = VolumeKind::DRIVE;
        v.set_capacity(capacity->first, capacity->second);
        apply_encryption(v, query_windows_encryption(drive));
        volumes.push_back(std::move(v));
    }
    return volumes;
}

EncryptionInfo VolumeProber::query_windows_encryption(const std::string& drive) const {
    auto res = m_runner.run("manage-bde", {"-status", drive},
                            std::chrono::seconds(m_cfg.command_timeout_seconds));
    if (!res.ok()) return UnknownEncryptionInfo{};

    WindowsEncryptionInfo info = parse_manage_bde_status(res.output);
    if (info.protection_status.empty() && info.conversion_status.empty()) {
        // Localized output or an unsupported volume type
        return UnknownEncryptionInfo{};
    }
    return info;
}

// === Linux ===

std::vector<Volume> VolumeProber::probe_linux() const {
    std::ifstream f(m_cfg.mount_table);
    if (!f.is_open()) {
        Logger::warn("Cannot read mount table " + m_cfg.mount_table + ", falling back to root volume");
        return probe_root_only();
    }
    std::stringstream buf;
    buf << f.rdbuf();

    std::vector<Volume> volumes;
    for (const auto& entry : parse_mount_table(buf.str())) {
        if (!is_physical_device(entry.device)) continue;

        if (!m_access.block_device(entry.device)) continue;

        auto capacity = m_access.capacity(entry.mount_point);
        if (!capacity) {
            Logger::warn("Cannot read capacity of " + entry.mount_point);
            continue;
        }

        Volume v;
        v.identifier = fs::path(entry.device).filename().string();
        v.mount_path = entry.mount_point;
        v.device_node = entry.device;
        v.kind = VolumeKind::MOUNT;
        v.set_capacity(capacity->first, capacity->second);
        apply_encryption(v, query_linux_encryption(entry.device));
        volumes.push_back(std::move(v));
    }
    return volumes;
}

EncryptionInfo VolumeProber::query_linux_encryption(const std::string& device) const {
    // -s walks the dependency chain upwards, so a filesystem on /dev/mapper/luks-*
    // reports both its "crypt" layer and the crypto_LUKS partition below it
    auto res = m_runner.run("lsblk", {"-s", "-n", "-r", "-o", "TYPE,FSTYPE", device},
                            std::chrono::seconds(m_cfg.command_timeout_seconds));
    if (!res.ok()) return UnknownEncryptionInfo{};
    return parse_lsblk_crypt(res.output);
}

// === macOS / fallback ===

std::vector<Volume> VolumeProber::probe_root_only() const {
    std::vector<Volume> volumes;
    auto capacity = m_access.capacity("/");
    if (!capacity) {
        Logger::warn("Cannot read capacity of root volume");
        return volumes;
    }

    Volume v;
    v.identifier = "Root";
    v.mount_path = "/";
    v.kind = VolumeKind::MOUNT;
    v.set_capacity(capacity->first, capacity->second);
    if (m_ctx.platform == Platform::MACOS) {
        apply_encryption(v, query_mac_encryption());
    } else {
        apply_encryption(v, UnknownEncryptionInfo{});
    }
    volumes.push_back(std::move(v));
    return volumes;
}

EncryptionInfo VolumeProber::query_mac_encryption() const {
    auto res = m_runner.run("fdesetup", {"status"},
                            std::chrono::seconds(m_cfg.command_timeout_seconds));
    if (!res.ok()) return UnknownEncryptionInfo{};
    return parse_fdesetup_status(res.output);
}
