#pragma once
// VolumeProber.h — перечисление томов, их ёмкости и статуса шифрования
//
// Ветки по платформам:
//   Windows — буквы A:..Z:, ёмкость через fs::space, шифрование через manage-bde
//   Linux   — /proc/mounts, только реальные блочные устройства, шифрование через lsblk
//   macOS   — один корневой том, шифрование через fdesetup
//
// list_volumes() никогда не бросает исключений: проблемный том пропускается,
// при полном отказе возвращается пустой список.
// Результат каждый раз вычисляется заново, ничего не кэшируется.

#include <vector>
#include <string>
#include <optional>
#include <functional>
#include <utility>
#include <cstdint>
#include "ScanTypes.h"
#include "ScanConfig.h"
#include "Platform.h"
#include "CommandRunner.h"

// Обращения к файловой системе при перечислении томов.
// По умолчанию — реальные проверки; тесты подставляют свои
struct VolumeAccess {
    using Capacity = std::optional<std::pair<uint64_t, uint64_t>>;  // {total, free}

    std::function<bool(const std::string&)> drive_present;   // "C:\\" — каталог существует
    std::function<bool(const std::string&)> block_device;    // "/dev/sda2" — блочное устройство
    std::function<Capacity(const std::string&)> capacity;

    static VolumeAccess system();
};

class VolumeProber {
public:
    VolumeProber(const PlatformContext& ctx, CommandRunner& runner, const ScanConfig& cfg,
                 VolumeAccess access = VolumeAccess::system());

    std::vector<Volume> list_volumes() const;

    // Ёмкость тома; std::nullopt если fs::space не отработал
    static std::optional<std::pair<uint64_t, uint64_t>> query_capacity(const std::string& path);

private:
    std::vector<Volume> probe_windows() const;
    std::vector<Volume> probe_linux() const;
    std::vector<Volume> probe_root_only() const;

    EncryptionInfo query_windows_encryption(const std::string& drive) const;
    EncryptionInfo query_linux_encryption(const std::string& device) const;
    EncryptionInfo query_mac_encryption() const;

    static void apply_encryption(Volume& v, const EncryptionInfo& info);

    PlatformContext m_ctx;
    CommandRunner& m_runner;
    const ScanConfig& m_cfg;
    VolumeAccess m_access;
};
