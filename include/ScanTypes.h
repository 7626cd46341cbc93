#pragma once
// ScanTypes.h — модель данных сканера приватности
//
// Все структуры — value objects: их создаёт одна проба, владеет ими вызывающий.
// Ни одна структура не хранит ссылку на сканер, который её породил.
//
// Производные поля (GB-строки, процент занятости) здесь НЕ хранятся —
// они вычисляются из total/free/used при сериализации (см. JsonModel.h).

#include <string>
#include <vector>
#include <optional>
#include <variant>
#include <cstdint>
#include <cstddef>

// Жёсткие лимиты. Не настраиваются через конфиг.
constexpr size_t MAX_HIDDEN_ARTIFACTS = 200;   // Максимум артефактов в результате
constexpr int    MAX_WALK_DEPTH = 3;           // Глубина рекурсии ниже корня
constexpr size_t MAX_LOG_CHANNELS = 50;        // Сколько каналов журнала перечисляем
constexpr int    MAX_RAW_EVENTS = 100;         // Сырых событий на канал (wevtutil /c:)
constexpr size_t MAX_EVENTS_PER_CHANNEL = 20;  // Разобранных событий на канал
constexpr size_t MAX_DESCRIPTION_CHARS = 200;  // Длина описания события
constexpr size_t PREVIEW_MAX_BYTES = 2048;     // Предпросмотр файла

// ---------------------------------------------------------------------------
// Тома и шифрование
// ---------------------------------------------------------------------------

enum class VolumeKind { DRIVE, MOUNT };

// Результат опроса подсистемы шифрования — свой тип на каждую платформу.
// Общий интерфейс получается через describe_encryption().
struct UnknownEncryptionInfo {};

struct WindowsEncryptionInfo {
    std::string protection_status;  // "Protection On" / "Protection Off"
    std::string conversion_status;  // "Fully Encrypted", "Fully Decrypted", ...
    std::string method;             // "XTS-AES 128", "None", ...
};

struct LinuxEncryptionInfo {
    bool dm_crypt = false;          // В цепочке устройства есть слой TYPE=crypt
    bool luks = false;              // Есть FSTYPE=crypto_LUKS
};

struct MacEncryptionInfo {
    bool filevault_on = false;
};

using EncryptionInfo = std::variant<UnknownEncryptionInfo, WindowsEncryptionInfo,
                                    LinuxEncryptionInfo, MacEncryptionInfo>;

struct EncryptionStatus {
    bool encrypted = false;
    std::string mechanism;  // Пусто — шифрования нет; "Unknown" — опрос не удался
};

EncryptionStatus describe_encryption(const EncryptionInfo& info);

struct Volume {
    std::string identifier;                  // "C:", "sda2", "Root"
    std::string mount_path;
    std::optional<std::string> device_node;  // "/dev/sda2"
    VolumeKind kind = VolumeKind::MOUNT;
    uint64_t total_bytes = 0;
    uint64_t free_bytes = 0;
    uint64_t used_bytes = 0;                 // Всегда total - free
    bool encrypted = false;
    std::optional<std::string> encryption_mechanism;

    // Единственный способ выставить ёмкость — держит инвариант used = total - free
    void set_capacity(uint64_t total, uint64_t free);
    double usage_percent() const;
};

// ---------------------------------------------------------------------------
// Скрытые артефакты
// ---------------------------------------------------------------------------

struct HiddenArtifact {
    std::string path;
    std::optional<std::string> display_name;
    uint64_t size_bytes = 0;         // Для каталогов всегда 0
    int64_t last_modified_ms = 0;    // Unix epoch, миллисекунды
    std::string attribute_tag;       // Какая техника нашла: dot-prefix, hidden-flag, ...
    std::string category;            // dotfile, hidden-directory, ssh, cache, ...
    std::string origin_platform;
    bool is_directory = false;
};

struct HiddenScanResult {
    std::vector<HiddenArtifact> artifacts;
    size_t total_discovered = 0;     // Сколько найдено ДО обрезки до MAX_HIDDEN_ARTIFACTS
    std::string scan_root;
    std::string timestamp;
    std::optional<std::string> error;
};

// ---------------------------------------------------------------------------
// Профили браузеров
// ---------------------------------------------------------------------------

struct BrowserArtifact {
    std::string name;
    std::string path;
    uint64_t size_bytes = 0;
    int64_t last_modified_ms = 0;
    std::string semantic_type;       // history, cookies, credentials, ...
};

struct BrowserProfile {
    std::string browser_family;
    std::string profile_name;
    std::string profile_path;
    std::vector<BrowserArtifact> artifacts;
};

struct BrowserProfilesResult {
    std::vector<BrowserProfile> profiles;
    size_t total_found = 0;
    std::optional<std::string> error;
};

// ---------------------------------------------------------------------------
// Журналы событий
// ---------------------------------------------------------------------------

enum class EventSeverity { CRITICAL, ERROR, WARNING, INFORMATION, UNKNOWN };
enum class PrivacyRisk { HIGH, MEDIUM, LOW };

struct EventLogEntry {
    std::string event_id;
    std::string time_created;
    EventSeverity severity = EventSeverity::UNKNOWN;
    std::string source;
    std::string description;         // Не длиннее MAX_DESCRIPTION_CHARS
    std::string channel;

    // privacyRisk не хранится — всегда вычисляется из event_id
    PrivacyRisk privacy_risk() const;
};

struct EventScanSummary {
    std::string platform;
    size_t channels_available = 0;
    size_t channels_queried = 0;
    size_t channels_failed = 0;
    size_t high_risk = 0;
    size_t medium_risk = 0;
    size_t low_risk = 0;
};

struct EventLogsResult {
    bool supported = true;
    std::vector<EventLogEntry> logs;
    size_t total_entries = 0;
    std::vector<std::string> log_sources;
    EventScanSummary summary;
    std::optional<std::string> error;
};

// ---------------------------------------------------------------------------
// Оценка риска
// ---------------------------------------------------------------------------

enum class RiskLevel { LOW, MEDIUM, HIGH, UNKNOWN };

struct SwapFactor {
    bool present = false;
    std::string location;
};

struct SnapshotFactor {
    bool present = false;
    int count = 0;
    std::string source;
};

struct EncryptionFactor {
    bool enabled = false;
    double coverage = 0.0;           // encrypted / total * 100
    int encrypted_volumes = 0;
    int total_volumes = 0;
};

struct FreeSpaceFactor {
    double percent = 0.0;
    uint64_t free_bytes = 0;
    uint64_t total_bytes = 0;
};

struct RiskFactors {
    std::optional<SwapFactor> swap_file;
    std::optional<SnapshotFactor> snapshots;
    std::optional<EncryptionFactor> encryption;
    std::optional<FreeSpaceFactor> free_space;
};

struct RiskAssessment {
    int score = 0;
    RiskLevel risk = RiskLevel::UNKNOWN;
    RiskFactors factors;
    std::optional<std::string> error;
};

// ---------------------------------------------------------------------------
// Предпросмотр, отчёты, прогресс
// ---------------------------------------------------------------------------

struct PreviewResult {
    std::string content;
    size_t bytes_read = 0;
    bool is_binary = false;
    std::optional<std::string> error;
};

struct ReportResult {
    bool success = false;
    std::optional<std::string> report_id;
    std::optional<std::string> document_path;
    std::optional<std::string> data_path;
    std::optional<std::string> signature;
    std::optional<std::string> error;
};

struct VerifyResult {
    bool valid = false;
    std::optional<std::string> report_id;
    std::optional<std::string> timestamp;
    std::optional<bool> public_key_match;
    std::optional<std::string> error;
};

struct ProgressEvent {
    int step = 0;
    int total_steps = 0;
    double progress_percent = 0.0;
    std::string message;
    bool completed = false;
};

std::string to_string(VolumeKind k);
std::string to_string(EventSeverity s);
std::string to_string(PrivacyRisk r);
std::string to_string(RiskLevel r);
