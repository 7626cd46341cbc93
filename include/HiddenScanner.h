#pragma once
// HiddenScanner.h — поиск скрытых и чувствительных файлов
//
// Архитектура:
// DiscoveryTechnique (абстрактный класс) — одна техника обнаружения
// ├── DotfileWalkTechnique          — обход дерева, имена с точкой (все ОС)
// ├── NativeHiddenAttributeTechnique — атрибут "hidden" средствами ОС
// │                                    (dir /a:h на Windows, find -flags hidden на macOS)
// ├── SensitivePathTechnique        — фиксированный список известных путей
// └── RegistryHiveTechnique         — файлы кустов реестра (только Windows)
//
// HiddenScanner запускает все техники параллельно (std::async), каждая пишет
// в свой слот результата. Слияние, удаление дубликатов, сортировка и обрезка
// до MAX_HIDDEN_ARTIFACTS выполняются ОДИН раз в конце — итог не зависит
// от порядка завершения техник.

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <filesystem>
#include "ScanTypes.h"
#include "ScanConfig.h"
#include "Platform.h"
#include "CommandRunner.h"
#include "ArtifactClassifier.h"

// Теги техник (поле attribute_tag артефакта)
inline const std::string TAG_DOT_PREFIX = "dot-prefix";
inline const std::string TAG_HIDDEN_FLAG = "hidden-flag";
inline const std::string TAG_SENSITIVE_PATH = "sensitive-path";
inline const std::string TAG_REGISTRY_HIVE = "registry-hive";

// Результат одной техники
struct TechniqueResult {
    std::string technique;
    std::vector<HiddenArtifact> artifacts;  // Не больше квоты, по убыванию размера
    size_t discovered = 0;                  // Сколько найдено до применения квоты
};

// Общие зависимости техник. Классификатор уже подготовлен и только читается
struct TechniqueContext {
    const PlatformContext& platform;
    CommandRunner& runner;
    const ScanConfig& config;
    const ArtifactClassifier& classifier;
};

class DiscoveryTechnique {
public:
    explicit DiscoveryTechnique(const TechniqueContext& ctx) : m_ctx(ctx) {}
    virtual ~DiscoveryTechnique() = default;

    virtual std::string name() const = 0;
    virtual TechniqueResult discover(const std::filesystem::path& root, size_t quota) const = 0;

protected:
    // Метаданные через symlink_status: ссылка описывается сама, цель не трогается.
    // nullopt — путь исчез или недоступен. Категория определяется по пути
    // относительно root
    std::optional<HiddenArtifact> make_artifact(const std::filesystem::path& root,
                                                const std::filesystem::path& p,
                                                const std::string& tag,
                                                const std::string& fallback_category) const;

    // Сортировка по размеру и обрезка до квоты
    static TechniqueResult finish(std::string technique, std::vector<HiddenArtifact> found, size_t quota);

    const TechniqueContext& m_ctx;
};

class DotfileWalkTechnique : public DiscoveryTechnique {
public:
    using DiscoveryTechnique::DiscoveryTechnique;
    std::string name() const override { return "dot-prefix walk"; }
    TechniqueResult discover(const std::filesystem::path& root, size_t quota) const override;
};

class NativeHiddenAttributeTechnique : public DiscoveryTechnique {
public:
    using DiscoveryTechnique::DiscoveryTechnique;
    std::string name() const override { return "native hidden attribute"; }
    TechniqueResult discover(const std::filesystem::path& root, size_t quota) const override;
};

class SensitivePathTechnique : public DiscoveryTechnique {
public:
    using DiscoveryTechnique::DiscoveryTechnique;
    std::string name() const override { return "sensitive paths"; }
    TechniqueResult discover(const std::filesystem::path& root, size_t quota) const override;

    // Список путей для платформы (относительные пути раскрываются от корня сканирования)
    std::vector<std::filesystem::path> candidate_paths(const std::filesystem::path& root) const;
};

class RegistryHiveTechnique : public DiscoveryTechnique {
public:
    using DiscoveryTechnique::DiscoveryTechnique;
    std::string name() const override { return "registry hives"; }
    TechniqueResult discover(const std::filesystem::path& root, size_t quota) const override;
};

class HiddenScanner {
public:
    HiddenScanner(const PlatformContext& ctx, CommandRunner& runner, const ScanConfig& cfg);

    // root не задан — домашняя папка пользователя
    HiddenScanResult scan(const std::optional<std::string>& root = std::nullopt) const;

    size_t technique_count() const { return m_techniques.size(); }

    // Слияние в порядке техник: дубликаты по точному пути отбрасываются
    // (первое вхождение выигрывает), стабильная сортировка по убыванию размера,
    // обрезка до MAX_HIDDEN_ARTIFACTS
    static HiddenScanResult merge(std::vector<TechniqueResult> slots);

    // Техники держат ссылку на m_ctx, а m_ctx ссылается на поля объекта
    HiddenScanner(const HiddenScanner&) = delete;
    HiddenScanner& operator=(const HiddenScanner&) = delete;
    HiddenScanner(HiddenScanner&&) = delete;
    HiddenScanner& operator=(HiddenScanner&&) = delete;

private:
    PlatformContext m_platform;
    ArtifactClassifier m_classifier;
    TechniqueContext m_ctx;
    std::vector<std::unique_ptr<DiscoveryTechnique>> m_techniques;
};
