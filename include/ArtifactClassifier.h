#pragma once
// ArtifactClassifier.h — категория скрытого артефакта по его пути
//
// Алгоритм (two-phase, как в сигнатурном сканере):
// 1. RE2::Set — за один проход узнаём, какие правила вообще совпали
// 2. Берём правило с наименьшим индексом (порядок в конфиге = приоритет)
// Если ничего не совпало — возвращается категория, предложенная техникой.

#include <string>
#include <vector>
#include <memory>
#include "ScanConfig.h"

// RE2::Set нельзя forward-declare — храним через type-erased deleter
struct Re2SetDeleter { void operator()(void* p) const noexcept; };

class ArtifactClassifier {
public:
    ArtifactClassifier();
    ~ArtifactClassifier();
    ArtifactClassifier(const ArtifactClassifier&) = delete;
    ArtifactClassifier& operator=(const ArtifactClassifier&) = delete;

    // Компиляция правил. Невалидные паттерны пропускаются с предупреждением
    void prepare(const std::vector<ClassificationRule>& rules);

    // Потокобезопасен после prepare(): RE2::Set::Match — const
    std::string classify(const std::string& path, const std::string& fallback) const;

    size_t rule_count() const { return m_categories.size(); }

private:
    std::unique_ptr<void, Re2SetDeleter> m_set;
    std::vector<std::string> m_categories;  // Категория по ID паттерна в Set
};
