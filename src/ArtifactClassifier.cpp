#include "ArtifactClassifier.h"
#include "Logger.h"
#include <algorithm>
#include <re2/re2.h>
#include <re2/set.h>

void Re2SetDeleter::operator()(void* p) const noexcept {
    delete static_cast<re2::RE2::Set*>(p);
}

ArtifactClassifier::ArtifactClassifier() = default;
ArtifactClassifier::~ArtifactClassifier() = default;

void ArtifactClassifier::prepare(const std::vector<ClassificationRule>& rules) {
    m_set.reset();
    m_categories.clear();

    re2::RE2::Options opt;
    opt.set_log_errors(false);
    std::unique_ptr<void, Re2SetDeleter> new_set(new re2::RE2::Set(opt, re2::RE2::UNANCHORED));
    auto* raw = static_cast<re2::RE2::Set*>(new_set.get());

    for (const auto& rule : rules) {
        std::string err;
        if (raw->Add(rule.pattern, &err) < 0) {
            Logger::warn("Classifier: bad pattern for '" + rule.category + "': " + err);
            continue;
        }
        m_categories.push_back(rule.category);
    }

    if (m_categories.empty()) return;
    if (raw->Compile()) {
        m_set = std::move(new_set);
    } else {
        Logger::warn("Classifier: RE2::Set compilation failed, classification disabled");
        m_categories.clear();
    }
}

std::string ArtifactClassifier::classify(const std::string& path, const std::string& fallback) const {
    auto* set = static_cast<re2::RE2::Set*>(m_set.get());
    if (!set) return fallback;

    std::string normalized = path;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');

    std::vector<int> matched_ids;
    if (!set->Match(normalized, &matched_ids) || matched_ids.empty()) return fallback;

    int first = *std::min_element(matched_ids.begin(), matched_ids.end());
    return m_categories[static_cast<size_t>(first)];
}
