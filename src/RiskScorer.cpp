#include "RiskScorer.h"
#include <algorithm>

RiskLevel risk_level_for(int score) {
    if (score > 70) return RiskLevel::HIGH;
    if (score > 40) return RiskLevel::MEDIUM;
    return RiskLevel::LOW;
}

RiskAssessment score_risk(const RiskFactors& factors) {
    int score = RISK_BASE_SCORE;
    if (factors.swap_file && factors.swap_file->present) score += RISK_SWAP_WEIGHT;
    if (factors.snapshots && factors.snapshots->present) score += RISK_SNAPSHOT_WEIGHT;
    if (factors.encryption && factors.encryption->enabled) score += RISK_ENCRYPTION_WEIGHT;
    if (factors.free_space && factors.free_space->percent > RISK_FREE_SPACE_THRESHOLD)
        score += RISK_FREE_SPACE_WEIGHT;

    RiskAssessment ra;
    ra.score = std::clamp(score, 0, 100);
    ra.risk = risk_level_for(ra.score);
    ra.factors = factors;
    return ra;
}

EncryptionFactor encryption_factor(const std::vector<Volume>& volumes) {
    EncryptionFactor f;
    f.total_volumes = static_cast<int>(volumes.size());
    f.encrypted_volumes = static_cast<int>(
        std::count_if(volumes.begin(), volumes.end(), [](const Volume& v) { return v.encrypted; }));
    f.coverage = f.total_volumes > 0
        ? static_cast<double>(f.encrypted_volumes) / f.total_volumes * 100.0
        : 0.0;
    f.enabled = f.encrypted_volumes > 0;
    return f;
}

FreeSpaceFactor free_space_factor(const std::vector<Volume>& volumes) {
    FreeSpaceFactor f;
    for (const auto& v : volumes) {
        f.total_bytes += v.total_bytes;
        f.free_bytes += v.free_bytes;
    }
    f.percent = f.total_bytes > 0
        ? static_cast<double>(f.free_bytes) / static_cast<double>(f.total_bytes) * 100.0
        : 0.0;
    return f;
}

RiskAssessment assess_risk(const std::vector<Volume>& volumes,
                           const SwapFactor& swap,
                           const SnapshotFactor& snapshots) {
    if (volumes.empty()) {
        RiskAssessment unknown;
        unknown.score = 0;
        unknown.risk = RiskLevel::UNKNOWN;
        unknown.error = "No volumes could be probed; recoverability risk is unknown";
        return unknown;
    }

    RiskFactors factors;
    factors.swap_file = swap;
    factors.snapshots = snapshots;
    factors.encryption = encryption_factor(volumes);
    factors.free_space = free_space_factor(volumes);
    return score_risk(factors);
}
