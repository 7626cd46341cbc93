#pragma once
// RiskScorer.h — оценка вероятности восстановления удалённых данных
//
// Чистые функции, никакого I/O:
//   score = 50
//   + 20  если есть файл подкачки
//   + 25  если есть снапшоты
//   - 30  если включено шифрование
//   + 15  если свободно больше 20% места
//   score = clamp(score, 0, 100)
//   risk  = score > 70 ? HIGH : score > 40 ? MEDIUM : LOW
//
// Отсутствующий фактор (std::nullopt) на счёт не влияет.

#include <vector>
#include "ScanTypes.h"

constexpr int RISK_BASE_SCORE = 50;
constexpr int RISK_SWAP_WEIGHT = 20;
constexpr int RISK_SNAPSHOT_WEIGHT = 25;
constexpr int RISK_ENCRYPTION_WEIGHT = -30;
constexpr int RISK_FREE_SPACE_WEIGHT = 15;
constexpr double RISK_FREE_SPACE_THRESHOLD = 20.0;

RiskAssessment score_risk(const RiskFactors& factors);
RiskLevel risk_level_for(int score);

// Факторы шифрования и свободного места из списка томов
EncryptionFactor encryption_factor(const std::vector<Volume>& volumes);
FreeSpaceFactor free_space_factor(const std::vector<Volume>& volumes);

// Полная сборка: тома + swap + снапшоты -> оценка.
// Пустой список томов -> UNKNOWN, score 0 и текст ошибки
RiskAssessment assess_risk(const std::vector<Volume>& volumes,
                           const SwapFactor& swap,
                           const SnapshotFactor& snapshots);
