#pragma once
// JsonModel.h — сериализация результатов сканирования в JSON
//
// Функции to_json находятся через ADL, поэтому работает
//   nlohmann::json j = volume;
//   nlohmann::json j = scan_result;
//
// Ключи в camelCase (формат, который ожидает UI и который попадает в отчёт).
// Производные поля тома считаются здесь:
//   totalGB/freeGB/usedGB — байты / 1024^3, 2 знака после точки ("349.90")
//   usagePercent          — 1 знак после точки ("69.9"), "0.0" при totalBytes = 0

#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "ScanTypes.h"

std::string format_gb(uint64_t bytes);
std::string format_percent(double percent);

void to_json(nlohmann::json& j, const Volume& v);
void to_json(nlohmann::json& j, const HiddenArtifact& a);
void to_json(nlohmann::json& j, const HiddenScanResult& r);
void to_json(nlohmann::json& j, const BrowserArtifact& a);
void to_json(nlohmann::json& j, const BrowserProfile& p);
void to_json(nlohmann::json& j, const BrowserProfilesResult& r);
void to_json(nlohmann::json& j, const EventLogEntry& e);
void to_json(nlohmann::json& j, const EventScanSummary& s);
void to_json(nlohmann::json& j, const EventLogsResult& r);
void to_json(nlohmann::json& j, const RiskFactors& f);
void to_json(nlohmann::json& j, const RiskAssessment& r);
void to_json(nlohmann::json& j, const PreviewResult& r);
void to_json(nlohmann::json& j, const ReportResult& r);
void to_json(nlohmann::json& j, const VerifyResult& r);
void to_json(nlohmann::json& j, const ProgressEvent& e);
