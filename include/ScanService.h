#pragma once
// ScanService.h — граница ядра: операции, которые вызывает UI / CLI
//
// Каждая операция:
//   - вызывается независимо от остальных и может выполняться параллельно;
//   - НИКОГДА не бросает исключение наружу — ошибка попадает в поле error
//     результата (или в пустой список для list_volumes), и пишется в лог.

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <nlohmann/json.hpp>
#include "ScanTypes.h"
#include "ScanConfig.h"
#include "Platform.h"
#include "CommandRunner.h"
#include "VolumeProber.h"
#include "ResidueProber.h"
#include "HiddenScanner.h"
#include "BrowserProfiles.h"
#include "LogMiner.h"
#include "ReportSigner.h"
#include "ReportService.h"
#include "WipeSimulator.h"

class ScanService {
public:
    // signer должен быть инициализирован до generate_report/verify_report
    ScanService(ScanConfig cfg,
                PlatformContext ctx,
                std::unique_ptr<CommandRunner> runner,
                const SigningService& signer);

    // Пробы хранят ссылки на m_cfg, m_ctx и *m_runner
    ScanService(const ScanService&) = delete;
    ScanService& operator=(const ScanService&) = delete;
    ScanService(ScanService&&) = delete;
    ScanService& operator=(ScanService&&) = delete;

    std::vector<Volume> list_volumes() const;
    HiddenScanResult scan_hidden(const std::optional<std::string>& path = std::nullopt) const;
    PreviewResult preview_artifact(const std::string& path) const;
    BrowserProfilesResult scan_browser_profiles() const;
    EventLogsResult scan_event_logs() const;

    // Сам опрашивает тома и источники остаточных данных
    RiskAssessment compute_risk() const;
    // Тома уже получены (полное сканирование не опрашивает их дважды)
    RiskAssessment compute_risk(const std::vector<Volume>& volumes) const;

    ReportResult generate_report(const nlohmann::json& scan_data) const;
    VerifyResult verify_report(const std::string& path) const;

    ProgressEvent simulate_wipe(const std::string& target, ProgressStream& stream) const;

    // Все пробы параллельно -> scanData для отчёта:
    // {volumes, hiddenFiles, browserProfiles, eventLogs, risk}
    nlohmann::json collect_scan_data() const;

    const ScanConfig& config() const { return m_cfg; }

private:
    ScanConfig m_cfg;
    PlatformContext m_ctx;
    std::unique_ptr<CommandRunner> m_runner;

    VolumeProber m_volumes;
    ResidueProber m_residue;
    HiddenScanner m_hidden;
    BrowserProfileDetector m_browsers;
    LogMiner m_logs;
    ReportService m_reports;
};
