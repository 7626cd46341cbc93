#include "ScanService.h"
#include "ArtifactPreview.h"
#include "RiskScorer.h"
#include "JsonModel.h"
#include "TimeUtil.h"
#include "Logger.h"
#include <future>

ScanService::ScanService(ScanConfig cfg,
                         PlatformContext ctx,
                         std::unique_ptr<CommandRunner> runner,
                         const SigningService& signer)
    : m_cfg(std::move(cfg)),
      m_ctx(std::move(ctx)),
      m_runner(runner ? std::move(runner) : CommandRunner::create()),
      m_volumes(m_ctx, *m_runner, m_cfg),
      m_residue(m_ctx, *m_runner, m_cfg),
      m_hidden(m_ctx, *m_runner, m_cfg),
      m_browsers(m_ctx),
      m_logs(m_ctx, *m_runner, m_cfg),
      m_reports(signer, m_cfg.reports_dir) {}

std::vector<Volume> ScanService::list_volumes() const {
    try {
        return m_volumes.list_volumes();
    }
    catch (const std::exception& e) {
        Logger::error(std::string("list_volumes: ") + e.what());
        return {};
    }
}

HiddenScanResult ScanService::scan_hidden(const std::optional<std::string>& path) const {
    try {
        return m_hidden.scan(path);
    }
    catch (const std::exception& e) {
        Logger::error(std::string("scan_hidden: ") + e.what());
        HiddenScanResult r;
        r.scan_root = path.value_or(m_ctx.home.string());
        r.timestamp = iso8601_now();
        r.error = e.what();
        return r;
    }
}

PreviewResult ScanService::preview_artifact(const std::string& path) const {
    try {
        return ::preview_artifact(path);
    }
    catch (const std::exception& e) {
        Logger::error(std::string("preview_artifact: ") + e.what());
        PreviewResult r;
        r.error = e.what();
        return r;
    }
}

BrowserProfilesResult ScanService::scan_browser_profiles() const {
    try {
        return m_browsers.scan();
    }
    catch (const std::exception& e) {
        Logger::error(std::string("scan_browser_profiles: ") + e.what());
        BrowserProfilesResult r;
        r.error = e.what();
        return r;
    }
}

EventLogsResult ScanService::scan_event_logs() const {
    try {
        return m_logs.scan();
    }
    catch (const std::exception& e) {
        Logger::error(std::string("scan_event_logs: ") + e.what());
        EventLogsResult r;
        r.summary.platform = platform_name(m_ctx.platform);
        r.error = e.what();
        return r;
    }
}

RiskAssessment ScanService::compute_risk() const {
    return compute_risk(list_volumes());
}

RiskAssessment ScanService::compute_risk(const std::vector<Volume>& volumes) const {
    try {
        return assess_risk(volumes, m_residue.probe_swap(), m_residue.probe_snapshots());
    }
    catch (const std::exception& e) {
        Logger::error(std::string("compute_risk: ") + e.what());
        RiskAssessment r;
        r.score = 0;
        r.risk = RiskLevel::UNKNOWN;
        r.error = e.what();
        return r;
    }
}

ReportResult ScanService::generate_report(const nlohmann::json& scan_data) const {
    try {
        return m_reports.generate(scan_data);
    }
    catch (const std::exception& e) {
        Logger::error(std::string("generate_report: ") + e.what());
        ReportResult r;
        r.error = e.what();
        return r;
    }
}

VerifyResult ScanService::verify_report(const std::string& path) const {
    try {
        return m_reports.verify(path);
    }
    catch (const std::exception& e) {
        Logger::error(std::string("verify_report: ") + e.what());
        VerifyResult r;
        r.error = e.what();
        return r;
    }
}

ProgressEvent ScanService::simulate_wipe(const std::string& target, ProgressStream& stream) const {
    try {
        return WipeSimulator().run(target, stream);
    }
    catch (const std::exception& e) {
        Logger::error(std::string("simulate_wipe: ") + e.what());
        return ProgressEvent{};
    }
}

nlohmann::json ScanService::collect_scan_data() const {
    auto volumes_f = std::async(std::launch::async, [this] { return list_volumes(); });
    auto hidden_f = std::async(std::launch::async, [this] { return scan_hidden(); });
    auto browsers_f = std::async(std::launch::async, [this] { return scan_browser_profiles(); });
    auto logs_f = std::async(std::launch::async, [this] { return scan_event_logs(); });

    // Тома сразу идут в оценку риска: без повторного опроса
    std::vector<Volume> volumes = volumes_f.get();
    RiskAssessment risk = compute_risk(volumes);

    nlohmann::json data;
    data["volumes"] = volumes;
    data["hiddenFiles"] = hidden_f.get();
    data["browserProfiles"] = browsers_f.get();
    data["eventLogs"] = logs_f.get();
    data["risk"] = risk;
    return data;
}
