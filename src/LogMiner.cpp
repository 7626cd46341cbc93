#include "LogMiner.h"
#include "ToolParsers.h"
#include "Logger.h"
#include <algorithm>
#include <set>

static const std::set<std::string> HIGH_RISK_EVENTS = {
    "4624",  // Успешный вход
    "4625",  // Неудачный вход
    "4648",  // Вход с явными учётными данными
    "4720",  // Создана учётная запись
    "4726",  // Удалена учётная запись
    "1102",  // Очищен журнал безопасности
    "104",   // Очищен системный журнал
};

static const std::set<std::string> MEDIUM_RISK_EVENTS = {
    "4798",  // Перечисление локальных групп пользователя
    "4799",  // Перечисление членов группы
    "1074",  // Выключение/перезагрузка инициирована процессом
    "6005",  // Запуск службы журнала
    "6006",  // Остановка службы журнала
};

PrivacyRisk classify_event_risk(const std::string& event_id) {
    if (HIGH_RISK_EVENTS.count(event_id)) return PrivacyRisk::HIGH;
    if (MEDIUM_RISK_EVENTS.count(event_id)) return PrivacyRisk::MEDIUM;
    return PrivacyRisk::LOW;
}

PrivacyRisk EventLogEntry::privacy_risk() const {
    return classify_event_risk(event_id);
}

const std::vector<std::string>& priority_channels() {
    static const std::vector<std::string> channels = {"Security", "System", "Application"};
    return channels;
}

std::string privacy_event_xpath() {
    std::string ids;
    auto append = [&ids](const std::set<std::string>& set) {
        for (const auto& id : set) {
            if (!ids.empty()) ids += " or ";
            ids += "EventID=" + id;
        }
    };
    append(HIGH_RISK_EVENTS);
    append(MEDIUM_RISK_EVENTS);
    return "*[System[(" + ids + ")]]";
}

LogMiner::LogMiner(const PlatformContext& ctx, CommandRunner& runner, const ScanConfig& cfg)
    : m_ctx(ctx), m_runner(runner), m_cfg(cfg) {}

std::vector<std::string> LogMiner::enumerate_channels(EventScanSummary& summary) const {
    auto res = m_runner.run("wevtutil", {"el"}, std::chrono::seconds(m_cfg.command_timeout_seconds));
    if (!res.ok()) {
        Logger::warn("wevtutil el failed" + std::string(res.timed_out ? " (timeout)" : ""));
        return {};
    }
    auto channels = parse_line_list(res.output);
    summary.channels_available = channels.size();
    if (channels.size() > MAX_LOG_CHANNELS) channels.resize(MAX_LOG_CHANNELS);
    return channels;
}

bool LogMiner::query_channel(const std::string& channel, std::vector<EventLogEntry>& out) const {
    auto res = m_runner.run("wevtutil",
                            {"qe", channel,
                             "/q:" + privacy_event_xpath(),
                             "/c:" + std::to_string(MAX_RAW_EVENTS),
                             "/rd:true", "/f:text"},
                            std::chrono::seconds(m_cfg.event_log_timeout_seconds));
    if (!res.ok()) {
        // Security без прав администратора: обычная ситуация
        Logger::warn("Event channel " + channel + " not readable"
                     + (res.timed_out ? " (timeout)" : ", exit code " + std::to_string(res.exit_code)));
        return false;
    }

    auto entries = parse_wevtutil_events(res.output, channel);
    if (entries.size() > MAX_EVENTS_PER_CHANNEL) entries.resize(MAX_EVENTS_PER_CHANNEL);
    for (auto& e : entries) out.push_back(std::move(e));
    return true;
}

EventLogsResult LogMiner::scan() const {
    EventLogsResult result;
    result.summary.platform = platform_name(m_ctx.platform);

    if (m_ctx.platform != Platform::WINDOWS) {
        result.supported = false;
        result.error = "Event log mining is only supported on Windows (platform: "
                     + result.summary.platform + ")";
        return result;
    }

    result.log_sources = enumerate_channels(result.summary);

    for (const auto& channel : priority_channels()) {
        ++result.summary.channels_queried;
        if (!query_channel(channel, result.logs)) ++result.summary.channels_failed;
    }

    for (const auto& entry : result.logs) {
        switch (entry.privacy_risk()) {
        case PrivacyRisk::HIGH:   ++result.summary.high_risk; break;
        case PrivacyRisk::MEDIUM: ++result.summary.medium_risk; break;
        case PrivacyRisk::LOW:    ++result.summary.low_risk; break;
        }
    }
    result.total_entries = result.logs.size();

    Logger::info("Event logs: " + std::to_string(result.total_entries) + " entries from "
                 + std::to_string(result.summary.channels_queried - result.summary.channels_failed)
                 + " channels");
    return result;
}
