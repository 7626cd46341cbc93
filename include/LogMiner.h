#pragma once
// LogMiner.h — поиск событий, важных для приватности, в журналах Windows
//
// Шаги:
// 1. wevtutil el — список каналов (первые MAX_LOG_CHANNELS попадают в log_sources)
// 2. wevtutil qe <канал> /q:<XPath> /c:100 /rd:true /f:text — для Security, System, Application
// 3. Разбор текстовых блоков (parse_wevtutil_events в ToolParsers.h)
// 4. Классификация по Event ID:
//      High   — 4624, 4625, 4648, 4720, 4726, 1102, 104
//      Medium — 4798, 4799, 1074, 6005, 6006
//      Low    — всё остальное
//
// Вне Windows возвращается supported=false с текстом ошибки (не исключение).

#include <string>
#include <vector>
#include "ScanTypes.h"
#include "ScanConfig.h"
#include "Platform.h"
#include "CommandRunner.h"

// Чистая функция: одинаковый event_id -> одинаковый риск
PrivacyRisk classify_event_risk(const std::string& event_id);

// Каналы, которые запрашиваются всегда (если существуют)
const std::vector<std::string>& priority_channels();

// XPath-фильтр: только события из обоих белых списков
std::string privacy_event_xpath();

class LogMiner {
public:
    LogMiner(const PlatformContext& ctx, CommandRunner& runner, const ScanConfig& cfg);

    EventLogsResult scan() const;

private:
    PlatformContext m_ctx;
    CommandRunner& m_runner;
    const ScanConfig& m_cfg;

    std::vector<std::string> enumerate_channels(EventScanSummary& summary) const;
    bool query_channel(const std::string& channel, std::vector<EventLogEntry>& out) const;
};
