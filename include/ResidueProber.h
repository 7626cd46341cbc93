#pragma once
// ResidueProber.h — источники "остаточных" данных для оценки риска:
// файл подкачки и снапшоты файловой системы.
// Обе пробы терпимы к ошибкам: недоступный источник = "не найдено".

#include "ScanTypes.h"
#include "ScanConfig.h"
#include "Platform.h"
#include "CommandRunner.h"

class ResidueProber {
public:
    ResidueProber(const PlatformContext& ctx, CommandRunner& runner, const ScanConfig& cfg);

    SwapFactor probe_swap() const;
    SnapshotFactor probe_snapshots() const;

private:
    PlatformContext m_ctx;
    CommandRunner& m_runner;
    const ScanConfig& m_cfg;
};
