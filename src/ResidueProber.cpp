#include "ResidueProber.h"
#include "ToolParsers.h"
#include "TextUtil.h"
#include "Logger.h"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

ResidueProber::ResidueProber(const PlatformContext& ctx, CommandRunner& runner, const ScanConfig& cfg)
    : m_ctx(ctx), m_runner(runner), m_cfg(cfg) {}

SwapFactor ResidueProber::probe_swap() const {
    SwapFactor swap;
    std::error_code ec;

    switch (m_ctx.platform) {
    case Platform::WINDOWS: {
        for (const char* name : {"pagefile.sys", "swapfile.sys"}) {
            fs::path p = fs::path(m_ctx.system_drive + "\\") / name;
            if (fs::exists(p, ec)) {
                swap.present = true;
                swap.location = p.string();
                break;
            }
        }
        break;
    }
    case Platform::LINUX: {
        std::ifstream f(m_cfg.swap_table);
        if (!f.is_open()) {
            Logger::info("Swap table not readable: " + m_cfg.swap_table);
            break;
        }
        std::stringstream buf;
        buf << f.rdbuf();
        auto swaps = parse_proc_swaps(buf.str());
        if (!swaps.empty()) {
            swap.present = true;
            swap.location = swaps.front();
        }
        break;
    }
    case Platform::MACOS: {
        fs::path vm_dir = "/private/var/vm";
        for (fs::directory_iterator it(vm_dir, fs::directory_options::skip_permission_denied, ec);
             !ec && it != fs::directory_iterator(); it.increment(ec)) {
            if (starts_with(it->path().filename().string(), "swapfile")) {
                swap.present = true;
                swap.location = it->path().string();
                break;
            }
        }
        break;
    }
    default:
        break;
    }
    return swap;
}

SnapshotFactor ResidueProber::probe_snapshots() const {
    SnapshotFactor snap;
    const auto timeout = std::chrono::seconds(m_cfg.command_timeout_seconds);

    switch (m_ctx.platform) {
    case Platform::WINDOWS: {
        auto res = m_runner.run("vssadmin", {"list", "shadows"}, timeout);
        if (res.launched && !res.timed_out) {
            // vssadmin exits non-zero when there are no shadows; the count is still valid
            snap.count = parse_vssadmin_shadow_count(res.output);
            snap.source = "Volume Shadow Copy";
        }
        break;
    }
    case Platform::LINUX: {
        for (const auto& dir : m_cfg.snapshot_dirs) {
            std::error_code ec;
            int found = 0;
            for (fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
                 !ec && it != fs::directory_iterator(); it.increment(ec)) {
                ++found;
            }
            if (found > 0) {
                snap.count += found;
                if (!snap.source.empty()) snap.source += ", ";
                snap.source += dir;
            }
        }
        break;
    }
    case Platform::MACOS: {
        auto res = m_runner.run("tmutil", {"listlocalsnapshots", "/"}, timeout);
        if (res.ok()) {
            snap.count = parse_tmutil_snapshot_count(res.output);
            snap.source = "Time Machine local snapshots";
        }
        break;
    }
    default:
        break;
    }

    snap.present = snap.count > 0;
    return snap;
}
