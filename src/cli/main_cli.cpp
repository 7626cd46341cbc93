// privascan — консольный интерфейс к ScanService
//
// Каждая команда печатает результат одной JSON-строкой в stdout
// (с --pretty: с отступами). Журнал работы пишется в logs/.

#include <iostream>
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

#include "ConfigLoader.h"
#include "Logger.h"
#include "Platform.h"
#include "CommandRunner.h"
#include "ReportSigner.h"
#include "ScanService.h"
#include "JsonModel.h"

constexpr const char* DEFAULT_CONFIG_PATH = "privascan.json";

// ---------------------------------------------------------------------------

void print_ui_help() {
    std::cout << "\n"
        << "==================================================================\n"
        << "              PRIVASCAN — local privacy & forensic scanner\n"
        << "==================================================================\n\n"
        << "  privascan <command> [args] [options]\n\n"
        << "COMMANDS:\n"
        << "  volumes                    Storage volumes and encryption status\n"
        << "  hidden [path]              Hidden and sensitive files (default: home)\n"
        << "  preview <path>             First 2048 bytes of a file (binary redacted)\n"
        << "  browsers                   Browser profiles and their data files\n"
        << "  events                     Privacy-relevant event log entries (Windows)\n"
        << "  risk                       Data recoverability risk score\n"
        << "  report                     Full scan, signed report pair in reports dir\n"
        << "  verify <file>              Verify a signed report\n"
        << "  wipe-sim <target>          Secure-wipe progress simulation (deletes nothing)\n\n"
        << "OPTIONS:\n"
        << "  -c, --config <file>        Config file (default: privascan.json)\n"
        << "  --reports-dir <dir>        Override reports directory\n"
        << "  --pretty                   Indented JSON output\n"
        << "==================================================================\n";
}

static void print_json(const nlohmann::json& j, bool pretty) {
    std::cout << j.dump(pretty ? 2 : -1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

// Команды, которым нужен ключ подписи
static bool needs_signer(const std::string& command) {
    return command == "report" || command == "verify";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_ui_help();
        return 0;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        print_ui_help();
        return 0;
    }
    if (command == "--version") {
        std::cout << "PrivaScan " << REPORT_VERSION << "\n";
        return 0;
    }

    std::string config_path = DEFAULT_CONFIG_PATH;
    std::optional<std::string> reports_dir;
    std::optional<std::string> positional;
    bool pretty = false;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        }
        else if (arg == "--reports-dir" && i + 1 < argc) {
            reports_dir = argv[++i];
        }
        else if (arg == "--pretty") {
            pretty = true;
        }
        else if (!positional && arg.rfind("-", 0) != 0) {
            positional = arg;
        }
        else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return 2;
        }
    }

    ScanConfig cfg = ConfigLoader::load(config_path);
    if (reports_dir) cfg.reports_dir = *reports_dir;

    Logger::init(cfg.log_dir);
    Logger::set_stderr_warnings(false);
    Logger::info("PrivaScan started: " + command);

    SigningService signer;
    if (needs_signer(command)) {
        try {
            signer.init(cfg.signing_key_path);
        }
        catch (const std::exception& e) {
            Logger::error(std::string("Signing service init failed: ") + e.what());
            print_json({{"success", false}, {"valid", false}, {"error", e.what()}}, pretty);
            return 1;
        }
    }

    ScanService service(cfg, PlatformContext::current(), CommandRunner::create(), signer);
    int rc = 0;

    if (command == "volumes") {
        print_json(service.list_volumes(), pretty);
    }
    else if (command == "hidden") {
        print_json(service.scan_hidden(positional), pretty);
    }
    else if (command == "preview") {
        if (!positional) { std::cerr << "preview: missing <path>\n"; return 2; }
        PreviewResult r = service.preview_artifact(*positional);
        print_json(r, pretty);
        if (r.error) rc = 1;
    }
    else if (command == "browsers") {
        print_json(service.scan_browser_profiles(), pretty);
    }
    else if (command == "events") {
        EventLogsResult r = service.scan_event_logs();
        print_json(r, pretty);
        if (!r.supported) rc = 1;
    }
    else if (command == "risk") {
        print_json(service.compute_risk(), pretty);
    }
    else if (command == "report") {
        ReportResult r = service.generate_report(service.collect_scan_data());
        print_json(r, pretty);
        if (!r.success) rc = 1;
    }
    else if (command == "verify") {
        if (!positional) { std::cerr << "verify: missing <file>\n"; return 2; }
        VerifyResult r = service.verify_report(*positional);
        print_json(r, pretty);
        if (!r.valid) rc = 1;
    }
    else if (command == "wipe-sim") {
        if (!positional) { std::cerr << "wipe-sim: missing <target>\n"; return 2; }
        ProgressStream stream;
        auto sub = stream.subscribe([](const ProgressEvent& ev) {
            print_json(ev, false);
        });
        service.simulate_wipe(*positional, stream);
        stream.unsubscribe(sub);
    }
    else {
        std::cerr << "Unknown command: " << command << "\n";
        print_ui_help();
        return 2;
    }

    signer.shutdown();
    Logger::info("PrivaScan finished: " + command + " (exit " + std::to_string(rc) + ")");
    return rc;
}
