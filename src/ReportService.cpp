#include "ReportService.h"
#include "TimeUtil.h"
#include "Logger.h"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace fs = std::filesystem;

std::string verification_token(const std::string& report_id, const std::string& signature) {
    return report_id + ":" + signature.substr(0, VERIFICATION_PREFIX_CHARS);
}

ReportService::ReportService(const SigningService& signer,
                             std::string reports_dir,
                             std::unique_ptr<DocumentRenderer> renderer,
                             std::unique_ptr<TokenEncoder> encoder)
    : m_signer(signer),
      m_reports_dir(std::move(reports_dir)),
      m_renderer(std::move(renderer)),
      m_encoder(std::move(encoder)) {
    if (!m_renderer) m_renderer = std::make_unique<TextReportRenderer>();
    if (!m_encoder) m_encoder = std::make_unique<TextTokenEncoder>();
}

nlohmann::json ReportService::sign_payload(const nlohmann::json& scan_data) const {
    boost::uuids::random_generator gen;
    nlohmann::json report;
    report["reportId"] = boost::uuids::to_string(gen());
    report["timestamp"] = iso8601_now();
    report["version"] = REPORT_VERSION;
    report["scanData"] = scan_data;

    // Подписывается payload БЕЗ signature/publicKey
    std::string signature = m_signer.sign(canonicalize(report));
    report["signature"] = signature;
    report["publicKey"] = m_signer.public_key_pem();
    return report;
}

static void remove_quietly(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

void ReportService::persist(const nlohmann::json& report, const std::string& token_image,
                            const std::string& data_path, const std::string& doc_path) const {
    const std::string data_tmp = data_path + ".tmp";
    const std::string doc_tmp = doc_path + ".tmp";

    try {
        {
            std::ofstream f(data_tmp, std::ios::out | std::ios::trunc | std::ios::binary);
            if (!f.is_open()) throw ReportError("Cannot write " + data_tmp);
            f << report.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
            f.flush();
            if (!f) throw ReportError("Failed writing " + data_tmp);
        }
        m_renderer->render(report, token_image, doc_tmp);

        fs::rename(data_tmp, data_path);
        fs::rename(doc_tmp, doc_path);
    }
    catch (const std::exception&) {
        // Пара отчёта либо целиком на диске, либо её нет
        remove_quietly(data_tmp);
        remove_quietly(doc_tmp);
        remove_quietly(data_path);
        remove_quietly(doc_path);
        throw;
    }
}

ReportResult ReportService::generate(const nlohmann::json& scan_data) const {
    ReportResult result;
    try {
        if (!m_signer.ready()) throw SigningError("Signing service is not initialized");

        nlohmann::json report = sign_payload(scan_data);
        const std::string id = report["reportId"].get<std::string>();
        const std::string signature = report["signature"].get<std::string>();
        const std::string token_image = m_encoder->encode(verification_token(id, signature));

        fs::create_directories(m_reports_dir);
        const std::string base = (fs::path(m_reports_dir) / ("scan-report-" + id)).string();
        const std::string data_path = base + ".json";
        const std::string doc_path = base + "." + m_renderer->extension();

        persist(report, token_image, data_path, doc_path);

        result.success = true;
        result.report_id = id;
        result.data_path = data_path;
        result.document_path = doc_path;
        result.signature = signature;
        Logger::info("Report generated: " + data_path);
    }
    catch (const std::exception& e) {
        Logger::error(std::string("Report generation failed: ") + e.what());
        result.success = false;
        result.error = e.what();
    }
    return result;
}

VerifyResult ReportService::verify(const std::string& report_path) const {
    VerifyResult result;
    try {
        std::error_code ec;
        auto size = fs::file_size(report_path, ec);
        if (ec) throw ReportError("Cannot read report " + report_path + ": " + ec.message());
        if (size > MAX_REPORT_FILE_BYTES) throw ReportError("Report file is too large");

        std::ifstream f(report_path, std::ios::binary);
        if (!f.is_open()) throw ReportError("Cannot open report " + report_path);
        std::stringstream buf;
        buf << f.rdbuf();

        nlohmann::json report = nlohmann::json::parse(buf.str());
        if (!report.is_object()) throw ReportError("Report root must be an object");
        if (!report.contains("signature") || !report["signature"].is_string() ||
            !report.contains("publicKey") || !report["publicKey"].is_string()) {
            throw ReportError("Report is not signed");
        }

        const std::string signature = report["signature"].get<std::string>();
        const std::string public_key = report["publicKey"].get<std::string>();
        report.erase("signature");
        report.erase("publicKey");

        if (report.contains("reportId") && report["reportId"].is_string())
            result.report_id = report["reportId"].get<std::string>();
        if (report.contains("timestamp") && report["timestamp"].is_string())
            result.timestamp = report["timestamp"].get<std::string>();

        result.valid = SigningService::verify(canonicalize(report), signature, public_key);
        result.public_key_match = m_signer.is_active_key(public_key);
        Logger::info("Report " + report_path + (result.valid ? " verified" : " failed verification"));
    }
    catch (const std::exception& e) {
        Logger::warn("Report verification failed: " + std::string(e.what()));
        result.valid = false;
        result.error = e.what();
    }
    return result;
}
