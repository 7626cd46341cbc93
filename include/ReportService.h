#pragma once
// ReportService.h — создание и проверка подписанных отчётов
//
// Состояния отчёта: Unsigned -> Signed -> {Verified | Invalid}
//
// generate():
//   1. reportId (UUID v4) + timestamp (ISO-8601 UTC) + version
//   2. payload = {reportId, timestamp, version, scanData}
//   3. signature = RSA-SHA256(canonicalize(payload)), base64
//   4. Токен проверки "<reportId>:<первые 16 символов подписи>" -> TokenEncoder
//   5. <reports_dir>/scan-report-<id>.json и scan-report-<id>.<ext> пишутся
//      во временные файлы и переименовываются. Не удалось одно — удаляются оба.
//
// verify():
//   Убираем signature/publicKey, канонизируем заново, проверяем встроенным ключом.
//   publicKeyMatch — совпадает ли встроенный ключ с активным ключом сервиса.

#include <string>
#include <memory>
#include <cstddef>
#include <nlohmann/json.hpp>
#include "ScanTypes.h"
#include "ReportSigner.h"
#include "ReportWriter.h"

inline const std::string REPORT_VERSION = "1.0.0";
constexpr size_t VERIFICATION_PREFIX_CHARS = 16;
constexpr size_t MAX_REPORT_FILE_BYTES = 64 * 1024 * 1024;

// "<reportId>:<первые 16 символов подписи>"
std::string verification_token(const std::string& report_id, const std::string& signature);

class ReportService {
public:
    // Без renderer/encoder используются TextReportRenderer и TextTokenEncoder
    ReportService(const SigningService& signer,
                  std::string reports_dir,
                  std::unique_ptr<DocumentRenderer> renderer = nullptr,
                  std::unique_ptr<TokenEncoder> encoder = nullptr);

    ReportResult generate(const nlohmann::json& scan_data) const;
    VerifyResult verify(const std::string& report_path) const;

    const std::string& reports_dir() const { return m_reports_dir; }

private:
    const SigningService& m_signer;
    std::string m_reports_dir;
    std::unique_ptr<DocumentRenderer> m_renderer;
    std::unique_ptr<TokenEncoder> m_encoder;

    nlohmann::json sign_payload(const nlohmann::json& scan_data) const;
    void persist(const nlohmann::json& report, const std::string& token_image,
                 const std::string& data_path, const std::string& doc_path) const;
};
