#pragma once
// ReportWriter.h — представление подписанного отчёта для человека
//
// DocumentRenderer — "отрисовать структурированные данные отчёта в документ".
// TokenEncoder     — "закодировать строку в сканируемое изображение".
// PDF и QR в ядро не входят; по умолчанию используются текстовые реализации.
// Другие реализации подставляются в ReportService через конструктор.

#include <string>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <nlohmann/json.hpp>

class ReportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class TokenEncoder {
public:
    virtual ~TokenEncoder() = default;
    // Изображение (или его текстовое представление), встраиваемое в документ
    virtual std::string encode(const std::string& token) const = 0;
};

class DocumentRenderer {
public:
    virtual ~DocumentRenderer() = default;
    // Расширение файла документа без точки
    virtual std::string extension() const = 0;
    // Бросает ReportError, если файл не записан
    virtual void render(const nlohmann::json& report,
                        const std::string& token_image,
                        const std::string& path) const = 0;
};

class TextTokenEncoder : public TokenEncoder {
public:
    std::string encode(const std::string& token) const override {
        std::string border(token.size() + 4, '#');
        return border + "\n# " + token + " #\n" + border;
    }
};

class TextReportRenderer : public DocumentRenderer {
public:
    std::string extension() const override { return "txt"; }

    void render(const nlohmann::json& report,
                const std::string& token_image,
                const std::string& path) const override
    {
        std::ofstream f(path, std::ios::out | std::ios::trunc);
        if (!f.is_open()) throw ReportError("Cannot write report document " + path);

        const nlohmann::json empty = nlohmann::json::object();
        const auto& data = report.contains("scanData") ? report["scanData"] : empty;

        f << "--- ОТЧЁТ PRIVASCAN ---\n";
        f << "ID:      " << report.value("reportId", "") << "\n";
        f << "Время:   " << report.value("timestamp", "") << "\n";
        f << "Версия:  " << report.value("version", "") << "\n";
        f << "-----------------------\n";

        if (data.contains("volumes") && data["volumes"].is_array()) {
            f << "\nТома:\n";
            f << std::left << std::setw(12) << "Том" << " | " << std::setw(10) << "Всего GB"
              << " | " << std::setw(8) << "Занято%" << " | " << "Шифрование\n";
            for (const auto& v : data["volumes"]) {
                f << std::left << std::setw(12) << v.value("identifier", "")
                  << " | " << std::setw(10) << v.value("totalGB", "")
                  << " | " << std::setw(8) << v.value("usagePercent", "")
                  << " | " << (v.value("encrypted", false) ? v.value("encryptionMechanism", "yes") : "нет")
                  << "\n";
            }
        }

        if (data.contains("risk") && data["risk"].is_object()) {
            const auto& r = data["risk"];
            f << "\nРиск восстановления данных: " << r.value("risk", "UNKNOWN")
              << " (" << r.value("score", 0) << "/100)\n";
        }

        if (data.contains("hiddenFiles") && data["hiddenFiles"].is_object()) {
            const auto& h = data["hiddenFiles"];
            f << "\nСкрытые файлы: " << h.value("totalDiscovered", 0) << " найдено, "
              << (h.contains("artifacts") ? h["artifacts"].size() : 0) << " в отчёте\n";
        }

        if (data.contains("browserProfiles") && data["browserProfiles"].is_object()) {
            const auto& b = data["browserProfiles"];
            f << "\nПрофили браузеров: " << b.value("totalFound", 0) << "\n";
            if (b.contains("profiles")) {
                for (const auto& p : b["profiles"]) {
                    f << "  " << p.value("browserFamily", "") << " / " << p.value("profileName", "")
                      << " (" << (p.contains("artifacts") ? p["artifacts"].size() : 0) << " файлов)\n";
                }
            }
        }

        if (data.contains("eventLogs") && data["eventLogs"].is_object()) {
            const auto& e = data["eventLogs"];
            f << "\nСобытия журналов: " << e.value("totalEntries", 0) << "\n";
        }

        f << "\n-----------------------\n";
        f << "Подпись (RSA-SHA256, base64):\n" << report.value("signature", "") << "\n\n";
        f << "Код проверки:\n" << token_image << "\n";

        f.flush();
        if (!f) throw ReportError("Failed writing report document " + path);
    }
};
