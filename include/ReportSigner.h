#pragma once
// ReportSigner.h — подпись отчётов (RSA-2048 + SHA-256, OpenSSL EVP)
//
// Жизненный цикл:
//   SigningService svc;
//   svc.init();            // генерирует пару ключей (или загружает PEM, если путь задан)
//   svc.sign(bytes);       // base64-подпись
//   svc.shutdown();        // закрытый ключ удаляется из памяти
//
// После init() сервис только читается — его можно разделять между потоками.
// Ключ живёт столько же, сколько процесс: отчёты разных запусков проверяются
// по встроенному в отчёт открытому ключу, а не по постоянному ключу.
//
// Каноническая форма: компактный JSON, ключи объектов в лексикографическом
// порядке (nlohmann::json хранит объекты в std::map), битый UTF-8 -> U+FFFD.

#include <string>
#include <memory>
#include <stdexcept>
#include <nlohmann/json.hpp>

struct evp_pkey_st;  // EVP_PKEY из OpenSSL

struct EvpPkeyDeleter { void operator()(evp_pkey_st* p) const noexcept; };

class SigningError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

constexpr int SIGNING_KEY_BITS = 2048;

// Байты, над которыми считается подпись
std::string canonicalize(const nlohmann::json& payload);

std::string base64_encode(const std::string& bytes);
// Бросает SigningError на невалидном base64
std::string base64_decode(const std::string& text);

class SigningService {
public:
    SigningService();
    ~SigningService();
    SigningService(const SigningService&) = delete;
    SigningService& operator=(const SigningService&) = delete;

    // private_key_path пуст — новая пара ключей. Повторный init() заменяет ключ
    void init(const std::string& private_key_path = "");
    void shutdown();
    bool ready() const { return static_cast<bool>(m_key); }

    // base64(RSA-SHA256(data)). Бросает SigningError, если сервис не инициализирован
    std::string sign(const std::string& data) const;

    // PEM (SubjectPublicKeyInfo) активного ключа
    const std::string& public_key_pem() const { return m_public_pem; }

    // Проверка подписи произвольным открытым ключом.
    // false — подпись не сходится; SigningError — ключ или подпись не разбираются
    static bool verify(const std::string& data,
                       const std::string& signature_b64,
                       const std::string& public_key_pem);

    // Совпадает ли PEM с ключом этого сервиса (без учёта концевых пробелов)
    bool is_active_key(const std::string& public_key_pem) const;

private:
    std::unique_ptr<evp_pkey_st, EvpPkeyDeleter> m_key;
    std::string m_public_pem;
};
