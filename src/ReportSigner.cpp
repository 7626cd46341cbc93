#include "ReportSigner.h"
#include "TextUtil.h"
#include "Logger.h"
#include <vector>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

void EvpPkeyDeleter::operator()(evp_pkey_st* p) const noexcept {
    EVP_PKEY_free(p);
}

namespace {

using BioPtr = std::unique_ptr<BIO, decltype(&BIO_free)>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;

std::string openssl_error() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "unknown OpenSSL error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

void openssl_check(int ok, const char* what) {
    if (ok != 1) throw SigningError(std::string(what) + ": " + openssl_error());
}

std::string public_pem_of(EVP_PKEY* key) {
    BioPtr bio(BIO_new(BIO_s_mem()), &BIO_free);
    if (!bio) throw SigningError("BIO_new failed");
    openssl_check(PEM_write_bio_PUBKEY(bio.get(), key), "PEM_write_bio_PUBKEY");
    char* data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, static_cast<size_t>(len));
}

EVP_PKEY* generate_rsa_key() {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr), &EVP_PKEY_CTX_free);
    if (!ctx) throw SigningError("EVP_PKEY_CTX_new_id failed");
    openssl_check(EVP_PKEY_keygen_init(ctx.get()), "EVP_PKEY_keygen_init");
    if (EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), SIGNING_KEY_BITS) <= 0)
        throw SigningError("EVP_PKEY_CTX_set_rsa_keygen_bits: " + openssl_error());
    EVP_PKEY* key = nullptr;
    openssl_check(EVP_PKEY_keygen(ctx.get(), &key), "EVP_PKEY_keygen");
    return key;
}

EVP_PKEY* load_private_key(const std::string& path) {
    BioPtr bio(BIO_new_file(path.c_str(), "r"), &BIO_free);
    if (!bio) throw SigningError("Cannot open signing key " + path);
    EVP_PKEY* key = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
    if (!key) throw SigningError("Cannot parse signing key " + path + ": " + openssl_error());
    return key;
}

} // namespace

std::string canonicalize(const nlohmann::json& payload) {
    return payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string base64_encode(const std::string& bytes) {
    if (bytes.empty()) return "";
    std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            reinterpret_cast<const unsigned char*>(bytes.data()),
                            static_cast<int>(bytes.size()));
    out.resize(static_cast<size_t>(n));
    return out;
}

std::string base64_decode(const std::string& text) {
    std::string in = trim(text);
    if (in.empty()) return "";
    if (in.size() % 4 != 0) throw SigningError("Invalid base64 length");

    std::string out(in.size() / 4 * 3, '\0');
    int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            reinterpret_cast<const unsigned char*>(in.data()),
                            static_cast<int>(in.size()));
    if (n < 0) throw SigningError("Invalid base64 data");

    // EVP_DecodeBlock не учитывает '=': дописанные нули отрезаем сами
    size_t padding = 0;
    if (in[in.size() - 1] == '=') ++padding;
    if (in[in.size() - 2] == '=') ++padding;
    out.resize(static_cast<size_t>(n) - padding);
    return out;
}

SigningService::SigningService() = default;

SigningService::~SigningService() {
    shutdown();
}

void SigningService::init(const std::string& private_key_path) {
    std::unique_ptr<evp_pkey_st, EvpPkeyDeleter> key(
        private_key_path.empty() ? generate_rsa_key() : load_private_key(private_key_path));
    std::string pem = public_pem_of(key.get());

    m_key = std::move(key);
    m_public_pem = std::move(pem);
    Logger::info(private_key_path.empty()
                 ? "Signing key generated (RSA-" + std::to_string(SIGNING_KEY_BITS) + ", process lifetime)"
                 : "Signing key loaded from " + private_key_path);
}

void SigningService::shutdown() {
    m_key.reset();
    m_public_pem.clear();
}

std::string SigningService::sign(const std::string& data) const {
    if (!m_key) throw SigningError("Signing service is not initialized");

    MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) throw SigningError("EVP_MD_CTX_new failed");
    openssl_check(EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, m_key.get()),
                  "EVP_DigestSignInit");

    const auto* in = reinterpret_cast<const unsigned char*>(data.data());
    size_t sig_len = 0;
    openssl_check(EVP_DigestSign(ctx.get(), nullptr, &sig_len, in, data.size()), "EVP_DigestSign");
    std::vector<unsigned char> sig(sig_len);
    openssl_check(EVP_DigestSign(ctx.get(), sig.data(), &sig_len, in, data.size()), "EVP_DigestSign");

    return base64_encode(std::string(reinterpret_cast<const char*>(sig.data()), sig_len));
}

bool SigningService::verify(const std::string& data,
                            const std::string& signature_b64,
                            const std::string& public_key_pem) {
    BioPtr bio(BIO_new_mem_buf(public_key_pem.data(), static_cast<int>(public_key_pem.size())), &BIO_free);
    if (!bio) throw SigningError("BIO_new_mem_buf failed");
    std::unique_ptr<evp_pkey_st, EvpPkeyDeleter> key(
        PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
    if (!key) throw SigningError("Cannot parse public key: " + openssl_error());

    std::string sig = base64_decode(signature_b64);
    if (sig.empty()) return false;

    MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) throw SigningError("EVP_MD_CTX_new failed");
    openssl_check(EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key.get()),
                  "EVP_DigestVerifyInit");

    int rc = EVP_DigestVerify(ctx.get(),
                              reinterpret_cast<const unsigned char*>(sig.data()), sig.size(),
                              reinterpret_cast<const unsigned char*>(data.data()), data.size());
    // 0: подпись не сошлась; отрицательное значение: подпись не разобрана
    ERR_clear_error();
    return rc == 1;
}

bool SigningService::is_active_key(const std::string& public_key_pem) const {
    if (m_public_pem.empty()) return false;
    return trim(public_key_pem) == trim(m_public_pem);
}
