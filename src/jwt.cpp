#include "jwt.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace octo {

namespace {

std::shared_ptr<spdlog::logger> auth_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("auth");
  }();
  return logger;
}

struct BioDeleter {
  void operator()(BIO *bio) const { BIO_free(bio); }
};
struct PkeyDeleter {
  void operator()(EVP_PKEY *key) const { EVP_PKEY_free(key); }
};
struct MdCtxDeleter {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

/// Build an AuthError carrying the most recent OpenSSL error.
AuthError openssl_error(const std::string &what) {
  char err_buf[256];
  err_buf[0] = '\0';
  unsigned long code = ERR_get_error();
  if (code != 0) {
    ERR_error_string_n(code, err_buf, sizeof(err_buf));
  }
  ERR_clear_error();
  std::string message = what;
  if (err_buf[0] != '\0') {
    message += ": ";
    message += err_buf;
  }
  return AuthError(message);
}

std::string sign_rs256(const std::string &signing_input,
                       const std::string &private_key_pem) {
  std::unique_ptr<BIO, BioDeleter> bio(BIO_new_mem_buf(
      private_key_pem.data(), static_cast<int>(private_key_pem.size())));
  if (!bio) {
    throw openssl_error("Failed to allocate key buffer");
  }
  std::unique_ptr<EVP_PKEY, PkeyDeleter> key(
      PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
  if (!key) {
    throw openssl_error("Failed to parse GitHub App private key");
  }
  if (EVP_PKEY_base_id(key.get()) != EVP_PKEY_RSA) {
    throw AuthError("GitHub App private key is not an RSA key");
  }
  std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw openssl_error("Failed to create signing context");
  }
  if (EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                         key.get()) != 1) {
    throw openssl_error("Failed to initialise RS256 signing");
  }
  if (EVP_DigestSignUpdate(ctx.get(), signing_input.data(),
                           signing_input.size()) != 1) {
    throw openssl_error("Failed to hash JWT signing input");
  }
  std::size_t sig_len = 0;
  if (EVP_DigestSignFinal(ctx.get(), nullptr, &sig_len) != 1) {
    throw openssl_error("Failed to size JWT signature");
  }
  std::vector<unsigned char> signature(sig_len);
  if (EVP_DigestSignFinal(ctx.get(), signature.data(), &sig_len) != 1) {
    throw openssl_error("Failed to sign JWT");
  }
  return std::string(reinterpret_cast<const char *>(signature.data()), sig_len);
}

} // namespace

std::string base64_encode(const std::string &data) {
  if (data.empty()) {
    return {};
  }
  std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
  int written = EVP_EncodeBlock(
      out.data(), reinterpret_cast<const unsigned char *>(data.data()),
      static_cast<int>(data.size()));
  return std::string(reinterpret_cast<const char *>(out.data()),
                     static_cast<std::size_t>(written));
}

std::string base64url_encode(const std::string &data) {
  std::string encoded = base64_encode(data);
  for (char &c : encoded) {
    if (c == '+') {
      c = '-';
    } else if (c == '/') {
      c = '_';
    }
  }
  while (!encoded.empty() && encoded.back() == '=') {
    encoded.pop_back();
  }
  return encoded;
}

std::string create_app_jwt(const std::string &app_id,
                           const std::string &private_key_pem,
                           std::chrono::system_clock::time_point now) {
  if (app_id.empty()) {
    throw AuthError("GitHub App id must not be empty");
  }
  const auto epoch = std::chrono::duration_cast<std::chrono::seconds>(
                         now.time_since_epoch())
                         .count();
  nlohmann::json header{{"alg", "RS256"}, {"typ", "JWT"}};
  nlohmann::json claims{{"iat", epoch - kJwtBackdate.count()},
                        {"exp", epoch + kJwtValidity.count()},
                        {"iss", app_id}};
  std::string signing_input =
      base64url_encode(header.dump()) + "." + base64url_encode(claims.dump());
  std::string signature = sign_rs256(signing_input, private_key_pem);
  auth_log()->debug("Minted app JWT for app {} (exp {})", app_id,
                    epoch + kJwtValidity.count());
  return signing_input + "." + base64url_encode(signature);
}

} // namespace octo
