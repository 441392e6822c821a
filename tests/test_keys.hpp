#ifndef OCTOCLIENT_TESTS_TEST_KEYS_HPP
#define OCTOCLIENT_TESTS_TEST_KEYS_HPP

#include <memory>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <stdexcept>
#include <string>

namespace octo::testing {

/// PEM encoded RSA key generated once per test run.
inline const std::string &test_private_key() {
  static const std::string pem = [] {
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(
        EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr), EVP_PKEY_CTX_free);
    EVP_PKEY *raw = nullptr;
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1 ||
        EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), 2048) != 1 ||
        EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
      throw std::runtime_error("RSA key generation failed");
    }
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key(raw, EVP_PKEY_free);
    std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new(BIO_s_mem()),
                                                  BIO_free);
    if (!bio || PEM_write_bio_PrivateKey(bio.get(), key.get(), nullptr,
                                         nullptr, 0, nullptr, nullptr) != 1) {
      throw std::runtime_error("PEM encoding failed");
    }
    char *data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, static_cast<std::size_t>(len));
  }();
  return pem;
}

} // namespace octo::testing

#endif // OCTOCLIENT_TESTS_TEST_KEYS_HPP
