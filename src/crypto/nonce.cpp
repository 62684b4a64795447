#include <a402/common/critical.hpp>
#include <a402/crypto/nonce.hpp>

#include <openssl/err.h>
#include <openssl/rand.h>

#include <spdlog/spdlog.h>

#include <array>

namespace a402::crypto {

std::optional<a402::schema::hash32_t> try_make_payment_nonce() {
  auto nonce = a402::schema::hash32_t{};
  if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
    auto reason = std::array<char, 256>{};
    ERR_error_string_n(ERR_get_error(), reason.data(), reason.size());
    spdlog::error("RAND_bytes failed: {}", reason.data());
    return std::nullopt;
  }
  return nonce;
}

a402::schema::hash32_t make_payment_nonce() {
  auto nonce = try_make_payment_nonce();
  if (!nonce.has_value()) {
    a402::common::critical("unable to generate a payment nonce");
  }
  return *nonce;
}

}  // namespace a402::crypto
