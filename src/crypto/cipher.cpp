#include <confide/common/critical.hpp>
#include <confide/crypto/cipher.hpp>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <memory>

namespace confide::crypto {

namespace {

using evp_cipher_ctx_ptr =
    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

evp_cipher_ctx_ptr make_cipher_context() {
  auto ctx = evp_cipher_ctx_ptr{EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free};
  if (!ctx) {
    confide::common::critical("EVP_CIPHER_CTX_new failed");
  }
  return ctx;
}

}  // namespace

confide::schema::bytes_t random_bytes(const std::size_t size) {
  auto out = confide::schema::bytes_t(size);
  if (size > 0 && RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    confide::common::critical("RAND_bytes failed");
  }
  return out;
}

confide::schema::hash32_t random_id() {
  return confide::schema::make_hash32(random_bytes(32));
}

symmetric_key_t random_key() {
  auto bytes = random_bytes(kKeySize);
  auto key = symmetric_key_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(key));
  OPENSSL_cleanse(bytes.data(), bytes.size());
  return key;
}

std::optional<symmetric_key_t> try_make_key(const std::string_view hex) {
  auto decoded = confide::schema::try_from_hex(hex);
  if (!decoded || decoded->size() != kKeySize) {
    return std::nullopt;
  }
  auto key = symmetric_key_t{};
  std::copy(std::begin(*decoded), std::end(*decoded), std::begin(key));
  OPENSSL_cleanse(decoded->data(), decoded->size());
  return key;
}

confide::schema::bytes_t seal(const symmetric_key_t& key,
                              const confide::schema::bytes_view_t& plaintext,
                              const confide::schema::bytes_view_t& aad) {
  auto iv = random_bytes(kIvSize);
  auto ctx = make_cipher_context();

  auto out = confide::schema::bytes_t(kIvSize + plaintext.size() + kTagSize);
  std::copy(std::begin(iv), std::end(iv), std::begin(out));

  auto length = 0;
  auto ok = EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr,
                               nullptr) == 1 &&
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                                static_cast<int>(kIvSize), nullptr) == 1 &&
            EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(),
                               iv.data()) == 1;
  if (ok && !aad.empty()) {
    ok = EVP_EncryptUpdate(ctx.get(), nullptr, &length, aad.data(),
                           static_cast<int>(aad.size())) == 1;
  }
  auto written = 0;
  if (ok && !plaintext.empty()) {
    ok = EVP_EncryptUpdate(ctx.get(), out.data() + kIvSize, &length,
                           plaintext.data(),
                           static_cast<int>(plaintext.size())) == 1;
    written = length;
  }
  if (ok) {
    ok = EVP_EncryptFinal_ex(ctx.get(), out.data() + kIvSize + written,
                             &length) == 1;
  }
  if (ok) {
    ok = EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                             static_cast<int>(kTagSize),
                             out.data() + kIvSize + plaintext.size()) == 1;
  }
  if (!ok) {
    confide::common::critical("AES-256-GCM encryption failed");
  }
  return out;
}

confide::schema::bytes_t open(const symmetric_key_t& key,
                              const confide::schema::bytes_view_t& sealed,
                              const confide::schema::bytes_view_t& aad) {
  if (sealed.size() < kIvSize + kTagSize) {
    throw decryption_error{"sealed payload is truncated"};
  }
  auto body_size = sealed.size() - kIvSize - kTagSize;
  auto iv = sealed.subspan(0, kIvSize);
  auto body = sealed.subspan(kIvSize, body_size);
  auto tag = confide::schema::make_bytes(sealed.subspan(kIvSize + body_size));

  auto ctx = make_cipher_context();
  auto out = confide::schema::bytes_t(body_size);
  auto length = 0;
  auto ok = EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr,
                               nullptr) == 1 &&
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                                static_cast<int>(kIvSize), nullptr) == 1 &&
            EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(),
                               iv.data()) == 1;
  if (ok && !aad.empty()) {
    ok = EVP_DecryptUpdate(ctx.get(), nullptr, &length, aad.data(),
                           static_cast<int>(aad.size())) == 1;
  }
  auto written = 0;
  if (ok && !body.empty()) {
    ok = EVP_DecryptUpdate(ctx.get(), out.data(), &length, body.data(),
                           static_cast<int>(body.size())) == 1;
    written = length;
  }
  if (ok) {
    ok = EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                             static_cast<int>(kTagSize), tag.data()) == 1;
  }
  if (ok) {
    ok = EVP_DecryptFinal_ex(ctx.get(), out.data() + written, &length) == 1;
  }
  if (!ok) {
    OPENSSL_cleanse(out.data(), out.size());
    throw decryption_error{"AES-256-GCM authentication failed"};
  }
  return out;
}

envelope_cipher::envelope_cipher(const symmetric_key_t& master_key)
    : master_key_{master_key} {}

confide::schema::sealed_envelope_t envelope_cipher::seal(
    const confide::schema::bytes_view_t& plaintext,
    const confide::schema::bytes_view_t& aad) const {
  auto data_key = random_key();
  auto envelope = confide::schema::sealed_envelope_t{};
  envelope.wrapped_key = crypto::seal(
      master_key_, confide::schema::bytes_view_t{data_key.data(), data_key.size()},
      aad);
  envelope.ciphertext = crypto::seal(data_key, plaintext, aad);
  OPENSSL_cleanse(data_key.data(), data_key.size());
  return envelope;
}

confide::schema::bytes_t envelope_cipher::open(
    const confide::schema::sealed_envelope_t& envelope,
    const confide::schema::bytes_view_t& aad) const {
  auto unwrapped = crypto::open(master_key_, envelope.wrapped_key, aad);
  if (unwrapped.size() != kKeySize) {
    OPENSSL_cleanse(unwrapped.data(), unwrapped.size());
    throw decryption_error{"wrapped data key has unexpected size"};
  }
  auto data_key = symmetric_key_t{};
  std::copy(std::begin(unwrapped), std::end(unwrapped), std::begin(data_key));
  OPENSSL_cleanse(unwrapped.data(), unwrapped.size());

  auto plaintext = crypto::open(data_key, envelope.ciphertext, aad);
  OPENSSL_cleanse(data_key.data(), data_key.size());
  return plaintext;
}

}  // namespace confide::crypto
