#include "channel_cipher.hpp"

#include <openssl/evp.h>

#include <array>
#include <memory>

#include "internal/observability/logging.hpp"
#include "internal/util/base64.hpp"
#include "internal/util/errors.hpp"

namespace meshgraph::ingest {

namespace {

constexpr std::array<unsigned char, 16> kDefaultPsk = {0xd4, 0xf1, 0xbb, 0x3a, 0x20, 0x29, 0x07, 0x59,
                                                       0xf0, 0xbc, 0xff, 0xab, 0xcf, 0x4e, 0x69, 0x01};

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

std::string KeyFromBase64(const std::string& name, const std::string& psk) {
  auto raw = util::DecodeBase64(psk);
  if (!raw) {
    throw util::ConfigurationError("channel key for " + name + " is not valid base64");
  }
  return ChannelCipher::ExpandKey(*raw);
}

} // namespace

ChannelCipher::ChannelCipher() : ChannelCipher(ChannelKeys{}) {
}

ChannelCipher::ChannelCipher(const ChannelKeys& keys) : default_key_(KeyFromBase64("default", keys.default_psk)) {
  for (const auto& [channel, psk] : keys.psk_by_channel) {
    keys_[channel] = KeyFromBase64(channel, psk);
  }
}

std::string ChannelCipher::ExpandKey(const std::string& psk) {
  if (psk.empty()) return {};

  if (psk.size() == 1) {
    const auto index = static_cast<unsigned char>(psk[0]);
    if (index == 0) return {};
    std::string key(kDefaultPsk.begin(), kDefaultPsk.end());
    key.back() = static_cast<char>(static_cast<unsigned char>(key.back()) + index - 1);
    return key;
  }

  if (psk.size() > 32) {
    throw util::ConfigurationError("channel key longer than 32 bytes");
  }

  std::string key = psk;
  key.resize(psk.size() <= 16 ? 16 : 32, '\0');
  return key;
}

std::optional<std::string> ChannelCipher::Apply(const std::string& key, uint32_t from, uint32_t packet_id,
                                                const std::string& data) {
  const EVP_CIPHER* cipher = nullptr;
  if (key.size() == 16) {
    cipher = EVP_aes_128_ctr();
  } else if (key.size() == 32) {
    cipher = EVP_aes_256_ctr();
  } else {
    return std::nullopt;
  }

  std::array<unsigned char, 16> iv{};
  const uint64_t                id = packet_id;
  for (int i = 0; i < 8; ++i) iv[i] = static_cast<unsigned char>(id >> (8 * i));
  for (int i = 0; i < 4; ++i) iv[8 + i] = static_cast<unsigned char>(from >> (8 * i));

  CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
  if (!ctx ||
      EVP_CipherInit_ex(ctx.get(), cipher, nullptr, reinterpret_cast<const unsigned char*>(key.data()), iv.data(), 1) != 1) {
    MESHGRAPH_LOG_WARN("aes-ctr init failed");
    return std::nullopt;
  }

  std::string out(data.size() + EVP_MAX_BLOCK_LENGTH, '\0');
  int         len  = 0;
  int         tail = 0;
  auto*       dst  = reinterpret_cast<unsigned char*>(out.data());
  if (EVP_CipherUpdate(ctx.get(), dst, &len, reinterpret_cast<const unsigned char*>(data.data()), static_cast<int>(data.size())) != 1 ||
      EVP_CipherFinal_ex(ctx.get(), dst + len, &tail) != 1) {
    MESHGRAPH_LOG_WARN("aes-ctr failed", {observability::IntField("packet_id", packet_id)});
    return std::nullopt;
  }
  out.resize(static_cast<std::size_t>(len + tail));
  return out;
}

std::optional<std::string> ChannelCipher::Decrypt(const std::string& channel_id, uint32_t from, uint32_t packet_id,
                                                  const std::string& ciphertext) const {
  auto               it  = keys_.find(channel_id);
  const std::string& key = it != keys_.end() ? it->second : default_key_;
  if (key.empty()) return std::nullopt;
  return Apply(key, from, packet_id, ciphertext);
}

} // namespace meshgraph::ingest
