#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace meshgraph::ingest {

// Base64 pre-shared keys. "AQ==" selects the public default key and "AA=="
// marks a channel as unencrypted.
struct ChannelKeys {
  std::string                        default_psk{"AQ=="};
  std::map<std::string, std::string> psk_by_channel; // channel name -> psk
};

/*
  AES-CTR decryption of channel-encrypted mesh packets.

  PSKs expand the way the firmware expands them:
    - 0 bytes, or the single byte 0: no encryption
    - a single byte n: the public default key with its last byte + (n - 1)
    - shorter than 16 bytes: zero padded to AES-128
    - 17..31 bytes: zero padded to AES-256

  The initial counter block is packet id (64-bit little endian), sender node
  (32-bit little endian), then four zero bytes.
*/
class ChannelCipher {
 public:
  ChannelCipher();

  // Throws ConfigurationError for a malformed or oversized PSK.
  explicit ChannelCipher(const ChannelKeys& keys);

  // nullopt when the channel is unencrypted or the cipher fails.
  std::optional<std::string> Decrypt(const std::string& channel_id, uint32_t from, uint32_t packet_id,
                                     const std::string& ciphertext) const;

  // AES key for a raw PSK; empty when the PSK disables encryption.
  static std::string ExpandKey(const std::string& psk);

  // CTR mode is symmetric: the same call encrypts and decrypts.
  static std::optional<std::string> Apply(const std::string& key, uint32_t from, uint32_t packet_id, const std::string& data);

 private:
  std::string                        default_key_;
  std::map<std::string, std::string> keys_;
};

} // namespace meshgraph::ingest
