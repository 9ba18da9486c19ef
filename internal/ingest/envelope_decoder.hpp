#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/ingest/channel_cipher.hpp"
#include "internal/model/events.hpp"

namespace meshgraph::ingest {

struct Envelope {
  std::string topic;
  std::string payload;
  int64_t     received_at = 0; // unix seconds
};

/*
  Turns one broker envelope into typed events.

  Topics containing "/json/" are parsed as the broker's JSON rendition, all
  others as a protobuf ServiceEnvelope. The result is either a single
  model::Unknown, or a model::Message followed by the events derived from its
  port payload (at most one NodeInfoUpdate or TracerouteRecord, or one
  NeighborReport per listed neighbor).

  Encrypted packets are decrypted with the channel's key and decoded like
  plaintext ones; when that fails the Message keeps type "encrypted".

  Decode never throws.
*/
class EnvelopeDecoder {
 public:
  EnvelopeDecoder();
  explicit EnvelopeDecoder(ChannelCipher cipher);

  std::vector<model::Event> Decode(const Envelope& envelope) const;

  // Message type tag for a mesh port number.
  static std::string_view TypeTag(uint32_t portnum);

 private:
  std::vector<model::Event> DecodeProtobuf(const Envelope& envelope) const;
  std::vector<model::Event> DecodeJson(const Envelope& envelope) const;

  ChannelCipher cipher_;
};

} // namespace meshgraph::ingest
