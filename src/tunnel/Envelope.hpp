#ifndef __TT_ENVELOPE__
#define __TT_ENVELOPE__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace tt {
enum class EnvelopeType {
  UNKNOWN,
  REGISTERED,
  REQUEST,
  RESPONSE,
  PING,
  PONG,
  CLIENT_CONNECTED,
};

/**
 * @brief Outer frame exchanged with the relay, one per websocket message.
 *
 * Optional fields are empty strings (or a null payload) when absent.
 */
struct Envelope {
  EnvelopeType type = EnvelopeType::UNKNOWN;
  /** @brief The type string as received, kept for logging unknown types. */
  string rawType;
  string tunnelId;
  string tunnelUrl;
  string requestId;
  json payload;
  string error;
  string clientIp;

  Envelope() {}
  explicit Envelope(EnvelopeType _type);
};

/**
 * @brief Thrown when a frame is not a decodable envelope.
 */
class EnvelopeParseException : public std::runtime_error {
 public:
  explicit EnvelopeParseException(const string& msg)
      : std::runtime_error(msg) {}
};

string envelopeTypeToString(EnvelopeType type);
EnvelopeType envelopeTypeFromString(const string& s);

json envelopeToJson(const Envelope& envelope);
string serializeEnvelope(const Envelope& envelope);

/**
 * @throws EnvelopeParseException on malformed JSON or wrongly typed fields.
 */
Envelope parseEnvelope(const string& frame);
}  // namespace tt

#endif  // __TT_ENVELOPE__
