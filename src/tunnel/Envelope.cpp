#include "Envelope.hpp"

namespace tt {
namespace {
const vector<pair<EnvelopeType, string>> ENVELOPE_TYPE_NAMES = {
    {EnvelopeType::REGISTERED, "registered"},
    {EnvelopeType::REQUEST, "request"},
    {EnvelopeType::RESPONSE, "response"},
    {EnvelopeType::PING, "ping"},
    {EnvelopeType::PONG, "pong"},
    {EnvelopeType::CLIENT_CONNECTED, "client_connected"},
};

string optionalString(const json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return "";
  }
  if (!it->is_string()) {
    throw EnvelopeParseException(string("envelope field '") + key +
                                 "' must be a string");
  }
  return it->get<string>();
}
}  // namespace

Envelope::Envelope(EnvelopeType _type)
    : type(_type), rawType(envelopeTypeToString(_type)) {}

string envelopeTypeToString(EnvelopeType type) {
  for (const auto& it : ENVELOPE_TYPE_NAMES) {
    if (it.first == type) {
      return it.second;
    }
  }
  return "unknown";
}

EnvelopeType envelopeTypeFromString(const string& s) {
  for (const auto& it : ENVELOPE_TYPE_NAMES) {
    if (it.second == s) {
      return it.first;
    }
  }
  return EnvelopeType::UNKNOWN;
}

json envelopeToJson(const Envelope& envelope) {
  json j;
  j["type"] = envelope.type == EnvelopeType::UNKNOWN
                  ? envelope.rawType
                  : envelopeTypeToString(envelope.type);
  if (!envelope.tunnelId.empty()) j["tunnel_id"] = envelope.tunnelId;
  if (!envelope.tunnelUrl.empty()) j["tunnel_url"] = envelope.tunnelUrl;
  if (!envelope.requestId.empty()) j["request_id"] = envelope.requestId;
  if (!envelope.payload.is_null()) j["payload"] = envelope.payload;
  if (!envelope.error.empty()) j["error"] = envelope.error;
  if (!envelope.clientIp.empty()) j["client_ip"] = envelope.clientIp;
  return j;
}

string serializeEnvelope(const Envelope& envelope) {
  return envelopeToJson(envelope).dump();
}

Envelope parseEnvelope(const string& frame) {
  json j;
  try {
    j = json::parse(frame);
  } catch (const json::parse_error& pe) {
    throw EnvelopeParseException(string("malformed envelope: ") + pe.what());
  }
  if (!j.is_object()) {
    throw EnvelopeParseException("envelope must be a JSON object");
  }

  Envelope envelope;
  envelope.rawType = optionalString(j, "type");
  envelope.type = envelopeTypeFromString(envelope.rawType);
  envelope.tunnelId = optionalString(j, "tunnel_id");
  envelope.tunnelUrl = optionalString(j, "tunnel_url");
  envelope.requestId = optionalString(j, "request_id");
  envelope.error = optionalString(j, "error");
  envelope.clientIp = optionalString(j, "client_ip");
  auto payload = j.find("payload");
  if (payload != j.end()) {
    envelope.payload = *payload;
  }
  return envelope;
}
}  // namespace tt
