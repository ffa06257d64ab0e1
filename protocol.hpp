#pragma once
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace hrstream {

// Phoenix channel vocabulary used by the upstream service.
inline constexpr std::string_view kTopicPrefix = "hr";
inline constexpr char kTopicDelimiter = ':';
inline constexpr std::string_view kEventJoin = "phx_join";
inline constexpr std::string_view kEventHeartbeat = "heartbeat";
inline constexpr std::string_view kEventReading = "hr_update";
inline constexpr std::string_view kHeartbeatTopic = "phoenix";

struct Envelope {
  std::string event;
  std::string topic;
  nlohmann::json payload;
};

struct Reading {
  std::string tracker_id;
  int heart_rate{0};
};

struct Endpoint {
  std::string host;
  std::string port;
  std::string target;  // path + query, always starts with '/'
};

std::string make_join_frame(std::string_view tracker_id);
std::string make_heartbeat_frame();

// Parses one inbound text frame. On failure returns nullopt and, if given,
// fills *out_err with a short description.
std::optional<Envelope> decode_envelope(std::string_view text, std::string* out_err = nullptr);

// "hr:abc" -> "abc". Only the segment between the first and second
// delimiter is used.
std::optional<std::string> tracker_id_from_topic(std::string_view topic);

// Extracts {id, hr} from an "hr_update" envelope.
std::optional<Reading> decode_reading(const Envelope& env, std::string* out_err = nullptr);

// Splits a wss:// URL and appends the bearer token as ?token=... The token
// is percent-encoded.
std::optional<Endpoint> parse_endpoint(std::string_view url, std::string_view token);

} // namespace hrstream
