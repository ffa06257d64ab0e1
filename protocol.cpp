#include "protocol.hpp"

#include <limits>

namespace hrstream {

namespace {

std::string make_frame(std::string topic, std::string_view event) {
  nlohmann::ordered_json frame;
  frame["topic"] = std::move(topic);
  frame["event"] = std::string(event);
  frame["payload"] = nlohmann::ordered_json::object();
  frame["ref"] = 0;
  return frame.dump();
}

void set_err(std::string* out_err, std::string msg) {
  if (out_err) *out_err = std::move(msg);
}

// RFC 3986 query component: unreserved characters pass, everything else
// becomes %XX.
std::string percent_encode(std::string_view in) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(in.size());
  for (char ch : in) {
    auto c = static_cast<unsigned char>(ch);
    bool unreserved = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                      (c >= '0' && c <= '9') || c == '-' || c == '.' || c == '_' || c == '~';
    if (unreserved) {
      out += ch;
    } else {
      out += '%';
      out += kHex[c >> 4];
      out += kHex[c & 0x0F];
    }
  }
  return out;
}

} // namespace

std::string make_join_frame(std::string_view tracker_id) {
  std::string topic(kTopicPrefix);
  topic += kTopicDelimiter;
  topic += tracker_id;
  return make_frame(std::move(topic), kEventJoin);
}

std::string make_heartbeat_frame() {
  return make_frame(std::string(kHeartbeatTopic), kEventHeartbeat);
}

std::optional<Envelope> decode_envelope(std::string_view text, std::string* out_err) {
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(text.begin(), text.end());
  } catch (const nlohmann::json::parse_error& e) {
    set_err(out_err, e.what());
    return std::nullopt;
  }

  if (!doc.is_object()) {
    set_err(out_err, "envelope is not an object");
    return std::nullopt;
  }
  auto ev = doc.find("event");
  if (ev == doc.end() || !ev->is_string()) {
    set_err(out_err, "missing string field 'event'");
    return std::nullopt;
  }

  Envelope env;
  env.event = ev->get<std::string>();
  auto tp = doc.find("topic");
  if (tp != doc.end() && tp->is_string()) env.topic = tp->get<std::string>();
  auto pl = doc.find("payload");
  if (pl != doc.end()) env.payload = *pl;
  return env;
}

std::optional<std::string> tracker_id_from_topic(std::string_view topic) {
  auto first = topic.find(kTopicDelimiter);
  if (first == std::string_view::npos) return std::nullopt;
  auto rest = topic.substr(first + 1);
  auto second = rest.find(kTopicDelimiter);
  if (second != std::string_view::npos) rest = rest.substr(0, second);
  return std::string(rest);
}

std::optional<Reading> decode_reading(const Envelope& env, std::string* out_err) {
  auto id = tracker_id_from_topic(env.topic);
  if (!id) {
    set_err(out_err, "topic '" + env.topic + "' has no tracker id");
    return std::nullopt;
  }
  if (!env.payload.is_object()) {
    set_err(out_err, "payload is not an object");
    return std::nullopt;
  }
  auto hr = env.payload.find("hr");
  if (hr == env.payload.end() || !hr->is_number_integer()) {
    set_err(out_err, "payload.hr is not an integer");
    return std::nullopt;
  }
  auto v = hr->get<int64_t>();
  if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
    set_err(out_err, "payload.hr out of range");
    return std::nullopt;
  }
  return Reading{std::move(*id), static_cast<int>(v)};
}

std::optional<Endpoint> parse_endpoint(std::string_view url, std::string_view token) {
  Endpoint ep;
  constexpr std::string_view kWss = "wss://";
  if (url.substr(0, kWss.size()) != kWss) return std::nullopt;
  url.remove_prefix(kWss.size());

  auto slash = url.find_first_of("/?");
  std::string_view authority = url.substr(0, slash);
  if (slash == std::string_view::npos) {
    ep.target = "/";
  } else {
    ep.target = (url[slash] == '?') ? "/" : "";
    ep.target += url.substr(slash);
  }

  auto colon = authority.rfind(':');
  if (colon != std::string_view::npos) {
    ep.host = std::string(authority.substr(0, colon));
    ep.port = std::string(authority.substr(colon + 1));
    if (ep.port.empty()) return std::nullopt;
    for (char c : ep.port) {
      if (c < '0' || c > '9') return std::nullopt;
    }
  } else {
    ep.host = std::string(authority);
    ep.port = "443";
  }
  if (ep.host.empty()) return std::nullopt;

  ep.target += (ep.target.find('?') == std::string::npos) ? "?token=" : "&token=";
  ep.target += percent_encode(token);
  return ep;
}

} // namespace hrstream
