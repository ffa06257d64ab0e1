#pragma once
#include <systemd/sd-bus.h>

#include <atomic>
#include <functional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "tracker_registry.hpp"

namespace hrstream {

inline constexpr std::string_view kBusName = "io.hrstream.Monitor";
inline constexpr std::string_view kBusPath = "/io/hrstream/Monitor";
inline constexpr std::string_view kBusInterface = "io.hrstream.Monitor1";

// Callbacks run on the bus thread; they must hand work off rather than touch
// io-thread state directly.
struct ControlHooks {
  std::function<void(const std::string& id, const std::string& name)> add_tracker;
  std::function<void()> shutdown;
  std::function<std::vector<TrackerState>()> list_trackers;
};

// Runtime control surface on D-Bus:
//   AddTracker(s id, s name)
//   Shutdown()
//   ListTrackers() -> a(ssixx)  id, name, bpm, last update ms, last change ms
class BusControl {
public:
  explicit BusControl(ControlHooks hooks) : hooks_(std::move(hooks)) {}
  ~BusControl();
  BusControl(const BusControl&) = delete;
  BusControl& operator=(const BusControl&) = delete;

  // Opens the bus, publishes the object, claims the name and starts the
  // dispatch thread. On failure logs, releases everything and returns false.
  bool start(bool system_bus);
  void stop();
  bool running() const { return thread_.joinable(); }

  // Exposed for the method table.
  static int method_add_tracker(sd_bus_message* m, void* userdata, sd_bus_error* ret_error);
  static int method_shutdown(sd_bus_message* m, void* userdata, sd_bus_error* ret_error);
  static int method_list_trackers(sd_bus_message* m, void* userdata, sd_bus_error* ret_error);

private:
  void loop();
  void release();

  ControlHooks hooks_;
  sd_bus* bus_{};
  sd_bus_slot* slot_{};
  std::thread thread_;
  std::atomic<bool> stop_{false};
};

} // namespace hrstream
