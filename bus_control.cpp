#include "bus_control.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>

#include "debug.hpp"

namespace hrstream {

namespace {

// poll interval for sd-bus wait (µs); bounds shutdown latency
constexpr uint64_t poll_time = 500000; // 0.5s

const sd_bus_vtable kMonitorVtable[] = {
  SD_BUS_VTABLE_START(0),
  SD_BUS_METHOD("AddTracker", "ss", "", BusControl::method_add_tracker, SD_BUS_VTABLE_UNPRIVILEGED),
  SD_BUS_METHOD("Shutdown", "", "", BusControl::method_shutdown, SD_BUS_VTABLE_UNPRIVILEGED),
  SD_BUS_METHOD("ListTrackers", "", "a(ssixx)", BusControl::method_list_trackers, SD_BUS_VTABLE_UNPRIVILEGED),
  SD_BUS_VTABLE_END
};

void log_bus_err(const char* what, int r) {
  ERR << "[warn] " << what << " (" << -r << "): " << strerror(-r) << "\n";
}

} // namespace

BusControl::~BusControl() { stop(); }

bool BusControl::start(bool system_bus) {
  if (running()) return true;

  int r = system_bus ? sd_bus_open_system(&bus_) : sd_bus_open_user(&bus_);
  if (r < 0) {
    log_bus_err(system_bus ? "sd_bus_open_system" : "sd_bus_open_user", r);
    release();
    return false;
  }

  r = sd_bus_add_object_vtable(bus_, &slot_,
                               std::string(kBusPath).c_str(),
                               std::string(kBusInterface).c_str(),
                               kMonitorVtable, this);
  if (r < 0) {
    log_bus_err("sd_bus_add_object_vtable", r);
    release();
    return false;
  }

  r = sd_bus_request_name(bus_, std::string(kBusName).c_str(), 0);
  if (r < 0) {
    log_bus_err("sd_bus_request_name", r);
    release();
    return false;
  }

  stop_ = false;
  thread_ = std::thread([this] { loop(); });
  ERR << "[info] Control surface on " << (system_bus ? "system" : "user")
      << " bus: " << kBusName << " " << kBusPath << "\n";
  return true;
}

void BusControl::stop() {
  stop_ = true;
  if (thread_.joinable()) thread_.join();
  release();
}

void BusControl::release() {
  if (slot_) { sd_bus_slot_unref(slot_); slot_ = nullptr; }
  if (bus_) { sd_bus_flush_close_unref(bus_); bus_ = nullptr; }
}

void BusControl::loop() {
  DBG << "[dbg] bus loop running\n";
  while (!stop_) {
    int r = sd_bus_process(bus_, nullptr);
    if (r < 0) {
      log_bus_err("sd_bus_process", r);
      break;
    }
    if (r > 0) continue;
    r = sd_bus_wait(bus_, poll_time);
    if (r < 0 && r != -EINTR) {
      log_bus_err("sd_bus_wait", r);
      break;
    }
  }
  DBG << "[dbg] bus loop exited\n";
}

int BusControl::method_add_tracker(sd_bus_message* m, void* userdata, sd_bus_error* ret_error) {
  auto* self = static_cast<BusControl*>(userdata);
  const char* id = nullptr;
  const char* name = nullptr;
  int r = sd_bus_message_read(m, "ss", &id, &name);
  if (r < 0) return r;

  if (!id || !*id) {
    sd_bus_error_set_const(ret_error, SD_BUS_ERROR_INVALID_ARGS, "tracker id must not be empty");
    return -EINVAL;
  }
  DBG << "[dbg] AddTracker(" << id << ", " << (name ? name : "") << ")\n";
  if (self->hooks_.add_tracker) self->hooks_.add_tracker(id, name ? name : "");
  return sd_bus_reply_method_return(m, "");
}

int BusControl::method_shutdown(sd_bus_message* m, void* userdata, sd_bus_error* ret_error) {
  (void)ret_error;
  auto* self = static_cast<BusControl*>(userdata);
  ERR << "[info] Shutdown requested over D-Bus\n";
  if (self->hooks_.shutdown) self->hooks_.shutdown();
  return sd_bus_reply_method_return(m, "");
}

int BusControl::method_list_trackers(sd_bus_message* m, void* userdata, sd_bus_error* ret_error) {
  (void)ret_error;
  auto* self = static_cast<BusControl*>(userdata);
  std::vector<TrackerState> trackers;
  if (self->hooks_.list_trackers) trackers = self->hooks_.list_trackers();

  sd_bus_message* reply = nullptr;
  int r = sd_bus_message_new_method_return(m, &reply);
  if (r < 0) return r;

  r = sd_bus_message_open_container(reply, 'a', "(ssixx)");
  for (size_t i = 0; r >= 0 && i < trackers.size(); ++i) {
    const auto& t = trackers[i];
    r = sd_bus_message_append(reply, "(ssixx)",
                              t.id.c_str(), t.name.c_str(),
                              (int32_t)t.heart_rate_or_zero(),
                              (int64_t)t.last_update_ms,
                              (int64_t)t.last_changed_ms);
  }
  if (r >= 0) r = sd_bus_message_close_container(reply);
  if (r >= 0) r = sd_bus_send(nullptr, reply, nullptr);
  sd_bus_message_unref(reply);
  return r;
}

} // namespace hrstream
