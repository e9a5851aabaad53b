#include "pgs_progress.h"
#include <iostream>

namespace pgs::progress {

  console_sink::console_sink() : last_decile(-1) {
  }

  void console_sink::publish(const event& e) {
    switch (e.kind) {
      case event_kind::status:
        std::cout << "⏳ " << e.text.c_str() << std::endl;
        break;
      case event_kind::progress: {
        int decile = (int)(e.value / 10.0);
        if (decile != last_decile) {
          last_decile = decile;
          std::cout << "   " << decile * 10 << "%" << std::endl;
        }
        break;
      }
      case event_kind::message:
        break;  // already logged by the engine
    }
  }

  queue_sink::queue_sink() : cancelled(false) {
  }

  void queue_sink::publish(const event& e) {
    std::lock_guard<std::mutex> guard(lock);
    events.push(e);
  }

  bool queue_sink::cancel_requested() const {
    return cancelled.load();
  }

  bool queue_sink::try_pop(event& out) {
    std::lock_guard<std::mutex> guard(lock);
    if (events.empty()) {
      return false;
    }
    out = events.front();
    events.pop();
    return true;
  }

  size_t queue_sink::pending() const {
    std::lock_guard<std::mutex> guard(lock);
    return events.size();
  }

  void queue_sink::request_cancel() {
    cancelled.store(true);
  }

  void publish_status(i_sink* sink, const pgs_string& text) {
    if (sink != nullptr) {
      sink->publish({event_kind::status, text, 0.0});
    }
  }

  void publish_progress(i_sink* sink, double percent) {
    if (sink != nullptr) {
      sink->publish({event_kind::progress, pgs_string(), percent});
    }
  }

  void publish_message(i_sink* sink, const pgs_string& text) {
    if (sink != nullptr) {
      sink->publish({event_kind::message, text, 0.0});
    }
  }

}
