#ifndef PGS_PROGRESS_H
#define PGS_PROGRESS_H

#include "../utils/pgs_string.h"
#include <atomic>
#include <mutex>
#include <queue>

namespace pgs::progress {
  enum class event_kind {
    status,    // short description of the current stage
    progress,  // percent complete in value
    message    // log line worth showing to the user
  };

  struct event {
    event_kind kind;
    pgs_string text;
    double value;
  };

  // One-way channel from the engine to whoever displays progress. The
  // engine only publishes, it never reads events back.
  class i_sink {
  public:
    virtual ~i_sink() = default;
    virtual void publish(const event& e) = 0;
    // Polled between sections only
    virtual bool cancel_requested() const { return false; }
  };

  // Prints status and message events, percentages only in steps of ten
  class console_sink : public i_sink {
    int last_decile;

  public:
    console_sink();
    void publish(const event& e) override;
  };

  // Thread-safe queue drained by a presentation thread
  class queue_sink : public i_sink {
    mutable std::mutex lock;
    std::queue<event> events;
    std::atomic<bool> cancelled;

  public:
    queue_sink();
    void publish(const event& e) override;
    bool cancel_requested() const override;

    // Non-blocking, false when the queue is empty
    bool try_pop(event& out);
    size_t pending() const;
    void request_cancel();
  };

  void publish_status(i_sink* sink, const pgs_string& text);
  void publish_progress(i_sink* sink, double percent);
  void publish_message(i_sink* sink, const pgs_string& text);
}

#endif // PGS_PROGRESS_H
