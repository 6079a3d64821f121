#pragma once
#include <functional>

namespace tripviz {

// Scheduler abstraction: delivers one callback per frame while started.
class TickSource {
public:
  using Callback = std::function<void(double now_s)>;

  virtual ~TickSource() = default;

  // Replace the callback and schedule ticks.
  virtual void start(Callback cb) = 0;
  // Cancel the next scheduled tick. No callback fires after this returns.
  virtual void stop() = 0;
  virtual bool running() const = 0;
};

// Host-pumped source. A render loop (or a backend's frame hook, or a test)
// calls pump() once per frame with the current wall time.
class FrameTickSource final : public TickSource {
public:
  void start(Callback cb) override;
  void stop() override;
  bool running() const override { return armed_; }

  // Fires the callback if started; returns whether it fired.
  bool pump(double now_s);

private:
  Callback cb_;
  bool armed_{false};
};

} // namespace tripviz
