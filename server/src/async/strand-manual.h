// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#ifndef CLUECAST__ASYNC__STRAND_MANUAL_H
#define CLUECAST__ASYNC__STRAND_MANUAL_H

#include "strand.h"
#include "strand-base.h"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

class ImmediateObject_Manual;
class IntervalObject_Manual;
class TimeoutObject_Manual;

/*
 * Strand driven by the caller, with a virtual clock.
 *
 * Timers are due against now(), which only moves in advanceTime().
 * Used by the unit tests to step one-second ticks and debounce windows
 * without waiting for them.
 */
class Strand_Manual : public Strand_base, public std::enable_shared_from_this<Strand_Manual> {
  friend class ImmediateObject_Manual;
  friend class IntervalObject_Manual;
  friend class TimeoutObject_Manual;

  using time_point = std::chrono::steady_clock::time_point;

  mutable std::mutex mutex_{};
  time_point now_{};
  std::vector<std::shared_ptr<ImmediateObject_Manual>> immediates_{};
  std::vector<std::shared_ptr<IntervalObject_Manual>> intervals_{};
  std::vector<std::shared_ptr<TimeoutObject_Manual>> timeouts_{};

public:
  std::shared_ptr<ImmediateObject> setImmediate(std::function<void()> callback) override;
  std::shared_ptr<IntervalObject> setInterval(std::function<void()> callback, double delay) override;
  std::shared_ptr<TimeoutObject> setTimeout(std::function<void()> callback, double delay) override;

  void execute(std::function<void()> callback);

  void run();

  bool isDone();
  void runUntilDone();

  void advanceTime(std::chrono::milliseconds duration);
  [[nodiscard]] time_point now() const;

private:
  void runImmediate();
  void runInterval();
  void runTimeout();
  [[nodiscard]] std::optional<time_point> nextDeadline_mutex() const;
  static void invoke(const std::function<void()>& callback);
};


class ImmediateObject_Manual : public ImmediateObject {
  friend class Strand_Manual;
  std::weak_ptr<Strand_Manual> strand_{};
  std::function<void()> callback_{};
  bool cleared_{};
  void clear() override;
};

class IntervalObject_Manual : public IntervalObject {
  friend class Strand_Manual;
  std::weak_ptr<Strand_Manual> strand_{};
  std::function<void()> callback_;
  std::chrono::steady_clock::time_point timeout_;
  std::chrono::steady_clock::duration delay_;
  bool cleared_{};
  void clear() override;
};

class TimeoutObject_Manual : public TimeoutObject {
  friend class Strand_Manual;
  std::weak_ptr<Strand_Manual> strand_{};
  std::function<void()> callback_;
  std::chrono::steady_clock::time_point timeout_;
  bool cleared_{};
  void clear() override;
};

#endif
