// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#include "./strand-manual.h"
#include "utilities/logging.h"
#include <algorithm>
#include <stdexcept>


namespace {
  std::chrono::steady_clock::duration toDuration(double delay) {
    return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double, std::milli>{delay < 0 ? 0 : delay});
  }
}


std::shared_ptr<ImmediateObject> Strand_Manual::setImmediate(std::function<void()> callback) {
  auto result = std::make_shared<ImmediateObject_Manual>();
  result->strand_ = weak_from_this();
  result->callback_ = std::move(callback);
  std::lock_guard lock{mutex_};
  immediates_.push_back(result);
  return result;
}


std::shared_ptr<IntervalObject> Strand_Manual::setInterval(std::function<void()> callback, double delay) {
  auto result = std::make_shared<IntervalObject_Manual>();
  result->strand_ = weak_from_this();
  result->callback_ = std::move(callback);
  result->delay_ = toDuration(delay < 1 ? 1 : delay);
  std::lock_guard lock{mutex_};
  result->timeout_ = now_ + result->delay_;
  intervals_.push_back(result);
  return result;
}


std::shared_ptr<TimeoutObject> Strand_Manual::setTimeout(std::function<void()> callback, double delay) {
  auto result = std::make_shared<TimeoutObject_Manual>();
  result->strand_ = weak_from_this();
  result->callback_ = std::move(callback);
  std::lock_guard lock{mutex_};
  result->timeout_ = now_ + toDuration(delay);
  timeouts_.push_back(result);
  return result;
}


void Strand_Manual::execute(std::function<void()> callback) {
  LOG_ASSERT(!isCurrent());
  SetCurrent current{shared_from_this()};
  callback();
}


void Strand_Manual::run() {
  LOG_ASSERT(!isCurrent());
  SetCurrent current{ClearCurrent{}};
  runImmediate();
  runTimeout();
  runInterval();
  runImmediate();
}


bool Strand_Manual::isDone() {
  std::lock_guard lock{mutex_};
  if (!immediates_.empty()) {
    return false;
  }
  auto deadline = nextDeadline_mutex();
  return !deadline || *deadline > now_;
}


void Strand_Manual::runUntilDone() {
  while (!isDone()) {
    run();
  }
}


void Strand_Manual::advanceTime(std::chrono::milliseconds duration) {
  std::unique_lock lock{mutex_};
  const auto target = now_ + duration;
  lock.unlock();

  runUntilDone();
  for (;;) {
    lock.lock();
    auto deadline = nextDeadline_mutex();
    if (!deadline || *deadline > target) {
      now_ = target;
      lock.unlock();
      break;
    }
    now_ = std::max(now_, *deadline);
    lock.unlock();
    runUntilDone();
  }
  runUntilDone();
}


Strand_Manual::time_point Strand_Manual::now() const {
  std::lock_guard lock{mutex_};
  return now_;
}


void Strand_Manual::runImmediate() {
  std::vector<std::shared_ptr<ImmediateObject_Manual>> immediates{};
  std::unique_lock lock{mutex_};
  immediates = std::move(immediates_);
  immediates_.clear();
  lock.unlock();

  SetCurrent current{shared_from_this()};
  for (auto& immediate : immediates) {
    std::function<void()> callback;
    lock.lock();
    if (!immediate->cleared_) {
      callback = std::move(immediate->callback_);
      immediate->cleared_ = true;
    }
    lock.unlock();
    if (callback) {
      invoke(callback);
    }
  }
}


void Strand_Manual::runInterval() {
  std::vector<std::shared_ptr<IntervalObject_Manual>> intervals{};
  {
    std::lock_guard lock{mutex_};
    auto i = intervals_.begin();
    while (i != intervals_.end()) {
      if (now_ >= (*i)->timeout_) {
        intervals.push_back(std::move(*i));
        i = intervals_.erase(i);
      } else {
        ++i;
      }
    }
  }
  {
    SetCurrent current{shared_from_this()};
    for (auto& interval : intervals) {
      std::function<void()> callback;
      {
        std::lock_guard lock{mutex_};
        if (!interval->cleared_) {
          callback = interval->callback_;
        }
      }
      if (callback) {
        invoke(callback);
      }
    }
  }
  {
    std::lock_guard lock{mutex_};
    for (auto& interval : intervals) {
      if (!interval->cleared_) {
        interval->timeout_ = now_ + interval->delay_;
        intervals_.push_back(std::move(interval));
      }
    }
  }
}


void Strand_Manual::runTimeout() {
  std::vector<std::shared_ptr<TimeoutObject_Manual>> timeouts{};

  std::unique_lock lock{mutex_};
  auto i = timeouts_.begin();
  while (i != timeouts_.end()) {
    if (now_ >= (*i)->timeout_) {
      timeouts.push_back(std::move(*i));
      i = timeouts_.erase(i);
    } else {
      ++i;
    }
  }
  lock.unlock();

  std::stable_sort(timeouts.begin(), timeouts.end(), [](const auto& a, const auto& b) {
    return a->timeout_ < b->timeout_;
  });

  SetCurrent current{shared_from_this()};
  for (auto& timeout : timeouts) {
    std::function<void()> callback;
    lock.lock();
    if (!timeout->cleared_) {
      callback = std::move(timeout->callback_);
      timeout->cleared_ = true;
    }
    lock.unlock();
    if (callback) {
      invoke(callback);
    }
  }
}


std::optional<Strand_Manual::time_point> Strand_Manual::nextDeadline_mutex() const {
  std::optional<time_point> result{};
  for (const auto& timeout : timeouts_) {
    if (!result || timeout->timeout_ < *result) {
      result = timeout->timeout_;
    }
  }
  for (const auto& interval : intervals_) {
    if (!result || interval->timeout_ < *result) {
      result = interval->timeout_;
    }
  }
  return result;
}


void Strand_Manual::invoke(const std::function<void()>& callback) {
  try {
    callback();
  } catch (const std::exception& e) {
    LOG_EXCEPTION(e);
  } catch (...) {
    LOG_EXCEPTION(std::runtime_error("Strand_Manual callback"));
  }
}


void ImmediateObject_Manual::clear() {
  if (auto strand = strand_.lock()) {
    std::lock_guard lock{strand->mutex_};
    cleared_ = true;
    callback_ = nullptr;
    strand->immediates_.erase(
        std::remove_if(strand->immediates_.begin(), strand->immediates_.end(), [this](auto& x) {
          return x.get() == this;
        }), strand->immediates_.end());
  }
}

void IntervalObject_Manual::clear() {
  if (auto strand = strand_.lock()) {
    std::lock_guard lock{strand->mutex_};
    cleared_ = true;
    strand->intervals_.erase(
        std::remove_if(strand->intervals_.begin(), strand->intervals_.end(), [this](auto& x) {
          return x.get() == this;
        }), strand->intervals_.end());
  }
}

void TimeoutObject_Manual::clear() {
  if (auto strand = strand_.lock()) {
    std::lock_guard lock{strand->mutex_};
    cleared_ = true;
    callback_ = nullptr;
    strand->timeouts_.erase(
        std::remove_if(strand->timeouts_.begin(), strand->timeouts_.end(), [this](auto& x) {
          return x.get() == this;
        }), strand->timeouts_.end());
  }
}
