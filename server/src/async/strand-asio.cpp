// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#include "./strand-asio.h"
#include "utilities/logging.h"


Strand_Asio::Context Strand_Asio::context__;


namespace {
  std::chrono::steady_clock::duration toDuration(double delay) {
    if (delay < 0) {
      delay = 0;
    }
    return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double, std::milli>{delay});
  }

  // Runs a timer or immediate callback as the current strand; exceptions end here.
  void invokeOnStrand(const std::shared_ptr<Strand_Asio>& strand, const std::function<void()>& callback, const char* origin) {
    try {
      Strand_base::SetCurrent current{strand};
      callback();
    } catch (const std::exception& e) {
      LOG_EXCEPTION(e);
    } catch (...) {
      LOG_EXCEPTION(std::runtime_error(std::string(origin) + " on strand " + strand->label_));
    }
  }

  void logTimerError(const boost::system::error_code& ec, const char* origin) {
    if (ec && ec != boost::asio::error::operation_aborted) {
      LOG_W("%s: error_code %s", origin, ec.message().c_str());
    }
  }
}


Strand_Asio::Strand_Asio(const boost::asio::any_io_executor& executor, const char* label) : strand_{executor}, label_{label} {
}


std::shared_ptr<Strand_Asio> Strand_Asio::Context::getMain() {
  std::lock_guard lock{mainMutex_};
  if (!main_)
    main_ = std::make_shared<Strand_Asio>(context_->get_executor(), "main");
  return main_;
}


std::shared_ptr<Strand_Asio> Strand_Asio::Context::makeStrand(const char* label) {
  LOG_ASSERT(label);
  return std::make_shared<Strand_Asio>(context_->get_executor(), label);
}


void Strand_Asio::Context::runUntilStopped(int threadCount) {
  work_ = std::make_unique<asio_work_guard>(context_->get_executor());

  {
    std::lock_guard lock{threadsMutex_};
    for (int i = 1; i < threadCount; ++i) {
      threads_.push_back(std::make_unique<std::thread>([this]() {
        context_->run();
      }));
    }
  }
  context_->run();
  context_->restart();
}


void Strand_Asio::Context::runUntilDone() {
  context_->run();
  context_->restart();
}


void Strand_Asio::Context::stop() {
  work_ = nullptr;
  context_->stop();
  std::vector<std::unique_ptr<std::thread>> threads;
  {
    std::lock_guard lock{threadsMutex_};
    threads = std::move(threads_);
    threads_.clear();
  }
  for (auto& thread : threads) {
    if (thread->get_id() != std::this_thread::get_id()) {
      thread->join();
    } else {
      thread->detach();
    }
  }
}


std::shared_ptr<TimeoutObject> Strand_Asio::setTimeout(std::function<void()> callback, double delay) {
  auto weak_ = weak_from_this();
  auto result = std::make_shared<TimeoutObject_Asio>(strand_.get_inner_executor());
  result->callback_ = std::move(callback);
  result->timer_.expires_after(toDuration(delay));
  result->timer_.async_wait(boost::asio::bind_executor(strand_, [weak_, result](boost::system::error_code ec) {
    logTimerError(ec, "setTimeout");
    TimeoutObject_Asio::dispatch(weak_, result);
  }));
  return result;
}


std::shared_ptr<IntervalObject> Strand_Asio::setInterval(std::function<void()> callback, double delay) {
  auto weak_ = weak_from_this();
  auto result = std::make_shared<IntervalObject_Asio>(strand_.get_inner_executor());
  auto d = std::chrono::milliseconds{static_cast<long>(delay < 1 ? 1 : delay)};
  result->callback_ = std::move(callback);
  result->timer_.expires_after(d);
  result->timer_.async_wait(boost::asio::bind_executor(strand_, [weak_, result, d](boost::system::error_code ec) {
    logTimerError(ec, "setInterval");
    IntervalObject_Asio::dispatch(weak_, result, d);
  }));
  return result;
}


std::shared_ptr<ImmediateObject> Strand_Asio::setImmediate(std::function<void()> callback) {
  auto weak_ = weak_from_this();
  auto result = std::make_shared<ImmediateObject_Asio>();
  result->callback_ = std::move(callback);
  boost::asio::post(strand_, [weak_, result]() {
    ImmediateObject_Asio::dispatch(weak_, result);
  });
  return result;
}


void TimeoutObject_Asio::dispatch(const std::weak_ptr<Strand_Asio>& strand, const std::shared_ptr<TimeoutObject_Asio>& timeout) {
  auto strandLock = strand.lock();
  if (!strandLock) {
    LOG_X("TimeoutObject_Asio: deleted strand");
    return;
  }
  std::unique_lock lock{timeout->mutex_};
  auto callback = std::move(timeout->callback_);
  timeout->callback_ = nullptr;
  lock.unlock();
  if (callback) {
    invokeOnStrand(strandLock, callback, "setTimeout");
  }
}


void TimeoutObject_Asio::clear() {
  std::lock_guard lock{mutex_};
  callback_ = nullptr;
  timer_.cancel();
}


void IntervalObject_Asio::dispatch(const std::weak_ptr<Strand_Asio>& strand, const std::shared_ptr<IntervalObject_Asio>& interval, std::chrono::milliseconds delay) {
  auto strandLock = strand.lock();
  if (!strandLock) {
    LOG_X("IntervalObject_Asio: deleted strand");
    return;
  }
  std::unique_lock lock{interval->mutex_};
  auto callback = interval->callback_;
  if (callback) {
    interval->timer_.expires_after(delay);
    interval->timer_.async_wait(boost::asio::bind_executor(strandLock->strand_, [strand, interval, delay](boost::system::error_code ec) {
      logTimerError(ec, "setInterval");
      dispatch(strand, interval, delay);
    }));
  }
  lock.unlock();
  if (callback) {
    invokeOnStrand(strandLock, callback, "setInterval");
  }
}


void IntervalObject_Asio::clear() {
  std::lock_guard lock{mutex_};
  callback_ = nullptr;
  timer_.cancel();
}


void ImmediateObject_Asio::dispatch(const std::weak_ptr<Strand_Asio>& strand, const std::shared_ptr<ImmediateObject_Asio>& immediate) {
  auto strandLock = strand.lock();
  if (!strandLock) {
    LOG_X("ImmediateObject_Asio: deleted strand");
    return;
  }
  std::unique_lock lock{immediate->mutex_};
  auto callback = std::move(immediate->callback_);
  immediate->callback_ = nullptr;
  lock.unlock();
  if (callback) {
    invokeOnStrand(strandLock, callback, "setImmediate");
  }
}


void ImmediateObject_Asio::clear() {
  std::lock_guard lock{mutex_};
  callback_ = nullptr;
}
