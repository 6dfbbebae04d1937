// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#ifndef CLUECAST__ASYNC__PROMISE_H
#define CLUECAST__ASYNC__PROMISE_H

#include "./strand.h"
#include "utilities/logging.h"
#include <coroutine>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>


enum class PromiseState { Pending, Fulfilled, Rejected };

template <typename T = void>
class [[nodiscard]] Promise;

struct PromiseUtils {
  [[nodiscard]] static Promise<void> all(const std::vector<Promise<void>>& promises);

  static void ExecuteImmediate(const std::shared_ptr<Strand_base>& strand, std::function<void()> callback) {
    if (strand) {
      strand->setImmediate(std::move(callback));
    } else {
      callback();
    }
  }
};

// Value slot of a Promise<void>.
struct PromiseVoid {};


template <typename V>
struct PromiseScope {
  struct Callback {
    std::shared_ptr<Strand_base> strand;
    std::function<void(const V&)> resolve;
    std::function<void(const std::exception_ptr&)> reject;
  };

  std::mutex mutex{};
  PromiseState state{};
  V value{};
  std::exception_ptr reason{};
  std::vector<Callback> callbacks{};

  // first settlement wins, later calls are ignored
  void settle(PromiseState newState, V newValue, std::exception_ptr newReason) {
    std::vector<Callback> pending{};
    {
      std::lock_guard lock{mutex};
      if (state != PromiseState::Pending) {
        return;
      }
      state = newState;
      value = std::move(newValue);
      reason = std::move(newReason);
      pending = std::move(callbacks);
      callbacks.clear();
    }
    for (auto& callback : pending) {
      dispatch(callback);
    }
  }

  void subscribe(Callback callback) {
    {
      std::lock_guard lock{mutex};
      if (state == PromiseState::Pending) {
        callbacks.push_back(std::move(callback));
        return;
      }
    }
    dispatch(callback);
  }

private:
  void dispatch(const Callback& callback) {
    if (state == PromiseState::Fulfilled) {
      PromiseUtils::ExecuteImmediate(callback.strand, [resolve = callback.resolve, value = value]() {
        resolve(value);
      });
    } else {
      PromiseUtils::ExecuteImmediate(callback.strand, [reject = callback.reject, reason = reason]() {
        reject(reason);
      });
    }
  }
};


template <typename V>
Promise<void> chainPromise(
    const std::shared_ptr<PromiseScope<V>>& scope,
    const std::shared_ptr<Strand_base>& strand,
    std::function<void(const V&)> fulfill,
    std::function<void(const std::exception_ptr&)> reject);


template <>
class [[nodiscard]] Promise<void> {
public:
  template <typename X> friend class Promise;
  using ValueType = void;
  using Scope = PromiseScope<PromiseVoid>;

  std::shared_ptr<Scope> scope_;

  Promise() : scope_{std::make_shared<Scope>()} {}

  [[nodiscard]] bool isPending() const noexcept { return state() == PromiseState::Pending; }
  [[nodiscard]] bool isFulfilled() const noexcept { return state() == PromiseState::Fulfilled; }
  [[nodiscard]] bool isRejected() const noexcept { return state() == PromiseState::Rejected; }

  [[nodiscard]] Promise resolve() const {
    scope_->settle(PromiseState::Fulfilled, PromiseVoid{}, nullptr);
    return *this;
  }

  [[nodiscard]] Promise reject(const std::exception_ptr& reason) const {
    scope_->settle(PromiseState::Rejected, PromiseVoid{}, reason);
    return *this;
  }

  template <typename R>
  [[nodiscard]] Promise reject(const R& reason) const {
    return reject(std::make_exception_ptr(reason));
  }

  [[nodiscard]] Promise<void> then(
      const std::shared_ptr<Strand_base>& strand,
      std::function<void()> fulfill,
      std::function<void(const std::exception_ptr&)> reject = nullptr) const;

  [[nodiscard]] Promise<void> then(
      std::function<void()> fulfill,
      std::function<void(const std::exception_ptr&)> reject = nullptr) const {
    return then(Strand_base::getCurrent(), std::move(fulfill), std::move(reject));
  }

  [[nodiscard]] Promise<void> onReject(std::function<void(const std::exception_ptr&)> reject) const {
    return then(Strand_base::getCurrent(), nullptr, std::move(reject));
  }

  void done() noexcept {}

  /* co_return */

  using promise_type = Promise;

  std::suspend_never initial_suspend() noexcept { return {}; }
  std::suspend_never final_suspend() noexcept { return {}; }
  Promise get_return_object() const { return *this; }

  void return_void() const {
    resolve().done();
  }

  void unhandled_exception() const {
    reject(std::current_exception()).done();
  }

  /* co_await */

  [[nodiscard]] bool await_ready() const noexcept {
    return !isPending();
  }

  // resumes on the strand that was current when suspending
  void await_suspend(std::coroutine_handle<> handle) const {
    then([handle]() {
      handle.resume();
    }, [handle](const std::exception_ptr&) {
      handle.resume();
    }).done();
  }

  void await_resume() const {
    if (isRejected()) {
      std::rethrow_exception(scope_->reason);
    }
  }

private:
  [[nodiscard]] PromiseState state() const noexcept {
    std::lock_guard lock{scope_->mutex};
    return scope_->state;
  }
};


template <typename T>
class [[nodiscard]] Promise {
public:
  template <typename X> friend class Promise;
  using ValueType = T;
  using Scope = PromiseScope<T>;

  std::shared_ptr<Scope> scope_;

  Promise() : scope_{std::make_shared<Scope>()} {}

  [[nodiscard]] bool isPending() const noexcept { return state() == PromiseState::Pending; }
  [[nodiscard]] bool isFulfilled() const noexcept { return state() == PromiseState::Fulfilled; }
  [[nodiscard]] bool isRejected() const noexcept { return state() == PromiseState::Rejected; }

  [[nodiscard]] Promise resolve(ValueType value) const {
    scope_->settle(PromiseState::Fulfilled, std::move(value), nullptr);
    return *this;
  }

  [[nodiscard]] Promise reject(const std::exception_ptr& reason) const {
    scope_->settle(PromiseState::Rejected, ValueType{}, reason);
    return *this;
  }

  template <typename R>
  [[nodiscard]] Promise reject(const R& reason) const {
    return reject(std::make_exception_ptr(reason));
  }

  [[nodiscard]] Promise<void> then(
      const std::shared_ptr<Strand_base>& strand,
      std::function<void(const ValueType&)> fulfill,
      std::function<void(const std::exception_ptr&)> reject = nullptr) const {
    return chainPromise<T>(scope_, strand, std::move(fulfill), std::move(reject));
  }

  [[nodiscard]] Promise<void> then(
      std::function<void(const ValueType&)> fulfill,
      std::function<void(const std::exception_ptr&)> reject = nullptr) const {
    return then(Strand_base::getCurrent(), std::move(fulfill), std::move(reject));
  }

  [[nodiscard]] Promise<void> onReject(std::function<void(const std::exception_ptr&)> reject) const {
    return then(Strand_base::getCurrent(), nullptr, std::move(reject));
  }

  void done() noexcept {}

  /* co_return */

  using promise_type = Promise;

  std::suspend_never initial_suspend() noexcept { return {}; }
  std::suspend_never final_suspend() noexcept { return {}; }
  Promise get_return_object() const { return *this; }

  void return_value(ValueType value) const {
    resolve(std::move(value)).done();
  }

  void unhandled_exception() const {
    reject(std::current_exception()).done();
  }

  /* co_await */

  [[nodiscard]] bool await_ready() const noexcept {
    return !isPending();
  }

  void await_suspend(std::coroutine_handle<> handle) const {
    then([handle](const ValueType&) {
      handle.resume();
    }, [handle](const std::exception_ptr&) {
      handle.resume();
    }).done();
  }

  [[nodiscard]] ValueType await_resume() const {
    if (isRejected()) {
      std::rethrow_exception(scope_->reason);
    }
    return scope_->value;
  }

private:
  [[nodiscard]] PromiseState state() const noexcept {
    std::lock_guard lock{scope_->mutex};
    return scope_->state;
  }
};


template <typename T>
Promise<T> resolve(T value) {
  return Promise<T>{}.resolve(std::move(value));
}


template <typename V>
Promise<void> chainPromise(
    const std::shared_ptr<PromiseScope<V>>& scope,
    const std::shared_ptr<Strand_base>& strand,
    std::function<void(const V&)> fulfill,
    std::function<void(const std::exception_ptr&)> reject) {
  Promise<void> result{};
  typename PromiseScope<V>::Callback callback{};
  callback.strand = strand;
  callback.resolve = [fulfill = std::move(fulfill), result](const V& value) {
    try {
      if (fulfill) {
        fulfill(value);
      }
      result.resolve().done();
    } catch (...) {
      result.reject(std::current_exception()).done();
    }
  };
  callback.reject = [reject = std::move(reject), result](const std::exception_ptr& reason) {
    if (!reject) {
      result.reject(reason).done();
      return;
    }
    try {
      reject(reason);
      result.resolve().done();
    } catch (...) {
      result.reject(std::current_exception()).done();
    }
  };
  scope->subscribe(std::move(callback));
  return result;
}


inline Promise<void> Promise<void>::then(
    const std::shared_ptr<Strand_base>& strand,
    std::function<void()> fulfill,
    std::function<void(const std::exception_ptr&)> reject) const {
  std::function<void(const PromiseVoid&)> adapter{};
  if (fulfill) {
    adapter = [fulfill = std::move(fulfill)](const PromiseVoid&) {
      fulfill();
    };
  }
  return chainPromise<PromiseVoid>(scope_, strand, std::move(adapter), std::move(reject));
}


#endif
