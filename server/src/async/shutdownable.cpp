// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#include "shutdownable.h"


Promise<void> Shutdownable::shutdown() {
  std::unique_lock lock{shutdownMutex_};
  if (shutdownPromise_) {
    return *shutdownPromise_;
  }
  shutdownPromise_ = std::make_unique<Promise<void>>();
  Promise<void> result = *shutdownPromise_;
  lock.unlock();

  Promise<void> inner{};
  try {
    inner = shutdown_();
  } catch (...) {
    inner = Promise<void>{}.reject(std::current_exception());
  }

  inner.then(std::shared_ptr<Strand_base>{}, [result]() {
    result.resolve().done();
  }, [result](const std::exception_ptr& reason) {
    LOG_REJECTION(reason);
    result.reject(reason).done();
  }).done();

  return result;
}
