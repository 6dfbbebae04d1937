// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#include "./promise.h"
#include <atomic>


Promise<void> PromiseUtils::all(const std::vector<Promise<void>>& promises) {
  Promise<void> result{};
  if (promises.empty()) {
    return result.resolve();
  }

  auto remaining = std::make_shared<std::atomic<std::size_t>>(promises.size());
  const std::shared_ptr<Strand_base> inline_{};
  for (const auto& promise : promises) {
    promise.then(inline_, [result, remaining]() {
      if (--*remaining == 0) {
        result.resolve().done();
      }
    }, [result](const std::exception_ptr& reason) {
      result.reject(reason).done();
    }).done();
  }
  return result;
}
