// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#ifndef CLUECAST__ASYNC__STRAND_BASE_H
#define CLUECAST__ASYNC__STRAND_BASE_H

#include <cassert>
#include <coroutine>
#include <functional>
#include <memory>
#include <mutex>


class ImmediateObject;
class IntervalObject;
class TimeoutObject;


class Strand_base {
protected:
    static thread_local std::shared_ptr<Strand_base> current__;

public:
    struct ClearCurrent {};
    struct SetCurrent {
        std::shared_ptr<Strand_base> previous_;
        std::shared_ptr<Strand_base> strand_;
        explicit SetCurrent(ClearCurrent) : previous_{current__}, strand_{} {
            current__ = nullptr;
        }
        explicit SetCurrent(std::shared_ptr<Strand_base> strand) : previous_{current__}, strand_{std::move(strand)} {
            assert(!current__);
            current__ = strand_;
        }
        ~SetCurrent() {
            assert(current__ == strand_);
            current__ = previous_;
        }
    };

    Strand_base() = default;
    virtual ~Strand_base() = default;

    [[nodiscard]] static std::shared_ptr<Strand_base> getCurrent() {
        return current__;
    }

    [[nodiscard]] bool isCurrent() const {
        return current__.get() == this;
    }

    // delay in milliseconds
    virtual std::shared_ptr<TimeoutObject> setTimeout(std::function<void()> callback, double delay) = 0;
    virtual std::shared_ptr<IntervalObject> setInterval(std::function<void()> callback, double delay) = 0;
    virtual std::shared_ptr<ImmediateObject> setImmediate(std::function<void()> callback) = 0;

    Strand_base(const Strand_base&) = delete;
    Strand_base& operator=(const Strand_base&) = delete;
    Strand_base(Strand_base&&) = default;
    Strand_base& operator=(Strand_base&&) = default;

    /* co_await */

    [[nodiscard]] bool await_ready() const noexcept {
        return isCurrent();
    }

    void await_suspend(std::coroutine_handle<> handle) {
        assert(!isCurrent());
        setImmediate([handle]() {
            handle.resume();
        });
    }

    void await_resume() {
        assert(isCurrent());
    }

    // GCC 12 tries to copy an lvalue awaitable into the coroutine frame, which
    // fails for this abstract, non-copyable type; await through a pointer.
    struct Awaiter {
        Strand_base* strand_;
        [[nodiscard]] bool await_ready() const noexcept { return strand_->await_ready(); }
        void await_suspend(std::coroutine_handle<> handle) { strand_->await_suspend(handle); }
        void await_resume() { strand_->await_resume(); }
    };

    Awaiter operator co_await() noexcept {
        return Awaiter{this};
    }
};


#endif
