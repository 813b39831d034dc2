#pragma once

#ifndef USELESS_PROMISE_SCHEDULER_HPP
#define USELESS_PROMISE_SCHEDULER_HPP

#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <optional>
#include <vector>

#include "ChaosPolicy.hpp"
#include "Frame.hpp"
#include "UselessError.hpp"

#include "uv.h"

enum class PromiseStatus {
    Pending,
    Resolved,
    Rejected,
    Abandoned
};

const char* promise_status_name(PromiseStatus s);

struct PromiseEntry {
    PromiseHandle handle;
    PromiseStatus status = PromiseStatus::Pending;
    Value value;        // resolution value (kept across a mind change)
    ErrorValue error;   // valid when Rejected
    uint64_t created_at_ms = 0;
    uint64_t timeout_ms = 0;
    bool mind_change = false;
    bool changed_mind = false;
    uint64_t settled_tick = 0;  // 0 while pending
    bool is_task = false;       // settled by an async body, never by chaos
    bool awaited = false;
};

struct SchedulerOptions {
    uint64_t tick_ms = 10;
    uint64_t default_timeout_ms = 1000;
    bool trace = false;
};

// Cooperative single-threaded promise table and continuation queue.
// A libuv idle handle performs one tick per loop iteration.
class PromiseScheduler {
   public:
    PromiseScheduler(ChaosPolicy& chaos, SchedulerOptions options = SchedulerOptions());
    ~PromiseScheduler();

    PromiseScheduler(const PromiseScheduler&) = delete;
    PromiseScheduler& operator=(const PromiseScheduler&) = delete;

    // promise(value, timeoutMs): mind_change absent -> drawn from the chaos table
    PromiseHandle create(const Value& value, std::optional<uint64_t> timeout_ms, std::optional<bool> mind_change);
    PromiseHandle create_task();

    // Settle a task promise; its waiters become ready.
    void resolve_task(PromiseHandle h, const Value& value);
    void reject_task(PromiseHandle h, const ErrorValue& error);

    // Throws std::logic_error for a handle this scheduler never issued.
    const PromiseEntry& entry(PromiseHandle h) const;
    void mark_awaited(PromiseHandle h);

    // Park a continuation until `h` leaves Pending.
    void suspend(PromiseHandle h, const Continuation& cont);
    void enqueue_microtask(const Continuation& task);

    // Advance virtual time by one tick, settle chaos promises, run ready continuations.
    // Returns true while there is more work (a pending chaos promise or a ready continuation).
    bool tick();

    // Drive ticks on the libuv loop until no work remains. Exceptions thrown by
    // continuations stop the loop and are rethrown here.
    void run_until_idle();

    bool has_pending() const;
    uint64_t now_ms() const { return now_ms_; }
    uint64_t tick_count() const { return tick_; }
    size_t suspended_count() const { return waiters_.size(); }
    size_t size() const { return entries_.size(); }

    // Rejected task promises nobody ever awaited.
    std::vector<const PromiseEntry*> unhandled_rejections() const;

   private:
    ChaosPolicy& chaos_;
    SchedulerOptions options_;

    std::vector<PromiseEntry> entries_;  // creation order; id = index + 1
    uint64_t now_ms_ = 0;
    uint64_t tick_ = 0;

    struct Waiter {
        PromiseHandle handle;
        Continuation cont;
    };
    std::vector<Waiter> waiters_;  // suspension order
    std::deque<Continuation> ready_;

    uv_loop_t* loop_ = nullptr;
    uv_idle_t idle_handle_;
    bool idle_initialized_ = false;
    std::exception_ptr failure_;

    PromiseEntry& mutable_entry(PromiseHandle h);
    void settle_pending_promises();
    void apply_mind_changes();
    void wake_waiters();
    void drain_ready();
    void log(const std::string& msg) const;

    static void on_idle(uv_idle_t* handle);
};

#endif  // USELESS_PROMISE_SCHEDULER_HPP
