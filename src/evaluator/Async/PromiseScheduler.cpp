#include "PromiseScheduler.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

#include "colors.hpp"

#include "uv.h"

const char* promise_status_name(PromiseStatus s) {
    switch (s) {
        case PromiseStatus::Pending: return "pending";
        case PromiseStatus::Resolved: return "resolved";
        case PromiseStatus::Rejected: return "rejected";
        case PromiseStatus::Abandoned: return "abandoned";
    }
    return "?";
}

PromiseScheduler::PromiseScheduler(ChaosPolicy& chaos, SchedulerOptions options)
    : chaos_(chaos), options_(options) {
    // private loop; the idle handle is started only while run_until_idle runs
    loop_ = new uv_loop_t;
    int rc = uv_loop_init(loop_);
    if (rc != 0) {
        delete loop_;
        loop_ = nullptr;
        throw std::runtime_error(std::string("uv_loop_init failed: ") + uv_strerror(rc));
    }
    uv_idle_init(loop_, &idle_handle_);
    idle_handle_.data = this;
    idle_initialized_ = true;
}

PromiseScheduler::~PromiseScheduler() {
    if (idle_initialized_) {
        uv_close(reinterpret_cast<uv_handle_t*>(&idle_handle_), nullptr);
        // let the close callback run
        uv_run(loop_, UV_RUN_NOWAIT);
        idle_initialized_ = false;
    }
    if (loop_) {
        uv_loop_close(loop_);
        delete loop_;
        loop_ = nullptr;
    }
}

void PromiseScheduler::log(const std::string& msg) const {
    if (!options_.trace) return;
    bool color = Color::supports_color(STDERR_FILENO);
    std::cerr << Color::paint("[sched] ", Color::bright_black, color) << msg << "\n";
}

PromiseHandle PromiseScheduler::create(const Value& value, std::optional<uint64_t> timeout_ms, std::optional<bool> mind_change) {
    PromiseEntry e;
    e.handle = PromiseHandle{static_cast<uint64_t>(entries_.size() + 1)};
    e.value = value;
    e.created_at_ms = now_ms_;
    e.timeout_ms = timeout_ms ? *timeout_ms : options_.default_timeout_ms;
    e.mind_change = mind_change ? *mind_change : chaos_.mind_change_at_creation();
    entries_.push_back(e);
    log("created #" + std::to_string(e.handle.id) + " timeout=" + std::to_string(e.timeout_ms) + "ms" +
        (e.mind_change ? " (fickle)" : ""));
    return e.handle;
}

PromiseHandle PromiseScheduler::create_task() {
    PromiseEntry e;
    e.handle = PromiseHandle{static_cast<uint64_t>(entries_.size() + 1)};
    e.created_at_ms = now_ms_;
    e.is_task = true;
    entries_.push_back(e);
    return e.handle;
}

PromiseEntry& PromiseScheduler::mutable_entry(PromiseHandle h) {
    if (h.id == 0 || h.id > entries_.size()) {
        throw std::logic_error("unknown promise handle #" + std::to_string(h.id));
    }
    return entries_[h.id - 1];
}

const PromiseEntry& PromiseScheduler::entry(PromiseHandle h) const {
    if (h.id == 0 || h.id > entries_.size()) {
        throw std::logic_error("unknown promise handle #" + std::to_string(h.id));
    }
    return entries_[h.id - 1];
}

void PromiseScheduler::mark_awaited(PromiseHandle h) {
    mutable_entry(h).awaited = true;
}

void PromiseScheduler::resolve_task(PromiseHandle h, const Value& value) {
    PromiseEntry& e = mutable_entry(h);
    if (!e.is_task) throw std::logic_error("resolve_task on a chaos promise");
    if (e.status != PromiseStatus::Pending) return;
    e.status = PromiseStatus::Resolved;
    e.value = value;
    e.settled_tick = tick_;
    log("task #" + std::to_string(h.id) + " resolved");
    wake_waiters();
}

void PromiseScheduler::reject_task(PromiseHandle h, const ErrorValue& error) {
    PromiseEntry& e = mutable_entry(h);
    if (!e.is_task) throw std::logic_error("reject_task on a chaos promise");
    if (e.status != PromiseStatus::Pending) return;
    e.status = PromiseStatus::Rejected;
    e.error = error;
    e.settled_tick = tick_;
    log("task #" + std::to_string(h.id) + " rejected: " + error_kind_name(error.kind));
    wake_waiters();
}

void PromiseScheduler::suspend(PromiseHandle h, const Continuation& cont) {
    if (entry(h).status != PromiseStatus::Pending) {
        // already settled: no need to park
        enqueue_microtask(cont);
        return;
    }
    waiters_.push_back(Waiter{h, cont});
}

void PromiseScheduler::enqueue_microtask(const Continuation& task) {
    if (!task) return;
    ready_.push_back(task);
}

bool PromiseScheduler::has_pending() const {
    for (const auto& e : entries_) {
        if (!e.is_task && e.status == PromiseStatus::Pending) return true;
    }
    return false;
}

void PromiseScheduler::settle_pending_promises() {
    for (auto& e : entries_) {
        if (e.is_task || e.status != PromiseStatus::Pending) continue;

        std::string id = "#" + std::to_string(e.handle.id);
        switch (chaos_.settle_pending()) {
            case Settlement::Resolve:
                e.status = PromiseStatus::Resolved;
                break;
            case Settlement::Abandon:
                e.status = PromiseStatus::Abandoned;
                e.error = ErrorValue{ErrorKind::PromiseAbandoned,
                    "Promise " + id + " was abandoned. It said it would call back. It never did 💔", std::nullopt};
                break;
            case Settlement::Stay:
                if (now_ms_ - e.created_at_ms > e.timeout_ms) {
                    e.status = PromiseStatus::Abandoned;
                    e.error = ErrorValue{ErrorKind::PromiseAbandoned,
                        "Promise " + id + " timed out after " + std::to_string(e.timeout_ms) +
                            "ms and was abandoned. Patience is overrated anyway ⏳",
                        std::nullopt};
                }
                break;
        }
        if (e.status != PromiseStatus::Pending) {
            e.settled_tick = tick_;
            log("tick " + std::to_string(tick_) + " t=" + std::to_string(now_ms_) + "ms " + id + " " +
                promise_status_name(e.status));
        }
    }
}

void PromiseScheduler::apply_mind_changes() {
    for (auto& e : entries_) {
        if (!e.mind_change || e.changed_mind) continue;
        if (e.settled_tick == 0 || e.settled_tick >= tick_) continue;
        if (e.status != PromiseStatus::Resolved && e.status != PromiseStatus::Rejected) continue;
        if (!chaos_.flip_now()) continue;

        std::string id = "#" + std::to_string(e.handle.id);
        if (e.status == PromiseStatus::Resolved) {
            e.status = PromiseStatus::Rejected;
            e.error = ErrorValue{ErrorKind::PromiseRejected,
                "Promise " + id + " changed its mind. It's not you, it's the promise 🙃", std::nullopt};
        } else {
            e.status = PromiseStatus::Resolved;
        }
        e.changed_mind = true;
        log("tick " + std::to_string(tick_) + " " + id + " changed its mind: now " + promise_status_name(e.status));
    }
}

void PromiseScheduler::wake_waiters() {
    std::vector<Waiter> still_waiting;
    still_waiting.reserve(waiters_.size());
    for (auto& w : waiters_) {
        if (entry(w.handle).status != PromiseStatus::Pending) {
            ready_.push_back(std::move(w.cont));
        } else {
            still_waiting.push_back(std::move(w));
        }
    }
    waiters_.swap(still_waiting);
}

void PromiseScheduler::drain_ready() {
    while (!ready_.empty()) {
        Continuation c = std::move(ready_.front());
        ready_.pop_front();
        c();
    }
}

bool PromiseScheduler::tick() {
    drain_ready();

    ++tick_;
    now_ms_ += options_.tick_ms;

    settle_pending_promises();
    apply_mind_changes();
    wake_waiters();
    drain_ready();

    return has_pending() || !ready_.empty();
}

void PromiseScheduler::on_idle(uv_idle_t* handle) {
    auto* self = static_cast<PromiseScheduler*>(handle->data);
    bool more = false;
    try {
        more = self->tick();
    } catch (...) {
        // carried out of uv_run and rethrown by run_until_idle
        self->failure_ = std::current_exception();
        more = false;
    }
    if (!more) uv_idle_stop(handle);
}

void PromiseScheduler::run_until_idle() {
    if (!has_pending() && ready_.empty()) return;

    failure_ = nullptr;
    uv_idle_start(&idle_handle_, &PromiseScheduler::on_idle);
    uv_run(loop_, UV_RUN_DEFAULT);

    if (failure_) {
        std::exception_ptr e = failure_;
        failure_ = nullptr;
        std::rethrow_exception(e);
    }
}

std::vector<const PromiseEntry*> PromiseScheduler::unhandled_rejections() const {
    std::vector<const PromiseEntry*> out;
    for (const auto& e : entries_) {
        if (e.is_task && e.status == PromiseStatus::Rejected && !e.awaited) out.push_back(&e);
    }
    return out;
}
