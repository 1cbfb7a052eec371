#include "sync/EventLoop.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace mh::sync;
using namespace mh::sync::model;
using namespace mh::log;

EventLoop::EventLoop(Handler handler, const bool coalesceRemoteChanged)
    : AsyncService("EventLoop"), handler_(std::move(handler)), coalesce_(coalesceRemoteChanged) {
    if (!handler_) throw std::invalid_argument("EventLoop requires a handler");
}

EventLoop::~EventLoop() {
    stop();
}

bool EventLoop::push(Trigger trigger) {
    {
        std::lock_guard lock(mutex_);
        if (coalesce_ && trigger.type == Trigger::Type::RemoteChanged &&
            !queue_.empty() && queue_.back().type == Trigger::Type::RemoteChanged) {
            Registry::sync()->debug("[EventLoop] Coalesced {} into queued trigger ({} queued)",
                                    to_string(trigger), queue_.size());
            return false;
        }
        queue_.push_back(std::move(trigger));
        Registry::sync()->debug("[EventLoop] Queued {} ({} queued)", to_string(queue_.back()), queue_.size());
    }
    cv_.notify_one();
    return true;
}

size_t EventLoop::queueDepth() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

bool EventLoop::busy() const {
    std::lock_guard lock(mutex_);
    return busy_;
}

uint64_t EventLoop::cyclesRun() const {
    std::lock_guard lock(mutex_);
    return cyclesRun_;
}

std::optional<CycleReport> EventLoop::lastReport() const {
    std::lock_guard lock(mutex_);
    return lastReport_;
}

bool EventLoop::waitIdle(const std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return idleCv_.wait_for(lock, timeout, [this] { return queue_.empty() && !busy_; });
}

void EventLoop::wake() {
    cv_.notify_all();
}

void EventLoop::runLoop() {
    Registry::sync()->debug("[EventLoop] Worker started");

    while (!interruptFlag_.load(std::memory_order_acquire)) {
        Trigger trigger;
        {
            std::unique_lock lock(mutex_);
            cv_.wait_for(lock, POLL_INTERVAL, [this] {
                return !queue_.empty() || interruptFlag_.load(std::memory_order_acquire);
            });
            if (interruptFlag_.load(std::memory_order_acquire)) break;
            if (queue_.empty()) continue;

            trigger = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;
        }

        auto report = dispatch(trigger);

        {
            std::lock_guard lock(mutex_);
            busy_ = false;
            ++cyclesRun_;
            lastReport_ = std::move(report);
        }
        idleCv_.notify_all();
    }

    {
        std::lock_guard lock(mutex_);
        if (!queue_.empty())
            Registry::sync()->warn("[EventLoop] Stopping with {} trigger(s) still queued", queue_.size());
    }
    idleCv_.notify_all();
    Registry::sync()->debug("[EventLoop] Worker exiting");
}

CycleReport EventLoop::dispatch(const Trigger& trigger) const {
    try {
        return handler_(trigger);
    } catch (const std::exception& e) {
        Registry::sync()->error("[EventLoop] Cycle for {} failed: {}", to_string(trigger), e.what());
        CycleReport report;
        report.trigger = trigger;
        report.start();
        report.abort(report.stage, e.what());
        report.stop();
        return report;
    } catch (...) {
        Registry::sync()->error("[EventLoop] Cycle for {} failed with an unknown error", to_string(trigger));
        CycleReport report;
        report.trigger = trigger;
        report.start();
        report.abort(report.stage, "unknown error");
        report.stop();
        return report;
    }
}
