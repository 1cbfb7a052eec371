#pragma once

#include "services/AsyncService.hpp"
#include "sync/model/CycleReport.hpp"
#include "sync/model/Trigger.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

namespace mh::sync {

/**
 * Single-consumer FIFO of sync triggers. One worker thread takes a trigger,
 * runs the handler to completion, then takes the next one; cycles never
 * overlap and producers never block.
 *
 * With coalescing on, a RemoteChanged pushed while the newest queued trigger
 * is also RemoteChanged is folded into it. Nothing else is merged or reordered.
 */
class EventLoop final : public services::AsyncService {
public:
    using Handler = std::function<model::CycleReport(const model::Trigger&)>;

    explicit EventLoop(Handler handler, bool coalesceRemoteChanged = false);
    ~EventLoop() override;

    // Returns false when the trigger was folded into a queued one.
    bool push(model::Trigger trigger);

    [[nodiscard]] size_t queueDepth() const;
    [[nodiscard]] bool busy() const;
    [[nodiscard]] uint64_t cyclesRun() const;
    [[nodiscard]] std::optional<model::CycleReport> lastReport() const;

    // Blocks until the queue is empty and no cycle is running.
    bool waitIdle(std::chrono::milliseconds timeout);

protected:
    void runLoop() override;
    void wake() override;

private:
    static constexpr auto POLL_INTERVAL = std::chrono::milliseconds(250);

    Handler handler_;
    const bool coalesce_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idleCv_;
    std::deque<model::Trigger> queue_;
    bool busy_{false};
    uint64_t cyclesRun_{0};
    std::optional<model::CycleReport> lastReport_;

    model::CycleReport dispatch(const model::Trigger& trigger) const;
};

}
