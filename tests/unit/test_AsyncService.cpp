#include <gtest/gtest.h>
#include "services/AsyncService.hpp"

#include <chrono>
#include <functional>
#include <stdexcept>
#include <thread>

using mh::services::AsyncService;
using namespace std::chrono_literals;

namespace {

class ScriptedService final : public AsyncService {
public:
    explicit ScriptedService(std::function<void()> body)
        : AsyncService("ScriptedService"), body_(std::move(body)) {}

    ~ScriptedService() override { stop(); }

    [[nodiscard]] bool interrupted() const { return interruptFlag_.load(); }

    bool waitStopped(const std::chrono::milliseconds timeout) const {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (isRunning() && std::chrono::steady_clock::now() < deadline) std::this_thread::sleep_for(1ms);
        return !isRunning();
    }

protected:
    void runLoop() override { body_(); }

private:
    std::function<void()> body_;
};

}

TEST(AsyncServiceTest, StandardExceptionEndsWorkerCleanly) {
    ScriptedService svc([] { throw std::runtime_error("boom"); });
    svc.start();
    EXPECT_TRUE(svc.waitStopped(5s));
}

TEST(AsyncServiceTest, NonStandardExceptionEndsWorkerCleanly) {
    ScriptedService svc([] { throw 7; });
    svc.start();
    EXPECT_TRUE(svc.waitStopped(5s));

    // The service can be started again afterwards
    svc.start();
    EXPECT_TRUE(svc.waitStopped(5s));
}

TEST(AsyncServiceTest, StopInterruptsRunningLoop) {
    ScriptedService* self = nullptr;
    ScriptedService svc([&self] {
        while (!self->interrupted()) std::this_thread::sleep_for(1ms);
    });
    self = &svc;
    svc.start();
    EXPECT_TRUE(svc.isRunning());
    svc.stop();
    EXPECT_FALSE(svc.isRunning());
}
