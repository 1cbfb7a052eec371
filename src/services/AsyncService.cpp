#include "services/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace mh::services;
using namespace mh::log;

AsyncService::AsyncService(const std::string& serviceName) : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) {
        interruptFlag_.store(true, std::memory_order_release);
        worker_.join();
    }
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join();

    interruptFlag_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            Registry::mirrorhall()->error("[{}] Service error: {}", serviceName_, e.what());
        } catch (...) {
            Registry::mirrorhall()->error("[{}] Service encountered an unknown error.", serviceName_);
        }

        running_.store(false, std::memory_order_release);
    });

    Registry::mirrorhall()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    Registry::mirrorhall()->info("[{}] Stopping service...", serviceName_);
    interruptFlag_.store(true, std::memory_order_release);
    wake();

    if (std::this_thread::get_id() != worker_.get_id()) worker_.join();

    running_.store(false, std::memory_order_release);
    // Leave interruptFlag_ true until next start() resets it
    Registry::mirrorhall()->info("[{}] Service stopped.", serviceName_);
}

void AsyncService::restart() {
    Registry::mirrorhall()->info("[{}] Restarting service...", serviceName_);
    stop();
    start();
}
