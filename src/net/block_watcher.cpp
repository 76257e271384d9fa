#include "net/block_watcher.hpp"
#include "node_connection/rpc_client.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <stdexcept>

void BlockWatcher::Start() {
    if (running_.exchange(true)) return;
    worker_ = std::thread([this]{ this->Run(); });
}

void BlockWatcher::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(false, std::memory_order_relaxed);
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) worker_.join();
}

bool BlockWatcher::SleepFor(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, d, [this]{ return !running_.load(std::memory_order_relaxed); });
}

void BlockWatcher::Run() {
    Logger::Info("Block watcher polling every " + std::to_string(poll_interval_.count()) + "ms");
    std::chrono::milliseconds backoff = poll_interval_;
    while (running_.load(std::memory_order_relaxed)) {
        unsigned long long bn = 0;
        try {
            bn = rpc_.EthBlockNumber();
            backoff = poll_interval_;
        } catch (const std::exception& e) {
            Logger::Warning(std::string("eth_blockNumber failed: ") + e.what());
            backoff = std::min(max_backoff_, backoff * 2);
            if (!SleepFor(backoff)) break;
            continue;
        }
        if (bn > last_block_.load(std::memory_order_relaxed)) {
            last_block_.store(bn, std::memory_order_relaxed);
            try {
                on_block_(bn);
            } catch (const std::exception& e) {
                Logger::Error("Block handler failed at block " + std::to_string(bn) + ": " + e.what());
            }
        }
        if (!SleepFor(poll_interval_)) break;
    }
}
