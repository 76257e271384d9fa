#pragma once
#include <functional>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <chrono>

class RpcClient;

// Polls eth_blockNumber and invokes a callback once per new block, on the watcher thread.
// Poll errors back off exponentially up to max_backoff.
class BlockWatcher {
public:
    using OnBlockFn = std::function<void(unsigned long long)>;

    BlockWatcher(RpcClient& rpc, OnBlockFn on_block,
                 std::chrono::milliseconds poll_interval = std::chrono::milliseconds(1000),
                 std::chrono::milliseconds max_backoff = std::chrono::milliseconds(30000))
        : rpc_(rpc), on_block_(std::move(on_block)), poll_interval_(poll_interval), max_backoff_(max_backoff) {}

    void Start();
    void Stop();

    unsigned long long LastBlock() const { return last_block_.load(std::memory_order_relaxed); }

    ~BlockWatcher() { Stop(); }

private:
    void Run();
    // Sleeps up to `d`; returns false when stopped meanwhile.
    bool SleepFor(std::chrono::milliseconds d);

    RpcClient& rpc_;
    OnBlockFn on_block_;
    std::chrono::milliseconds poll_interval_;
    std::chrono::milliseconds max_backoff_;
    std::atomic<bool> running_{false};
    std::atomic<unsigned long long> last_block_{0};
    std::thread worker_;
    std::mutex mutex_;
    std::condition_variable cv_;
};
