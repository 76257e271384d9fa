#pragma once
#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <type_traits>

// Fixed-size worker pool. Submit returns a future so callers can join on results
// and observe exceptions thrown by the task.
class ThreadPool {
public:
  explicit ThreadPool(size_t threads);
  ~ThreadPool();
  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  template <typename F>
  std::future<typename std::invoke_result<F>::type> Submit(F&& fn) {
    using R = typename std::invoke_result<F>::type;
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
    std::future<R> fut = task->get_future();
    Enqueue([task]{ (*task)(); });
    return fut;
  }

  // Throws std::runtime_error once the pool is shutting down. A std::exception
  // escaping `task` is logged and the worker keeps running.
  void Enqueue(std::function<void()> task);
  size_t Size() const { return workers_.size(); }
private:
  void WorkerLoop();
  // Blocks for the next task; false once stopping and the queue is empty.
  bool NextTask(std::function<void()>& task);

  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool stopping_ = false;
};
