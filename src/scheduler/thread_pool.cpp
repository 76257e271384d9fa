#include "scheduler/thread_pool.hpp"
#include "common/logger.hpp"

ThreadPool::ThreadPool(size_t threads) {
  const size_t count = threads == 0 ? 1 : threads;
  workers_.reserve(count);
  for (size_t i = 0; i < count; ++i) workers_.emplace_back(&ThreadPool::WorkerLoop, this);
  LOG_DEBUG("Worker pool started with " + std::to_string(count) + " threads");
}

ThreadPool::~ThreadPool() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  for (auto& w : workers_) {
    if (w.joinable()) w.join();
  }
}

void ThreadPool::Enqueue(std::function<void()> task) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (stopping_) throw std::runtime_error("ThreadPool is stopping");
  tasks_.push(std::move(task));
  lock.unlock();
  cv_.notify_one();
}

bool ThreadPool::NextTask(std::function<void()>& task) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this]{ return stopping_ || !tasks_.empty(); });
  // Queued work is drained before the workers exit.
  if (tasks_.empty()) return false;
  task = std::move(tasks_.front());
  tasks_.pop();
  return true;
}

void ThreadPool::WorkerLoop() {
  std::function<void()> task;
  while (NextTask(task)) {
    // Submit() tasks report through their future; this only catches bare Enqueue() work.
    try {
      task();
    } catch (const std::exception& e) {
      LOG_ERROR(std::string("Worker task failed: ") + e.what());
    }
    task = nullptr;
  }
}
