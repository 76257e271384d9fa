#pragma once
#include <string>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <queue>
#include <nlohmann/json.hpp>

// JSON-lines event sink. Events logged while not initialized are dropped.
class StructuredLogger {
public:
  static StructuredLogger& Instance();
  void Initialize(const std::string& file_path);
  // Writes {"ts":<unix ms>,"event":<event>, ...fields} as one line.
  void LogEvent(const std::string& event, const nlohmann::json& fields = nlohmann::json::object());
  void Shutdown();
private:
  StructuredLogger() = default;
  ~StructuredLogger();
  void Worker();
  std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<std::string> queue_;
  std::thread worker_;
  bool running_ = false;
  std::string file_path_;
};
