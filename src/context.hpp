#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

// Cancellation scope shared by background loops. Cancelling a context
// cancels every context derived from it.
class Context : public std::enable_shared_from_this<Context> {
public:
  static std::shared_ptr<Context> background();

  std::shared_ptr<Context> child();

  void cancel();
  bool cancelled() const;

  // Sleeps up to `duration`. Returns true if the context was cancelled.
  bool wait_for(std::chrono::milliseconds duration);

private:
  Context() = default;

  mutable std::mutex m_;
  std::condition_variable cv_;
  bool cancelled_ = false;
  std::vector<std::weak_ptr<Context>> children_;
};
