#include "context.hpp"

#include <algorithm>

std::shared_ptr<Context> Context::background() {
  return std::shared_ptr<Context>(new Context());
}

std::shared_ptr<Context> Context::child() {
  auto out = std::shared_ptr<Context>(new Context());
  std::lock_guard lg(m_);
  if(cancelled_) {
    out->cancelled_ = true;
    return out;
  }
  children_.erase(std::remove_if(children_.begin(), children_.end(),
                                 [](const std::weak_ptr<Context>& w){ return w.expired(); }),
                  children_.end());
  children_.push_back(out);
  return out;
}

void Context::cancel() {
  std::vector<std::weak_ptr<Context>> children;
  {
    std::lock_guard lg(m_);
    if(cancelled_) return;
    cancelled_ = true;
    children.swap(children_);
  }
  cv_.notify_all();
  for(auto& weak : children) {
    if(auto c = weak.lock()) c->cancel();
  }
}

bool Context::cancelled() const {
  std::lock_guard lg(m_);
  return cancelled_;
}

bool Context::wait_for(std::chrono::milliseconds duration) {
  std::unique_lock lock(m_);
  return cv_.wait_for(lock, duration, [this]{ return cancelled_; });
}
