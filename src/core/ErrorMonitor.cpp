/* @file ErrorMonitor.cpp
 * @brief de-duplicating failure sink.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>

#include "core/ErrorMonitor.hpp"

namespace huelink {
  namespace core {

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) { forwardIfNew(message); }

    std::vector<std::string> ErrorMonitor::failures() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return seen_;
    }

    void ErrorMonitor::forwardIfNew(const std::string& message) {
      std::function<void(const std::string&)> cb;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
          return;
        seen_.push_back(message);
        cb = escalation_;
      }
      // outside the lock, the callback may call back into us
      if (cb)
        cb(message);
    }

  } // namespace core
} // namespace huelink
