#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace huelink::core {

  /**
 * @class ErrorMonitor
 * @brief Bridge clients and discovery sessions call `notifyFailure()` before
 *        throwing; we call the registered escalation callback exactly once per
 *        unique error.
 *
 * * Thread-safe (mutex-protected vector).
 * * Debounces duplicate failures so a flaky bridge doesn’t spam the application.
 */
  class ErrorMonitor {
  public:
    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that escalates a fault to the embedding application.
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called by subsystems on fault; will forward to the escalation callback.
    virtual void notifyFailure(const std::string& message);

    /// Distinct failures seen so far, oldest first.
    std::vector<std::string> failures() const;

  private:
    void forwardIfNew(const std::string& message);

    std::function<void(const std::string&)> escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
    mutable std::mutex mtx_;
  };

} // namespace huelink::core
