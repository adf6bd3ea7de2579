// Repository: Cadence-audio
// Component: Cancellation Token
// Purpose: Cooperative cancellation flag handed to worker cycle logic.
// Copyright (c) 2025 Cadence

#ifndef CADENCE_UTIL_CANCELLATION_TOKEN_HPP_
#define CADENCE_UTIL_CANCELLATION_TOKEN_HPP_

#include <atomic>
#include <memory>

namespace cadence::util {

// Read side of a CancellationSource. Cheap to copy; all copies observe the
// same flag. A default-constructed token is never cancelled.
class CancellationToken {
 public:
  CancellationToken() = default;

  bool IsCancellationRequested() const {
    return flag_ && flag_->load(std::memory_order_acquire);
  }

 private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag)
      : flag_(std::move(flag)) {}

  std::shared_ptr<std::atomic<bool>> flag_;
};

class CancellationSource {
 public:
  CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  CancellationToken Token() const { return CancellationToken(flag_); }
  void Cancel() { flag_->store(true, std::memory_order_release); }
  bool IsCancellationRequested() const {
    return flag_->load(std::memory_order_acquire);
  }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace cadence::util

#endif  // CADENCE_UTIL_CANCELLATION_TOKEN_HPP_
