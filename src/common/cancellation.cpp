#include "common/cancellation.hpp"
#include "common/exceptions.hpp"

namespace arbiter {

void cancellation_token::cancel() noexcept {
    flag.store(true, std::memory_order_release);
}

bool cancellation_token::cancelled() const noexcept {
    return flag.load(std::memory_order_acquire);
}

void cancellation_token::throw_if_cancelled() const {
    if (cancelled()) throw judge_cancelled();
}

}  // namespace arbiter
