#pragma once

#include <atomic>
#include <memory>

namespace convoy {

    /// Cooperative cancellation flag shared by a mission, its agents and their plans.
    class CancelToken {
      public:
        void cancel() { flag_.store(true, std::memory_order_release); }
        bool cancelled() const { return flag_.load(std::memory_order_acquire); }

      private:
        std::atomic<bool> flag_{false};
    };

    using CancelTokenPtr = std::shared_ptr<CancelToken>;

    inline bool is_cancelled(const CancelToken *token) { return token != nullptr && token->cancelled(); }

} // namespace convoy
