#ifndef MODLINT_CHANNEL_HPP
#define MODLINT_CHANNEL_HPP

/**
 * @file channel.hpp
 * @brief Many-producer, single-consumer message queue.
 *
 * Workers send() results; the coordinator drains them with try_receive(),
 * which never blocks. The consumer decides what to do on an empty channel
 * (run a pool task, yield), so there is no blocking receive.
 */

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace modlint::parallel {

    template<typename T>
    class Channel {
    public:
        Channel() = default;

        Channel(const Channel&) = delete;
        Channel& operator=(const Channel&) = delete;

        void send(T message) {
            std::lock_guard lock(mutex_);
            queue_.push_back(std::move(message));
        }

        /**
         * Pops the oldest message, or returns std::nullopt if none is queued.
         */
        std::optional<T> try_receive() {
            std::lock_guard lock(mutex_);
            if (queue_.empty()) {
                return std::nullopt;
            }
            std::optional<T> message(std::move(queue_.front()));
            queue_.pop_front();
            return message;
        }

        [[nodiscard]] std::size_t size() const {
            std::lock_guard lock(mutex_);
            return queue_.size();
        }

        [[nodiscard]] bool empty() const {
            return size() == 0;
        }

    private:
        mutable std::mutex mutex_;
        std::deque<T> queue_;
    };

}  // namespace modlint::parallel

#endif // MODLINT_CHANNEL_HPP
