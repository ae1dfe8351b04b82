#ifndef SAFE_QUEUE_H
#define SAFE_QUEUE_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

// ============================================================================
// Thread-Safe Queue
// ============================================================================

// Commands from the input thread and from library loaders, drained by the
// I/O worker. Items may be move-only.
template <typename T>
class SafeQueue {
	std::queue<T> queue_ = {};
	mutable std::mutex mutex_;
	std::condition_variable cv_;
	std::atomic<bool> running_{true};

public:
	template <typename... Args>
	void emplace(Args&&... args)
	{
		{
			std::scoped_lock lock(mutex_);
			queue_.emplace(std::forward<Args>(args)...);
		}
		cv_.notify_one();
	}

	// Waits up to timeout; empty result on timeout or once shut down
	[[nodiscard]] std::optional<T> pop(const std::chrono::milliseconds timeout);

	// Wakes every waiter. Items still queued are dropped with the queue.
	void shutdown();
};

#endif
