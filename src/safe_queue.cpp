#include "safe_queue.h"

// ============================================================================
// Thread-Safe Queue
// ============================================================================

template <class T>
[[nodiscard]] std::optional<T> SafeQueue<T>::pop(const std::chrono::milliseconds timeout)
{
	std::unique_lock lock(mutex_);
	cv_.wait_for(lock, timeout, [this] {
		return !queue_.empty() || !running_.load(std::memory_order_relaxed);
	});

	if (queue_.empty() || !running_.load(std::memory_order_relaxed)) {
		return std::nullopt;
	}

	std::optional<T> item(std::move(queue_.front()));
	queue_.pop();
	return item;
}

template <class T>
void SafeQueue<T>::shutdown()
{
	running_.store(false, std::memory_order_relaxed);
	cv_.notify_all();
}

// Explicit instantiations
#include "command_t.h"
template class SafeQueue<Command>;
