#pragma once
#include <atomic>
#include <functional>
#include <thread>

#include "byte_channel.hpp"

namespace Net {

/// StreamHandle
/// One in-flight network audio request. The producer runs on its own
/// thread and pushes into the channel; it must close() or fail() the channel
/// when it returns, and should poll `cancelled` to abort early.
/// cancel() is synchronous and idempotent.
class StreamHandle {
public:
    using Producer = std::function<void(ByteChannel& channel, const std::atomic<bool>& cancelled)>;

    explicit StreamHandle(Producer producer, std::size_t capacity = 64);
    ~StreamHandle();

    StreamHandle(const StreamHandle&) = delete;
    StreamHandle& operator=(const StreamHandle&) = delete;

    ByteChannel& channel() { return channel_; }

    void cancel();
    bool isCancelled() const { return cancelled_.load(); }

private:
    ByteChannel channel_;
    std::atomic<bool> cancelled_{false};
    std::thread producer_;
};

} // namespace Net
