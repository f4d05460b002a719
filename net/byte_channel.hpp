#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>

namespace Net {

/// ByteChannel
/// Bounded hand-off between one producer (network read loop) and one
/// consumer (PCM decoder). The producer blocks only when `capacity` chunks
/// are pending; cancel() wakes both sides.
class ByteChannel {
public:
    enum class Status {
        Chunk,      // `out` holds the next chunk
        Timeout,    // nothing arrived within the wait
        Closed,     // producer finished and the queue is drained
        Failed,     // producer reported an error (see error())
        Cancelled   // consumer side cancelled the stream
    };

    explicit ByteChannel(std::size_t capacity = 64);

    ByteChannel(const ByteChannel&) = delete;
    ByteChannel& operator=(const ByteChannel&) = delete;

    // --- producer side ---
    bool push(std::string chunk);          // false once closed or cancelled
    void close();                          // normal end of stream
    void fail(const std::string& error);   // error end of stream

    // --- consumer side ---
    Status pop(std::string& out, std::chrono::milliseconds wait);
    void cancel();

    // First-byte signal (set by the first non-empty push)
    bool waitFirstByte(std::chrono::milliseconds wait);
    bool firstByteSeen() const;

    bool isCancelled() const;
    bool isFinished() const;               // closed, failed or cancelled
    std::string error() const;

private:
    const std::size_t capacity_;
    mutable std::mutex mtx_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    std::condition_variable firstByteCv_;
    std::deque<std::string> queue_;
    bool closed_ = false;
    bool failed_ = false;
    bool cancelled_ = false;
    bool firstByte_ = false;
    std::string error_;
};

} // namespace Net
