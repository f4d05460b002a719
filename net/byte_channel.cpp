#include "byte_channel.hpp"

namespace Net {

ByteChannel::ByteChannel(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

bool ByteChannel::push(std::string chunk) {
    if (chunk.empty()) return true;

    std::unique_lock<std::mutex> lock(mtx_);
    notFull_.wait(lock, [&]{ return queue_.size() < capacity_ || closed_ || cancelled_; });
    if (closed_ || cancelled_) return false;

    queue_.push_back(std::move(chunk));
    if (!firstByte_) {
        firstByte_ = true;
        firstByteCv_.notify_all();
    }
    notEmpty_.notify_one();
    return true;
}

void ByteChannel::close() {
    std::lock_guard<std::mutex> lock(mtx_);
    closed_ = true;
    notEmpty_.notify_all();
    notFull_.notify_all();
    firstByteCv_.notify_all();
}

void ByteChannel::fail(const std::string& error) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (closed_) return;
    closed_ = true;
    failed_ = true;
    error_ = error;
    notEmpty_.notify_all();
    notFull_.notify_all();
    firstByteCv_.notify_all();
}

ByteChannel::Status ByteChannel::pop(std::string& out, std::chrono::milliseconds wait) {
    std::unique_lock<std::mutex> lock(mtx_);
    bool ready = notEmpty_.wait_for(lock, wait, [&]{
        return !queue_.empty() || closed_ || cancelled_;
    });

    if (cancelled_) return Status::Cancelled;
    if (!ready) return Status::Timeout;

    if (!queue_.empty()) {
        out = std::move(queue_.front());
        queue_.pop_front();
        notFull_.notify_one();
        return Status::Chunk;
    }
    return failed_ ? Status::Failed : Status::Closed;
}

void ByteChannel::cancel() {
    std::lock_guard<std::mutex> lock(mtx_);
    cancelled_ = true;
    queue_.clear();
    notEmpty_.notify_all();
    notFull_.notify_all();
    firstByteCv_.notify_all();
}

bool ByteChannel::waitFirstByte(std::chrono::milliseconds wait) {
    std::unique_lock<std::mutex> lock(mtx_);
    firstByteCv_.wait_for(lock, wait, [&]{ return firstByte_ || closed_ || cancelled_; });
    return firstByte_ && !cancelled_;
}

bool ByteChannel::firstByteSeen() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return firstByte_;
}

bool ByteChannel::isCancelled() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return cancelled_;
}

bool ByteChannel::isFinished() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return closed_ || cancelled_;
}

std::string ByteChannel::error() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return error_;
}

} // namespace Net
