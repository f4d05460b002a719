#include "stream_handle.hpp"
#include "logger.hpp"

#include <exception>

namespace Net {

StreamHandle::StreamHandle(Producer producer, std::size_t capacity)
    : channel_(capacity) {
    producer_ = std::thread([this, producer = std::move(producer)]() {
        try {
            producer(channel_, cancelled_);
        } catch (const std::exception& e) {
            LOG_ERROR("Stream", std::string("Producer failed: ") + e.what());
            channel_.fail(e.what());
            return;
        } catch (...) {
            LOG_ERROR("Stream", "Producer failed with a non-standard exception");
            channel_.fail("unknown producer error");
            return;
        }
        // Producer forgot to finish the stream
        if (!channel_.isFinished()) channel_.close();
    });
}

StreamHandle::~StreamHandle() {
    cancel();
}

void StreamHandle::cancel() {
    if (!cancelled_.exchange(true)) {
        channel_.cancel();
    }
    if (producer_.joinable() && producer_.get_id() != std::this_thread::get_id()) {
        producer_.join();
    }
}

} // namespace Net
