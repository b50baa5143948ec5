// src/pump/outbound_pump.hpp
// OutboundPump - background thread moving local bytes into a ChunkChannel
//
//   source.read() -> transfer buffer -> Chunk copy -> ChunkSender::send()
//
// The thread owns the read half and the sender. It ends on end-of-data, a
// read error, or when the receiver has gone away; the sender is closed on
// exit so the receiving side observes DISCONNECTED after the last chunk.

#pragma once

#include "core/log.hpp"
#include "pump/chunk_channel.hpp"
#include "transport/stream.hpp"

#include <errno.h>
#include <atomic>
#include <cstring>
#include <memory>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace wspump {
namespace pump {

class OutboundPump {
public:
    OutboundPump() : finished_(std::make_shared<std::atomic<bool>>(false)) {}

    ~OutboundPump() {
        release();
    }

    OutboundPump(const OutboundPump&) = delete;
    OutboundPump& operator=(const OutboundPump&) = delete;

    /**
     * Start the pump thread
     *
     * @param source Read half, moved into the thread
     * @param sender Channel sending side, moved into the thread
     * @param buffer_size Largest chunk produced by a single read
     * @return false if a pump is already running or the thread failed to start
     */
    template<transport::ByteSource Source>
    bool start(Source source, ChunkSender sender, size_t buffer_size) {
        if (thread_.joinable()) {
            WSPUMP_LOG_ERROR("PUMP", "Outbound pump already running");
            return false;
        }
        finished_->store(false, std::memory_order_release);

        try {
            thread_ = std::thread(run<Source>, std::move(source), std::move(sender),
                                  buffer_size, finished_);
        } catch (const std::system_error& e) {
            WSPUMP_LOG_ERROR("PUMP", "Failed to start outbound pump thread: %s", e.what());
            finished_->store(true, std::memory_order_release);
            return false;
        }
        return true;
    }

    /**
     * true once the thread has left its read loop. Raised before the sender
     * is closed, so after the receiver reports DISCONNECTED this is true and
     * release() joins.
     */
    bool finished() const {
        return finished_->load(std::memory_order_acquire);
    }

    bool running() const {
        return thread_.joinable();
    }

    /**
     * Let go of the thread: join if it already finished, otherwise detach.
     * A detached pump still owns its read half and exits on its next
     * zero or failed read.
     *
     * @return true if the thread was joined
     */
    bool release() {
        if (!thread_.joinable()) return false;
        if (finished()) {
            thread_.join();
            return true;
        }
        WSPUMP_LOG_DEBUG("PUMP", "Detaching outbound pump blocked in read");
        thread_.detach();
        return false;
    }

private:
    template<transport::ByteSource Source>
    static void run(Source source, ChunkSender sender, size_t buffer_size,
                    std::shared_ptr<std::atomic<bool>> finished) {
        std::vector<uint8_t> buf(buffer_size);
        size_t chunks = 0;

        for (;;) {
            ssize_t n = source.read(buf.data(), buf.size());
            if (n == 0) {
                WSPUMP_LOG_DEBUG("PUMP", "Local source reached end of data after %zu chunks", chunks);
                break;
            }
            if (n < 0) {
                WSPUMP_LOG_DEBUG("PUMP", "Local source read failed: %s", strerror(errno));
                break;
            }
            if (!sender.send(Chunk(buf.begin(), buf.begin() + n))) {
                break;  // Bridge loop is gone
            }
            chunks++;
        }

        // Flag first: whoever observes DISCONNECTED also observes finished()
        finished->store(true, std::memory_order_release);
        sender.close();
    }

    std::thread thread_;
    std::shared_ptr<std::atomic<bool>> finished_;
};

}  // namespace pump
}  // namespace wspump
