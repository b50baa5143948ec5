// src/pump/chunk_channel.hpp
// ChunkChannel - unbounded single-producer/single-consumer chunk queue
//
// The only state shared between the outbound pump thread and the bridge
// loop. Both ends are RAII handles:
//   ChunkSender    destroyed  -> receiver sees DISCONNECTED once drained
//   ChunkReceiver  destroyed  -> send() returns false
//
// No back-pressure: a slow consumer lets the queue grow without bound.

#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace wspump {
namespace pump {

using Chunk = std::vector<uint8_t>;

enum class RecvStatus {
    CHUNK,          // A chunk was dequeued
    EMPTY,          // Nothing queued, sender still alive
    DISCONNECTED,   // Nothing queued and the sender is gone
};

namespace detail {

struct ChannelState {
    std::mutex mutex;
    std::deque<Chunk> queue;
    bool sender_alive = true;
    bool receiver_alive = true;
};

}  // namespace detail

class ChunkSender {
public:
    ChunkSender() = default;
    explicit ChunkSender(std::shared_ptr<detail::ChannelState> state) : state_(std::move(state)) {}

    ~ChunkSender() {
        close();
    }

    ChunkSender(const ChunkSender&) = delete;
    ChunkSender& operator=(const ChunkSender&) = delete;
    ChunkSender(ChunkSender&&) noexcept = default;

    ChunkSender& operator=(ChunkSender&& other) noexcept {
        if (this != &other) {
            close();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    /**
     * Enqueue a chunk
     *
     * @return false if the receiver has been dropped (chunk discarded)
     */
    bool send(Chunk chunk) {
        if (!state_) return false;
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->receiver_alive) {
            return false;
        }
        state_->queue.push_back(std::move(chunk));
        return true;
    }

    void close() {
        if (!state_) return;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->sender_alive = false;
        }
        state_.reset();
    }

private:
    std::shared_ptr<detail::ChannelState> state_;
};

class ChunkReceiver {
public:
    ChunkReceiver() = default;
    explicit ChunkReceiver(std::shared_ptr<detail::ChannelState> state) : state_(std::move(state)) {}

    ~ChunkReceiver() {
        close();
    }

    ChunkReceiver(const ChunkReceiver&) = delete;
    ChunkReceiver& operator=(const ChunkReceiver&) = delete;
    ChunkReceiver(ChunkReceiver&&) noexcept = default;

    ChunkReceiver& operator=(ChunkReceiver&& other) noexcept {
        if (this != &other) {
            close();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    /**
     * Non-blocking receive
     *
     * Queued chunks are always delivered before DISCONNECTED is reported.
     */
    RecvStatus try_recv(Chunk& out) {
        if (!state_) return RecvStatus::DISCONNECTED;
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->queue.empty()) {
            out = std::move(state_->queue.front());
            state_->queue.pop_front();
            return RecvStatus::CHUNK;
        }
        return state_->sender_alive ? RecvStatus::EMPTY : RecvStatus::DISCONNECTED;
    }

    size_t pending() const {
        if (!state_) return 0;
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->queue.size();
    }

    /**
     * Drop the receiving end; queued chunks are discarded
     */
    void close() {
        if (!state_) return;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->receiver_alive = false;
            state_->queue.clear();
        }
        state_.reset();
    }

private:
    std::shared_ptr<detail::ChannelState> state_;
};

/**
 * Create a connected sender/receiver pair
 */
inline std::pair<ChunkSender, ChunkReceiver> make_chunk_channel() {
    auto state = std::make_shared<detail::ChannelState>();
    return {ChunkSender(state), ChunkReceiver(state)};
}

}  // namespace pump
}  // namespace wspump
