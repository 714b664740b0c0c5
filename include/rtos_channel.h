/**
 * @file rtos_channel.h
 * @brief HubLink message channels - Bounded FreeRTOS queues and one-shot reply slots
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * Every actor owns a Channel<T> inbox. Messages are moved onto the heap and
 * the queue carries the pointer, so message types may hold move-only members
 * such as a ReplySender.
 *
 * Request/response round trips use a ReplySender/ReplyReceiver pair:
 *
 *   ReplySender<Outcome<DiscoveredHub>> tx;
 *   ReplyReceiver<Outcome<DiscoveredHub>> rx;
 *   makeReplyChannel(tx, rx);
 *   request.reply = std::move(tx);
 *   inbox.send(std::move(request));
 *
 *   Outcome<DiscoveredHub> outcome;
 *   Result r = rx.receive(outcome, 5000);   // OK, ERROR_TIMEOUT or ERROR_CHANNEL_CLOSED
 *
 * A ReplySender destroyed without send() closes the slot, so a caller never
 * hangs on an actor that dropped its request.
 */

#ifndef RTOS_CHANNEL_H
#define RTOS_CHANNEL_H

#include <Arduino.h>
#include <atomic>
#include <memory>
#include <utility>
#include "config.h"
#include "types.h"

/**
 * @brief Convert a millisecond timeout (WAIT_FOREVER_MS = block) to ticks
 */
inline TickType_t channelTicks(uint32_t timeoutMs) {
    return (timeoutMs == WAIT_FOREVER_MS) ? portMAX_DELAY : pdMS_TO_TICKS(timeoutMs);
}

// =============================================================================
// CHANNEL
// =============================================================================

/**
 * @brief Bounded multi-producer queue of owned messages
 */
template <typename T>
class Channel {
public:
    explicit Channel(UBaseType_t capacity) :
        _queue(xQueueCreate(capacity, sizeof(T*))),
        _closed(false),
        _dropped(0)
    {}

    ~Channel() {
        drain();
        if (_queue) {
            vQueueDelete(_queue);
        }
    }

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /**
     * @brief Enqueue a message, blocking up to timeoutMs for space
     * @return OK, ERROR_TIMEOUT (message dropped), or ERROR_CHANNEL_CLOSED
     */
    Result send(T&& item, uint32_t timeoutMs = WAIT_FOREVER_MS) {
        if (!_queue || _closed.load()) {
            return Result::ERROR_CHANNEL_CLOSED;
        }

        std::unique_ptr<T> boxed = std::make_unique<T>(std::move(item));
        T* raw = boxed.get();
        if (xQueueSend(_queue, &raw, channelTicks(timeoutMs)) != pdTRUE) {
            _dropped++;
            return Result::ERROR_TIMEOUT;
        }
        boxed.release();    // queue owns it now

        // Closed while we were blocked: nobody will read it, release it now
        if (_closed.load()) {
            drain();
        }
        return Result::OK;
    }

    /**
     * @brief Dequeue the next message
     * @return OK, ERROR_TIMEOUT, or ERROR_CHANNEL_CLOSED
     */
    Result receive(T& out, uint32_t timeoutMs = WAIT_FOREVER_MS) {
        if (!_queue || _closed.load()) {
            return Result::ERROR_CHANNEL_CLOSED;
        }

        T* raw = nullptr;
        if (xQueueReceive(_queue, &raw, channelTicks(timeoutMs)) != pdTRUE) {
            return _closed.load() ? Result::ERROR_CHANNEL_CLOSED : Result::ERROR_TIMEOUT;
        }
        if (!raw) {
            return Result::ERROR_CHANNEL_CLOSED;    // close() sentinel
        }

        std::unique_ptr<T> boxed(raw);
        out = std::move(*boxed);
        return Result::OK;
    }

    /**
     * @brief Refuse further sends and wake a blocked receiver
     */
    void close() {
        if (_closed.exchange(true)) {
            return;
        }
        T* sentinel = nullptr;
        if (_queue) {
            xQueueSend(_queue, &sentinel, 0);
        }
    }

    /**
     * @brief Destroy every queued message (closing their reply slots)
     */
    void drain() {
        if (!_queue) {
            return;
        }
        T* raw = nullptr;
        while (xQueueReceive(_queue, &raw, 0) == pdTRUE) {
            std::unique_ptr<T> boxed(raw);
        }
    }

    bool isClosed() const { return _closed.load(); }

    /**
     * @brief Messages waiting; for an actor inbox this is its contention
     */
    uint32_t pending() const { return _queue ? (uint32_t)uxQueueMessagesWaiting(_queue) : 0; }

    /**
     * @brief Messages dropped by bounded sends that timed out
     */
    uint32_t dropped() const { return _dropped.load(); }

private:
    QueueHandle_t _queue;
    std::atomic<bool> _closed;
    std::atomic<uint32_t> _dropped;
};

// =============================================================================
// ONE-SHOT REPLY
// =============================================================================

/**
 * @brief Shared slot between a ReplySender and its ReplyReceiver
 */
template <typename T>
struct ReplyState {
    SemaphoreHandle_t ready;
    T value;
    bool delivered;

    ReplyState() : ready(xSemaphoreCreateBinary()), value(), delivered(false) {}
    ~ReplyState() {
        if (ready) {
            vSemaphoreDelete(ready);
        }
    }

    ReplyState(const ReplyState&) = delete;
    ReplyState& operator=(const ReplyState&) = delete;
};

/**
 * @brief Move-only, single-use sending half of a reply slot
 */
template <typename T>
class ReplySender {
public:
    ReplySender() {}
    explicit ReplySender(std::shared_ptr<ReplyState<T>> state) : _state(std::move(state)) {}

    ReplySender(ReplySender&& other) noexcept : _state(std::move(other._state)) {}

    ReplySender& operator=(ReplySender&& other) noexcept {
        if (this != &other) {
            close();
            _state = std::move(other._state);
        }
        return *this;
    }

    ~ReplySender() { close(); }

    ReplySender(const ReplySender&) = delete;
    ReplySender& operator=(const ReplySender&) = delete;

    bool isOpen() const { return _state != nullptr; }

    /**
     * @brief Deliver the value; later calls are ignored
     */
    void send(T value) {
        if (!_state) {
            return;
        }
        std::shared_ptr<ReplyState<T>> state = std::move(_state);
        state->value = std::move(value);
        state->delivered = true;
        xSemaphoreGive(state->ready);
    }

    /**
     * @brief Close without a value; the receiver sees ERROR_CHANNEL_CLOSED
     */
    void close() {
        if (!_state) {
            return;
        }
        std::shared_ptr<ReplyState<T>> state = std::move(_state);
        xSemaphoreGive(state->ready);
    }

private:
    std::shared_ptr<ReplyState<T>> _state;
};

/**
 * @brief Receiving half of a reply slot
 */
template <typename T>
class ReplyReceiver {
public:
    ReplyReceiver() {}
    explicit ReplyReceiver(std::shared_ptr<ReplyState<T>> state) : _state(std::move(state)) {}

    /**
     * @brief Block until the sender delivers, closes, or timeoutMs passes
     * @return OK, ERROR_TIMEOUT, or ERROR_CHANNEL_CLOSED
     */
    Result receive(T& out, uint32_t timeoutMs = WAIT_FOREVER_MS) {
        if (!_state || !_state->ready) {
            return Result::ERROR_CHANNEL_CLOSED;
        }
        if (xSemaphoreTake(_state->ready, channelTicks(timeoutMs)) != pdTRUE) {
            return Result::ERROR_TIMEOUT;
        }
        if (!_state->delivered) {
            _state.reset();
            return Result::ERROR_CHANNEL_CLOSED;
        }
        out = std::move(_state->value);
        _state.reset();
        return Result::OK;
    }

private:
    std::shared_ptr<ReplyState<T>> _state;
};

/**
 * @brief Create a connected sender/receiver pair
 */
template <typename T>
void makeReplyChannel(ReplySender<T>& sender, ReplyReceiver<T>& receiver) {
    std::shared_ptr<ReplyState<T>> state = std::make_shared<ReplyState<T>>();
    sender = ReplySender<T>(state);
    receiver = ReplyReceiver<T>(state);
}

#endif // RTOS_CHANNEL_H
