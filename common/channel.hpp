#pragma once
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>

// Unbuffered hand-off between one producer and one consumer thread.
// send() returns only once the receiver has taken the value, so the producer
// runs at the consumer's pace. close() may be called from either side; it
// wakes everybody up and makes further sends fail.
template<typename T>
class Channel {
public:
    Channel() = default;
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    bool send(T value);
    std::optional<T> receive();
    void close();
    bool isClosed() const;

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::optional<T> slot_;
    uint64_t sent_ = 0;       // values placed in the slot
    uint64_t received_ = 0;   // values taken out of the slot
    bool closed_ = false;
};

template<typename T>
bool Channel<T>::send(T value) {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait(lock, [this]() {
        return closed_ || !slot_.has_value();
    });
    if (closed_) return false;

    slot_ = std::move(value);
    uint64_t ticket = ++sent_;
    cv_.notify_all();

    // rendezvous: wait for the receiver to pick it up
    cv_.wait(lock, [this, ticket]() {
        return closed_ || received_ >= ticket;
    });
    if (received_ >= ticket) return true;

    // closed before anyone took it
    slot_.reset();
    return false;
}

template<typename T>
std::optional<T> Channel<T>::receive() {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait(lock, [this]() {
        return closed_ || slot_.has_value();
    });
    if (!slot_.has_value()) return std::nullopt;

    std::optional<T> value = std::move(slot_);
    slot_.reset();
    ++received_;
    cv_.notify_all();
    return value;
}

template<typename T>
void Channel<T>::close() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        closed_ = true;
    }
    cv_.notify_all();
}

template<typename T>
bool Channel<T>::isClosed() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return closed_;
}
