#include "runtime/event_stream.hpp"

#include <algorithm>
#include <utility>

namespace strand::runtime {

EventChannel::EventChannel(const std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

bool EventChannel::emit(protocol::AgentEvent event) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this]() { return closed_ || queue_.size() < capacity_; });
    if (closed_) {
        return false;
    }
    queue_.push_back(std::move(event));
    not_empty_.notify_one();
    return true;
}

std::optional<protocol::AgentEvent> EventChannel::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this]() { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
        return std::nullopt;
    }
    protocol::AgentEvent event = std::move(queue_.front());
    queue_.pop_front();
    not_full_.notify_one();
    return event;
}

void EventChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

bool EventChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t EventChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

EventStream::EventStream(const std::size_t capacity, protocol::CancelToken cancel_token,
                         Producer producer)
    : channel_(std::make_shared<EventChannel>(capacity)),
      cancel_token_(cancel_token ? std::move(cancel_token)
                                 : std::make_shared<std::atomic_bool>(false)) {
    auto channel = channel_;
    producer_ = std::thread([channel, producer = std::move(producer)]() {
        producer(*channel);
        channel->close();
    });
}

EventStream::~EventStream() {
    if (!finished_) {
        cancel();
    }
    // Unblocks a producer waiting on a full channel.
    channel_->close();
    if (producer_.joinable()) {
        producer_.join();
    }
}

std::optional<protocol::AgentEvent> EventStream::next() {
    if (finished_) {
        return std::nullopt;
    }
    auto event = channel_->pop();
    if (!event.has_value() || protocol::is_terminal(event.value())) {
        finished_ = true;
    }
    return event;
}

void EventStream::cancel() {
    cancel_token_->store(true);
}

}  // namespace strand::runtime
