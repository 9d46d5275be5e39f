#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include "protocol/event_contract.hpp"
#include "protocol/execution_contract.hpp"

namespace strand::runtime {

class EventSink {
public:
    virtual ~EventSink() = default;

    // Returns false once nobody is listening any more.
    virtual bool emit(protocol::AgentEvent event) = 0;
};

// Bounded FIFO between one producer and one consumer. A full channel blocks
// the producer; events are never dropped while the channel is open.
class EventChannel : public EventSink {
public:
    explicit EventChannel(std::size_t capacity);

    bool emit(protocol::AgentEvent event) override;

    // Blocks until an event is available. Empty once closed and drained.
    std::optional<protocol::AgentEvent> pop();

    void close();
    bool closed() const;
    std::size_t size() const;

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<protocol::AgentEvent> queue_;
    bool closed_ = false;
};

// Consumer handle for one streaming generation. The producer runs on a
// thread owned by the stream; destroying an unfinished stream cancels the
// generation and waits for the producer to exit.
class EventStream {
public:
    using Producer = std::function<void(EventSink& sink)>;

    EventStream(std::size_t capacity, protocol::CancelToken cancel_token, Producer producer);
    ~EventStream();

    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    // Next event in emission order; nullopt after the terminal event.
    std::optional<protocol::AgentEvent> next();

    void cancel();
    bool finished() const { return finished_; }

private:
    std::shared_ptr<EventChannel> channel_;
    protocol::CancelToken cancel_token_;
    std::thread producer_;
    bool finished_ = false;
};

}  // namespace strand::runtime
