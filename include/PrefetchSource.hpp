#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <boost/asio/thread_pool.hpp>
#include "RecordSource.hpp"

// Reads another source ahead on a thread pool worker into a bounded queue.
// Records come out in exactly the order the wrapped source produced them; an
// exception thrown by the wrapped source is rethrown from next() in its place.
class PrefetchSource : public RecordSource
{
public:
    static constexpr std::size_t DEFAULT_CAPACITY = 1024;

    PrefetchSource(std::unique_ptr<RecordSource> inner, boost::asio::thread_pool& pool,
                   std::size_t capacity = DEFAULT_CAPACITY);

    // Stops the producer and waits until it has let go of the wrapped source.
    ~PrefetchSource() override;

    PrefetchSource(PrefetchSource const&) = delete;
    PrefetchSource& operator=(PrefetchSource const&) = delete;

    std::optional<RawRecord> next() override;
    StreamKind kind() const noexcept override { return streamKind; }

private:
    std::unique_ptr<RecordSource> inner;
    StreamKind streamKind;
    std::size_t capacity;

    std::mutex mutex;
    std::condition_variable readable;
    std::condition_variable writable;
    std::deque<RawRecord> queue;
    std::exception_ptr failure;
    bool exhausted = false;
    bool stopping = false;
    bool running = true;

    void produce();
};
