#include "PrefetchSource.hpp"
#include <boost/asio/post.hpp>

PrefetchSource::PrefetchSource(std::unique_ptr<RecordSource> source, boost::asio::thread_pool& pool,
                               std::size_t queueCapacity)
    : inner(std::move(source)), streamKind(inner->kind()), capacity(queueCapacity ? queueCapacity : 1)
{
    boost::asio::post(pool, [this]() { produce(); });
}

PrefetchSource::~PrefetchSource()
{
    std::unique_lock<std::mutex> lock(mutex);
    stopping = true;
    writable.notify_all();
    readable.wait(lock, [this] { return !running; });
}

void PrefetchSource::produce()
{
    for (;;)
    {
        {
            std::unique_lock<std::mutex> lock(mutex);
            writable.wait(lock, [this] { return stopping || queue.size() < capacity; });
            if (stopping)
                break;
        }

        std::optional<RawRecord> record;
        try
        {
            record = inner->next();
        }
        catch (...)
        {
            std::lock_guard<std::mutex> lock(mutex);
            failure = std::current_exception();
            break;
        }

        std::lock_guard<std::mutex> lock(mutex);
        if (!record)
            break;
        queue.push_back(std::move(*record));
        readable.notify_one();
    }

    std::lock_guard<std::mutex> lock(mutex);
    exhausted = true;
    running = false;
    readable.notify_all();
}

std::optional<RawRecord> PrefetchSource::next()
{
    std::unique_lock<std::mutex> lock(mutex);
    readable.wait(lock, [this] { return !queue.empty() || exhausted; });

    if (!queue.empty())
    {
        RawRecord record = std::move(queue.front());
        queue.pop_front();
        writable.notify_one();
        return record;
    }

    if (failure)
    {
        std::exception_ptr error = failure;
        failure = nullptr;
        std::rethrow_exception(error);
    }
    return std::nullopt;
}
