#ifndef LARDER_CACHING_COMMAND_QUEUE_H
#define LARDER_CACHING_COMMAND_QUEUE_H

#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>

#include <larder/core.h>

// This file defines the queue through which all disk cache operations are
// funneled to the single thread that owns the cache's metadata.

namespace larder {

// Commands are rejected with this once their queue has been shut down.
LARDER_DEFINE_EXCEPTION(disk_cache_shut_down)

struct cache_command_interface
{
    virtual ~cache_command_interface()
    {
    }

    // Carry out the command (on the worker thread).
    virtual void
    execute() = 0;

    // Fail the command without executing it.
    virtual void
    abandon() = 0;
};

typedef std::unique_ptr<cache_command_interface> cache_command_ptr;

// A typed_cache_command wraps a function and delivers its result (or the
// exception it throws) through a promise.
template<class Result, class Function>
struct typed_cache_command : cache_command_interface
{
    typed_cache_command(Function function) : function_(std::move(function))
    {
    }

    std::future<Result>
    get_future()
    {
        return promise_.get_future();
    }

    void
    execute()
    {
        try
        {
            if constexpr (std::is_void_v<Result>)
            {
                function_();
                promise_.set_value();
            }
            else
            {
                promise_.set_value(function_());
            }
        }
        catch (...)
        {
            // The caller rethrows this when it collects the result.
            promise_.set_exception(std::current_exception());
        }
    }

    void
    abandon()
    {
        try
        {
            LARDER_THROW(disk_cache_shut_down());
        }
        catch (...)
        {
            promise_.set_exception(std::current_exception());
        }
    }

 private:
    Function function_;
    std::promise<Result> promise_;
};

// A bounded FIFO of commands.
struct cache_command_queue : noncopyable
{
    explicit cache_command_queue(std::size_t capacity);

    // Add a command to the queue, blocking while the queue is full.
    // If the queue has been shut down, the command is abandoned instead.
    void
    push(cache_command_ptr command);

    // Wait for the next command.
    // The result is null once the queue has been shut down.
    cache_command_ptr
    pop();

    // Shut down the queue. Any commands still waiting in it are abandoned,
    // as are any that are pushed afterwards.
    void
    shut_down();

    std::size_t
    size();

 private:
    std::size_t capacity_;
    std::deque<cache_command_ptr> commands_;
    // for controlling access to the queue
    std::mutex mutex_;
    // for signalling when commands arrive
    std::condition_variable not_empty_;
    // for signalling when space frees up
    std::condition_variable not_full_;
    // flag to tell everyone that the queue is shutting down
    bool terminating_ = false;
};

} // namespace larder

#endif
