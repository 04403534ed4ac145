#include <larder/caching/command_queue.h>

namespace larder {

cache_command_queue::cache_command_queue(std::size_t capacity)
    : capacity_(capacity != 0 ? capacity : 1)
{
}

void
cache_command_queue::push(cache_command_ptr command)
{
    {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!terminating_ && commands_.size() >= capacity_)
            not_full_.wait(lock);
        if (!terminating_)
        {
            commands_.push_back(std::move(command));
            not_empty_.notify_one();
            return;
        }
    }
    command->abandon();
}

cache_command_ptr
cache_command_queue::pop()
{
    std::unique_lock<std::mutex> lock(mutex_);
    while (!terminating_ && commands_.empty())
        not_empty_.wait(lock);
    if (terminating_)
        return nullptr;
    auto command = std::move(commands_.front());
    commands_.pop_front();
    not_full_.notify_one();
    return command;
}

void
cache_command_queue::shut_down()
{
    std::deque<cache_command_ptr> abandoned;
    {
        std::scoped_lock<std::mutex> lock(mutex_);
        terminating_ = true;
        abandoned.swap(commands_);
    }
    not_empty_.notify_all();
    not_full_.notify_all();
    for (auto& command : abandoned)
        command->abandon();
}

std::size_t
cache_command_queue::size()
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return commands_.size();
}

} // namespace larder
