#ifndef LARDER_UTILITIES_CONCURRENCY_TESTING_H
#define LARDER_UTILITIES_CONCURRENCY_TESTING_H

#include <chrono>
#include <thread>

namespace larder {

// Poll :condition (every millisecond) until it returns true or :timeout
// passes. The result is whether it became true in time.
template<class Condition>
bool
occurs_soon(
    Condition&& condition,
    std::chrono::milliseconds timeout = std::chrono::seconds(1))
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!condition())
    {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

} // namespace larder

#endif
