#include <larder/caching/command_queue.h>

#include <atomic>
#include <thread>
#include <vector>

#include <larder/caching/cache_record.hpp>
#include <larder/utilities/concurrency_testing.h>
#include <larder/utilities/testing.h>

using namespace larder;

template<class Function>
static std::future<std::invoke_result_t<Function>>
push_command(cache_command_queue& queue, Function function)
{
    typedef std::invoke_result_t<Function> result_type;
    auto command
        = std::make_unique<typed_cache_command<result_type, Function>>(
            std::move(function));
    auto future = command->get_future();
    queue.push(std::move(command));
    return future;
}

TEST_CASE("command queue ordering", "[caching][command_queue]")
{
    cache_command_queue queue(16);
    std::vector<int> executed;
    auto a = push_command(queue, [&] {
        executed.push_back(1);
        return 1;
    });
    auto b = push_command(queue, [&] { executed.push_back(2); });
    auto c = push_command(queue, [&]() -> int {
        LARDER_THROW(disk_cache_failure());
    });
    REQUIRE(queue.size() == 3);

    for (int i = 0; i != 3; ++i)
        queue.pop()->execute();

    REQUIRE(executed == std::vector<int>{1, 2});
    REQUIRE(a.get() == 1);
    b.get();
    REQUIRE_THROWS_AS(c.get(), disk_cache_failure);
}

TEST_CASE("command queue shutdown", "[caching][command_queue]")
{
    cache_command_queue queue(16);
    bool executed = false;
    auto pending = push_command(queue, [&] { executed = true; });

    queue.shut_down();
    REQUIRE(queue.pop() == nullptr);
    REQUIRE_THROWS_AS(pending.get(), disk_cache_shut_down);

    // Anything pushed afterwards is abandoned immediately.
    auto late = push_command(queue, [&] { executed = true; });
    REQUIRE_THROWS_AS(late.get(), disk_cache_shut_down);
    REQUIRE(!executed);
}

TEST_CASE("command queue worker", "[caching][command_queue]")
{
    cache_command_queue queue(2);
    std::atomic<int> executed(0);
    std::thread worker([&] {
        while (auto command = queue.pop())
            command->execute();
    });

    // Far more commands than the queue can hold at once.
    std::vector<std::future<int>> results;
    for (int i = 0; i != 100; ++i)
    {
        results.push_back(push_command(queue, [&executed, i] {
            ++executed;
            return i * 2;
        }));
    }
    for (int i = 0; i != 100; ++i)
        REQUIRE(results[i].get() == i * 2);
    REQUIRE(executed.load() == 100);

    queue.shut_down();
    worker.join();
}

TEST_CASE("full command queue", "[caching][command_queue]")
{
    cache_command_queue queue(1);
    auto first = push_command(queue, [] { return 1; });

    // Pushing into a full queue blocks until there's room.
    std::atomic<bool> pushed(false);
    std::future<int> second;
    std::thread pusher([&] {
        second = push_command(queue, [] { return 2; });
        pushed = true;
    });
    REQUIRE(
        !occurs_soon(
            [&] { return pushed.load(); }, std::chrono::milliseconds(50)));

    queue.pop()->execute();
    REQUIRE(occurs_soon([&] { return pushed.load(); }));
    pusher.join();
    queue.pop()->execute();

    REQUIRE(first.get() == 1);
    REQUIRE(second.get() == 2);
}
