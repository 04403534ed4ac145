#include <larder/loader/core.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <thread>

#include <cppcoro/sync_wait.hpp>

#include <larder/caching/ledger.h>
#include <larder/fs/utilities.h>
#include <larder/imaging/png_codec.h>
#include <larder/io/mock_http.h>
#include <larder/loader/fetcher.h>
#include <larder/utilities/concurrency_testing.h>
#include <larder/utilities/testing.h>

using namespace larder;

namespace {

string const test_url = "http://images.example.com/portrait.png";

blob
make_test_png(int width = 40, int height = 30)
{
    auto image = make_bitmap(width, height, rgba_color{0x20, 0x40, 0x80, 0xff});
    for (int y = 0; y != height; ++y)
        set_pixel(image, 0, y, rgba_color{0xff, 0xff, 0xff, 0xff});
    return png_codec().encode(image);
}

// Serves the same PNG for every key (after an optional delay) and counts the
// fetches.
struct counting_fetcher : image_fetcher_interface
{
    counting_fetcher(
        blob body,
        std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : body(std::move(body)), delay(delay)
    {
    }

    fetch_response
    fetch(string const& key) override
    {
        ++fetch_count;
        std::this_thread::sleep_for(delay);
        return fetch_response{200, some(string("image/png")), body};
    }

    blob body;
    std::chrono::milliseconds delay;
    std::atomic<int> fetch_count = 0;
};

// Blocks every fetch until it's opened.
struct gated_fetcher : image_fetcher_interface
{
    fetch_response
    fetch(string const& key) override
    {
        std::unique_lock<std::mutex> lock(mutex);
        ++waiting;
        opened.wait(lock, [&] { return is_open; });
        return fetch_response{200, some(string("image/png")), make_test_png()};
    }

    void
    open()
    {
        {
            std::scoped_lock<std::mutex> lock(mutex);
            is_open = true;
        }
        opened.notify_all();
    }

    std::mutex mutex;
    std::condition_variable opened;
    bool is_open = false;
    std::atomic<int> waiting = 0;
};

image_loader_config
make_loader_config(string const& cache_dir, integer budget = 0x100000)
{
    reset_directory(cache_dir);
    image_loader_config config;
    config.cache.directory = some(cache_dir);
    config.cache.size_limit = budget;
    config.worker_count = 2;
    return config;
}

load_request
make_request(
    string key,
    std::vector<transformation> transformations = {},
    save_strategy strategy = save_strategy::SAVE_ORIGINAL)
{
    load_request request;
    request.key = std::move(key);
    request.transformations = transformation_list(std::move(transformations));
    request.strategy = strategy;
    return request;
}

load_result
load_now(image_loader& loader, load_request request)
{
    return cppcoro::sync_wait(loader.load(std::move(request)));
}

// Check that nothing but the ledger is left in :dir (or that :dir is gone).
void
require_no_cached_files(file_path const& dir)
{
    if (!exists(dir))
        return;
    for (auto const& item : std::filesystem::directory_iterator(dir))
        REQUIRE(item.path().filename() == ledger_file_name);
}

} // namespace

TEST_CASE("cache misses and hits", "[loader][core]")
{
    auto fetcher = std::make_shared<counting_fetcher>(
        make_test_png(), std::chrono::milliseconds(200));
    image_loader loader(make_loader_config("loader_hits"), fetcher);

    auto start = std::chrono::steady_clock::now();
    auto miss = load_now(loader, make_request(test_url));
    auto miss_time = std::chrono::steady_clock::now() - start;
    REQUIRE(miss.status == load_status::COMPLETED);
    REQUIRE(miss.key == test_url);
    REQUIRE(!miss.from_cache);
    REQUIRE(miss.image);
    REQUIRE(miss.image->width == 40);
    REQUIRE(miss.image->height == 30);
    REQUIRE(!miss.error);
    REQUIRE(loader.cache().contains(test_url));

    start = std::chrono::steady_clock::now();
    auto hit = load_now(loader, make_request(test_url));
    auto hit_time = std::chrono::steady_clock::now() - start;
    REQUIRE(hit.status == load_status::COMPLETED);
    REQUIRE(hit.from_cache);
    REQUIRE(hit.image->pixels == miss.image->pixels);
    REQUIRE(hit_time < miss_time);

    REQUIRE(fetcher->fetch_count.load() == 1);
    // The gate shouldn't be holding onto anything.
    REQUIRE(loader.gate().active_count() == 0);
}

TEST_CASE("single-flight admission", "[loader][core]")
{
    auto fetcher = std::make_shared<counting_fetcher>(make_test_png());
    image_loader loader(make_loader_config("loader_single_flight"), fetcher);

    // Admission happens when the request is issued, so the first request
    // holds the key until it finishes.
    auto first = loader.load(make_request(test_url));
    for (int i = 0; i != 5; ++i)
    {
        auto rejected = load_now(loader, make_request(test_url));
        REQUIRE(rejected.status == load_status::IN_PROGRESS);
        REQUIRE(rejected.key == test_url);
        REQUIRE(!rejected.image);
    }
    // Other keys aren't affected.
    REQUIRE(
        load_now(loader, make_request(test_url + "?other")).status
        == load_status::COMPLETED);

    auto result = cppcoro::sync_wait(std::move(first));
    REQUIRE(result.status == load_status::COMPLETED);
    REQUIRE(fetcher->fetch_count.load() == 2);

    // Once it's done, the key can be requested again.
    REQUIRE(
        load_now(loader, make_request(test_url)).status
        == load_status::COMPLETED);
}

TEST_CASE("abandoned requests", "[loader][core]")
{
    auto fetcher = std::make_shared<counting_fetcher>(make_test_png());
    image_loader loader(make_loader_config("loader_abandoned"), fetcher);
    {
        auto task = loader.load(make_request(test_url));
        REQUIRE(loader.gate().is_active(test_url));
    }
    // Discarding the task releases the key without doing any work.
    REQUIRE(!loader.gate().is_active(test_url));
    REQUIRE(fetcher->fetch_count.load() == 0);
}

TEST_CASE("concurrent sink delivery", "[loader][core]")
{
    auto fetcher = std::make_shared<gated_fetcher>();
    image_loader loader(make_loader_config("loader_sinks"), fetcher);

    std::mutex mutex;
    std::vector<load_result> results;
    auto sink = [&](load_result const& result) {
        std::scoped_lock<std::mutex> lock(mutex);
        results.push_back(result);
    };
    auto result_count = [&] {
        std::scoped_lock<std::mutex> lock(mutex);
        return results.size();
    };

    loader.load_into(make_request(test_url), sink);
    REQUIRE(occurs_soon([&] { return fetcher->waiting == 1; }));

    // While the first request is blocked in its fetch, the others are
    // rejected (and told so right away).
    for (int i = 0; i != 4; ++i)
        loader.load_into(make_request(test_url), sink);
    REQUIRE(result_count() == 4);
    for (auto const& result : results)
        REQUIRE(result.status == load_status::IN_PROGRESS);

    fetcher->open();
    REQUIRE(occurs_soon([&] { return result_count() == 5; }));
    {
        std::scoped_lock<std::mutex> lock(mutex);
        REQUIRE(results.back().status == load_status::COMPLETED);
        REQUIRE(results.back().image);
    }
    REQUIRE(fetcher->waiting.load() == 1);
}

TEST_CASE("sinks that throw", "[loader][core]")
{
    auto fetcher = std::make_shared<counting_fetcher>(make_test_png());
    image_loader loader(make_loader_config("loader_throwing_sinks"), fetcher);
    auto request = make_request(test_url);
    request.delivery = sink_delivery{[](load_result const&) {
        throw std::runtime_error("the view is gone");
    }};
    auto result = load_now(loader, std::move(request));
    REQUIRE(result.status == load_status::COMPLETED);
}

TEST_CASE("transformations on fetched images", "[loader][core]")
{
    auto fetcher = std::make_shared<counting_fetcher>(make_test_png(400, 300));
    image_loader loader(make_loader_config("loader_transformations"), fetcher);

    auto result = load_now(
        loader,
        make_request(
            test_url,
            {center_crop{200, 200}, resize{150, 150}, circle_crop{}}));
    REQUIRE(result.status == load_status::COMPLETED);
    REQUIRE(result.image->width == 150);
    REQUIRE(result.image->height == 150);
    REQUIRE(
        result.applied
        == transformation_type_list{
            transformation_type::CENTER_CROP,
            transformation_type::RESIZE,
            transformation_type::CIRCLE_CROP});
    REQUIRE(result.skipped.empty());

    // With SAVE_ORIGINAL, the original bytes are cached, so a hit has to
    // redo the transformations.
    auto entry = loader.cache().get(test_url);
    REQUIRE(entry);
    REQUIRE(entry->record.applied_transformations.empty());
    REQUIRE(entry->record.size == integer(fetcher->body.size));

    auto hit = load_now(loader, make_request(test_url, {resize{20, 10}}));
    REQUIRE(hit.from_cache);
    REQUIRE(hit.image->width == 20);
    REQUIRE(hit.image->height == 10);
    REQUIRE(
        hit.applied == transformation_type_list{transformation_type::RESIZE});
}

TEST_CASE("saving transformed images", "[loader][core]")
{
    auto fetcher = std::make_shared<counting_fetcher>(make_test_png(400, 300));
    image_loader loader(make_loader_config("loader_save_transformed"), fetcher);
    auto make_transformed_request = [] {
        return make_request(
            test_url,
            {center_crop{100, 100}, circle_crop{}},
            save_strategy::SAVE_TRANSFORMED);
    };

    auto first = load_now(loader, make_transformed_request());
    REQUIRE(first.status == load_status::COMPLETED);
    REQUIRE(!first.from_cache);
    REQUIRE(first.applied.size() == 2);
    auto entry = loader.cache().get(test_url);
    REQUIRE(
        entry->record.applied_transformations
        == transformation_type_list{
            transformation_type::CENTER_CROP,
            transformation_type::CIRCLE_CROP});

    // The cached image already reflects everything, so nothing is redone.
    auto second = load_now(loader, make_transformed_request());
    REQUIRE(second.status == load_status::COMPLETED);
    REQUIRE(second.from_cache);
    REQUIRE(second.applied.empty());
    REQUIRE(second.skipped == first.applied);
    REQUIRE(second.image->width == 100);
    REQUIRE(second.image->pixels == first.image->pixels);
    REQUIRE(fetcher->fetch_count.load() == 1);

    // Adding a transformation applies just that one, and the cached image
    // is updated to reflect it too.
    auto third = load_now(
        loader,
        make_request(
            test_url,
            {center_crop{100, 100}, circle_crop{}, resize{50, 50}},
            save_strategy::SAVE_TRANSFORMED));
    REQUIRE(third.from_cache);
    REQUIRE(
        third.applied == transformation_type_list{transformation_type::RESIZE});
    REQUIRE(third.image->width == 50);
    entry = loader.cache().get(test_url);
    REQUIRE(entry->record.applied_transformations.size() == 3);
}

TEST_CASE("failed fetches", "[loader][core]")
{
    mock_http_session session;
    session.set_script(
        {{make_get_request("http://images.example.com/unreachable.png"),
          http_response(),
          some(string("connection refused"))},
         {make_get_request("http://images.example.com/missing.png"),
          http_response{404, {}, make_string_blob("not found")}},
         {make_get_request("http://images.example.com/page.html"),
          make_http_200_response("<html></html>", "text/html")},
         {make_get_request("http://images.example.com/untyped"),
          http_response{200, {}, make_test_png()}},
         {make_get_request("http://images.example.com/corrupt.png"),
          make_http_200_response("not really a PNG", "image/png")},
         {make_get_request("http://images.example.com/good.png"),
          http_response{
              200, {{"Content-Type", "image/png"}}, make_test_png()}}});

    auto fetcher = std::make_shared<http_image_fetcher>(session);
    image_loader loader(make_loader_config("loader_failures"), fetcher);

    for (auto url :
         {"http://images.example.com/unreachable.png",
          "http://images.example.com/missing.png",
          "http://images.example.com/page.html",
          "http://images.example.com/untyped",
          "http://images.example.com/corrupt.png"})
    {
        INFO(url);
        auto result = load_now(loader, make_request(url));
        REQUIRE(result.status == load_status::FAILED);
        REQUIRE(result.error);
        REQUIRE(!result.image);
        REQUIRE(!loader.cache().contains(url));
    }
    require_no_cached_files("loader_failures");
    REQUIRE(loader.gate().active_count() == 0);

    // A good fetch still works afterwards.
    REQUIRE(
        load_now(loader, make_request("http://images.example.com/good.png"))
            .status
        == load_status::COMPLETED);
    REQUIRE(session.is_complete());
}

TEST_CASE("URLs with semicolons", "[loader][core]")
{
    auto fetcher = std::make_shared<counting_fetcher>(make_test_png());
    image_loader loader(make_loader_config("loader_semicolons"), fetcher);
    auto url = string("http://images.example.com/img.png;jsessionid=42");

    auto miss = load_now(loader, make_request(url));
    REQUIRE(miss.status == load_status::COMPLETED);
    REQUIRE(!miss.from_cache);
    REQUIRE(miss.image);
    REQUIRE(loader.cache().contains(url));

    auto hit = load_now(loader, make_request(url));
    REQUIRE(hit.status == load_status::COMPLETED);
    REQUIRE(hit.from_cache);
    REQUIRE(fetcher->fetch_count.load() == 1);
}

TEST_CASE("failed transformations", "[loader][core]")
{
    auto fetcher = std::make_shared<counting_fetcher>(make_test_png(40, 30));
    image_loader loader(
        make_loader_config("loader_failed_transformations"), fetcher);

    // Circle crops need a square image.
    auto result = load_now(
        loader,
        make_request(test_url, {circle_crop{}}, save_strategy::SAVE_TRANSFORMED));
    REQUIRE(result.status == load_status::FAILED);
    REQUIRE(result.error);
    REQUIRE(!result.image);
    REQUIRE(fetcher->fetch_count.load() == 1);
    REQUIRE(!loader.cache().contains(test_url));
    REQUIRE(loader.gate().active_count() == 0);
    require_no_cached_files("loader_failed_transformations");
}

TEST_CASE("corrupt cached images", "[loader][core]")
{
    auto fetcher = std::make_shared<counting_fetcher>(make_test_png());
    image_loader loader(make_loader_config("loader_corrupt_cache"), fetcher);
    loader.cache().store(test_url, make_string_blob("garbage"));

    // The bad payload is dropped and the image is refetched.
    auto result = load_now(loader, make_request(test_url));
    REQUIRE(result.status == load_status::COMPLETED);
    REQUIRE(!result.from_cache);
    REQUIRE(fetcher->fetch_count.load() == 1);
    REQUIRE(
        loader.cache().get(test_url)->record.size
        == integer(fetcher->body.size));
}

TEST_CASE("images bigger than the budget", "[loader][core]")
{
    auto fetcher = std::make_shared<counting_fetcher>(make_test_png());
    image_loader loader(make_loader_config("loader_small_budget", 10), fetcher);

    // The image is still served, just not cached.
    auto result = load_now(loader, make_request(test_url));
    REQUIRE(result.status == load_status::COMPLETED);
    REQUIRE(!loader.cache().contains(test_url));
    require_no_cached_files("loader_small_budget");
}

TEST_CASE("clearing the loader's cache", "[loader][core]")
{
    auto fetcher = std::make_shared<counting_fetcher>(make_test_png());
    image_loader loader(make_loader_config("loader_clearing"), fetcher);
    load_now(loader, make_request(test_url));
    REQUIRE(loader.cache().contains(test_url));

    loader.clear_cache();
    REQUIRE(!loader.cache().contains(test_url));
    REQUIRE(!exists(file_path("loader_clearing")));

    auto result = load_now(loader, make_request(test_url));
    REQUIRE(result.status == load_status::COMPLETED);
    REQUIRE(!result.from_cache);
    REQUIRE(fetcher->fetch_count.load() == 2);
}

TEST_CASE("loader shutdown", "[loader][core]")
{
    auto fetcher = std::make_shared<counting_fetcher>(make_test_png());
    image_loader loader(make_loader_config("loader_shutdown"), fetcher);
    REQUIRE(!loader.is_shut_down());

    loader.shut_down();
    REQUIRE(loader.is_shut_down());

    auto result = load_now(loader, make_request(test_url));
    REQUIRE(result.status == load_status::FAILED);
    REQUIRE(result.error);

    optional<load_result> delivered;
    loader.load_into(
        make_request(test_url),
        [&](load_result const& result) { delivered = result; });
    REQUIRE(delivered);
    REQUIRE(delivered->status == load_status::FAILED);
    REQUIRE(fetcher->fetch_count.load() == 0);
}

TEST_CASE("shutting down with requests in flight", "[loader][core]")
{
    auto fetcher = std::make_shared<gated_fetcher>();
    image_loader loader(make_loader_config("loader_in_flight_shutdown"), fetcher);

    std::mutex mutex;
    optional<load_result> delivered;
    loader.load_into(make_request(test_url), [&](load_result const& result) {
        std::scoped_lock<std::mutex> lock(mutex);
        delivered = result;
    });
    REQUIRE(occurs_soon([&] { return fetcher->waiting == 1; }));

    // The request is blocked in its fetch when the loader shuts down. Once
    // the fetch returns, the request should fail rather than finish.
    loader.shut_down();
    fetcher->open();
    REQUIRE(occurs_soon([&] {
        std::scoped_lock<std::mutex> lock(mutex);
        return delivered.has_value();
    }));
    {
        std::scoped_lock<std::mutex> lock(mutex);
        REQUIRE(delivered->status == load_status::FAILED);
        REQUIRE(delivered->error);
        REQUIRE(!delivered->image);
    }
    REQUIRE(loader.gate().active_count() == 0);
    REQUIRE(!loader.cache().contains(test_url));
    require_no_cached_files("loader_in_flight_shutdown");
}
