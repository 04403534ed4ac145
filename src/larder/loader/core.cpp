#include <larder/loader/core.h>

#include <algorithm>
#include <atomic>

#include <cppcoro/async_scope.hpp>
#include <cppcoro/static_thread_pool.hpp>
#include <cppcoro/sync_wait.hpp>

#include <larder/fs/file_io.h>
#include <larder/imaging/png_codec.h>
#include <larder/utilities/logging.h>

namespace larder {

struct image_loader_impl
{
    larder::disk_cache cache;

    request_gate gate;

    std::shared_ptr<image_fetcher_interface> fetcher;

    std::shared_ptr<image_codec_interface> codec;

    // the workers that process requests
    cppcoro::static_thread_pool pool;

    // requests issued through load_into()
    cppcoro::async_scope scope;

    std::atomic<bool> shutting_down = false;
};

// Active requests are aborted with this when they notice that the loader is
// shutting down.
LARDER_DEFINE_EXCEPTION(image_loader_shut_down)

static void
check_in(image_loader_impl& loader)
{
    if (loader.shutting_down)
        LARDER_THROW(image_loader_shut_down());
}

namespace {

// Tracks (and logs) the state of a request.
struct request_tracker
{
    string const& key;
    request_state state = request_state::ADMITTING;

    void
    enter(request_state next)
    {
        get_logger()->debug(
            "request for {}: {} -> {}",
            key,
            get_request_state_name(state),
            get_request_state_name(next));
        state = next;
    }
};

} // namespace

static load_result
make_failure(string const& key, string message)
{
    load_result result;
    result.key = key;
    result.status = load_status::FAILED;
    result.error = std::move(message);
    return result;
}

static load_result
make_completion(string const& key, transformation_outcome outcome)
{
    load_result result;
    result.key = key;
    result.status = load_status::COMPLETED;
    result.image = std::move(outcome.image);
    result.applied = std::move(outcome.applied);
    result.skipped = std::move(outcome.skipped);
    return result;
}

// Read and decode a cached image. If that fails, the result is none (and a
// payload that can't be decoded is dropped from the cache).
static optional<bitmap>
read_cached_image(image_loader_impl& loader, disk_cache_entry const& entry)
{
    string data;
    try
    {
        data = read_file_contents(entry.path);
    }
    catch (open_file_error&)
    {
        // The entry was evicted after it was looked up.
        get_logger()->warn(
            "cached file for {} disappeared; refetching", entry.record.key);
        return none;
    }
    try
    {
        return loader.codec->decode(make_string_blob(std::move(data)));
    }
    catch (image_decoding_failure& e)
    {
        get_logger()->warn(
            "cached file for {} couldn't be decoded; dropping it\n{}",
            entry.record.key,
            boost::diagnostic_information(e));
        loader.cache.remove(entry.record.key);
        return none;
    }
}

static load_result
serve_from_cache(
    image_loader_impl& loader,
    load_request const& request,
    disk_cache_entry const& entry,
    bitmap image,
    request_tracker& tracker)
{
    tracker.enter(request_state::CACHE_HIT);
    auto const& baked = entry.record.applied_transformations;
    auto outcome
        = apply_transformations(request.transformations, std::move(image), baked);

    if (request.strategy == save_strategy::SAVE_TRANSFORMED
        && !outcome.applied.empty())
    {
        check_in(loader);
        tracker.enter(request_state::PERSISTING);
        auto all_applied = baked;
        all_applied.insert(
            all_applied.end(), outcome.applied.begin(), outcome.applied.end());
        loader.cache.store(
            request.key, loader.codec->encode(outcome.image), all_applied);
    }

    tracker.enter(request_state::COMPLETED);
    auto result = make_completion(request.key, std::move(outcome));
    result.from_cache = true;
    return result;
}

static load_result
fail(request_tracker& tracker, string message)
{
    get_logger()->warn("request for {} failed: {}", tracker.key, message);
    tracker.enter(request_state::FAILED);
    return make_failure(tracker.key, std::move(message));
}

static load_result
fetch_and_populate(
    image_loader_impl& loader,
    load_request const& request,
    request_tracker& tracker)
{
    tracker.enter(request_state::FETCHING);
    auto response = loader.fetcher->fetch(request.key);
    if (response.status_code < 200 || response.status_code > 299)
    {
        return fail(
            tracker,
            "HTTP status " + std::to_string(response.status_code));
    }
    if (!response.content_type)
        return fail(tracker, "response has no content type");
    if (!loader.codec->supports(*response.content_type))
        return fail(tracker, "unsupported content type: " + *response.content_type);
    auto image = loader.codec->decode(response.body);
    check_in(loader);

    tracker.enter(request_state::TRANSFORMING);
    auto outcome
        = apply_transformations(request.transformations, std::move(image));
    check_in(loader);

    tracker.enter(request_state::PERSISTING);
    optional<disk_cache_entry> stored;
    if (request.strategy == save_strategy::SAVE_TRANSFORMED
        && !outcome.applied.empty())
    {
        stored = loader.cache.store(
            request.key, loader.codec->encode(outcome.image), outcome.applied);
    }
    else
    {
        stored = loader.cache.store(request.key, response.body);
    }
    if (!stored)
        get_logger()->info("{} was served but not cached", request.key);

    tracker.enter(request_state::COMPLETED);
    return make_completion(request.key, std::move(outcome));
}

static load_result
process_request(image_loader_impl& loader, load_request const& request)
{
    request_tracker tracker{request.key};
    try
    {
        check_in(loader);
        tracker.enter(request_state::CACHE_LOOKUP);
        auto entry = loader.cache.get(request.key);
        if (entry)
        {
            auto image = read_cached_image(loader, *entry);
            if (image)
            {
                return serve_from_cache(
                    loader, request, *entry, std::move(*image), tracker);
            }
        }
        check_in(loader);
        return fetch_and_populate(loader, request, tracker);
    }
    catch (image_loader_shut_down&)
    {
        return fail(tracker, "the loader has shut down");
    }
    catch (std::exception& e)
    {
        get_logger()->error(
            "error processing request for {}\n{}",
            request.key,
            boost::diagnostic_information(e));
        tracker.enter(request_state::FAILED);
        return make_failure(request.key, e.what());
    }
}

static void
deliver(delivery_mode const& delivery, load_result const& result)
{
    auto const* sink = std::get_if<sink_delivery>(&delivery);
    if (!sink || !sink->sink)
        return;
    try
    {
        sink->sink(result);
    }
    catch (std::exception& e)
    {
        get_logger()->error(
            "result sink for {} threw an exception: {}", result.key, e.what());
    }
}

static cppcoro::task<load_result>
finish_immediately(load_request request, load_result result)
{
    deliver(request.delivery, result);
    co_return result;
}

static cppcoro::task<load_result>
run_request(
    image_loader_impl& loader, load_request request, admission_ticket ticket)
{
    co_await loader.pool.schedule();
    auto result = process_request(loader, request);
    // The key is released before delivery so that the sink can issue a
    // follow-up request for it.
    ticket.release();
    deliver(request.delivery, result);
    co_return result;
}

image_loader::image_loader(
    image_loader_config const& config,
    std::shared_ptr<image_fetcher_interface> fetcher,
    std::shared_ptr<image_codec_interface> codec)
{
    impl_.reset(new image_loader_impl{
        .cache = larder::disk_cache(config.cache),
        .fetcher = std::move(fetcher),
        .codec = codec ? std::move(codec) : std::make_shared<png_codec>(),
        .pool = cppcoro::static_thread_pool(static_cast<std::uint32_t>(
            std::max(integer(1), config.worker_count)))});
}

image_loader::~image_loader()
{
    if (impl_)
    {
        shut_down();
        cppcoro::sync_wait(impl_->scope.join());
    }
}

cppcoro::task<load_result>
image_loader::load(load_request request)
{
    auto& loader = *impl_;
    get_logger()->debug("request for {}: admitting", request.key);
    if (loader.shutting_down)
    {
        auto result = make_failure(request.key, "the loader has shut down");
        return finish_immediately(std::move(request), std::move(result));
    }
    auto ticket = loader.gate.admit(request.key);
    if (!ticket)
    {
        get_logger()->info(
            "request for {} rejected: already in progress", request.key);
        load_result result;
        result.key = request.key;
        result.status = load_status::IN_PROGRESS;
        return finish_immediately(std::move(request), std::move(result));
    }
    return run_request(loader, std::move(request), std::move(*ticket));
}

void
image_loader::load_into(load_request request, load_result_sink sink)
{
    request.delivery = sink_delivery{std::move(sink)};
    impl_->scope.spawn(load(std::move(request)));
}

void
image_loader::clear_cache()
{
    impl_->cache.clear();
}

void
image_loader::shut_down()
{
    if (!impl_->shutting_down.exchange(true))
        get_logger()->info("image loader shutting down");
}

bool
image_loader::is_shut_down() const
{
    return impl_->shutting_down;
}

disk_cache&
image_loader::cache()
{
    return impl_->cache;
}

request_gate&
image_loader::gate()
{
    return impl_->gate;
}

} // namespace larder
