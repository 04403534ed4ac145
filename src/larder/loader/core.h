#ifndef LARDER_LOADER_CORE_H
#define LARDER_LOADER_CORE_H

#include <memory>

#include <cppcoro/task.hpp>

#include <larder/background/request_gate.h>
#include <larder/caching/disk_cache.hpp>
#include <larder/imaging/codec.h>
#include <larder/loader/fetcher.h>
#include <larder/loader/types.hpp>

namespace larder {

struct image_loader_config
{
    disk_cache_config cache;

    // how many requests can be processed concurrently
    integer worker_count = 2;
};

struct image_loader_impl;

// An image_loader serves images for keys (URLs), fetching them on a miss and
// keeping them in a disk cache.
//
// At most one request per key is active at any time. A request for a key
// that's already being loaded is rejected with load_status::IN_PROGRESS.
//
struct image_loader
{
    // If :codec is omitted, images are PNGs.
    image_loader(
        image_loader_config const& config,
        std::shared_ptr<image_fetcher_interface> fetcher,
        std::shared_ptr<image_codec_interface> codec = nullptr);

    // This waits for requests issued through load_into() to finish.
    // Tasks returned by load() must not outlive the loader.
    ~image_loader();

    // Issue a request.
    //
    // Admission is decided immediately, but the work only happens when the
    // returned task is awaited. (Discarding the task without awaiting it
    // abandons the request and releases its key.)
    //
    // The task never throws. Failures are reported through the result.
    // If the request has a sink_delivery, the result is also given to its
    // sink.
    //
    cppcoro::task<load_result>
    load(load_request request);

    // Issue a request whose result is delivered to :sink.
    // The request runs in the background. (If it's rejected or the loader is
    // shut down, the sink is called before this returns.)
    void
    load_into(load_request request, load_result_sink sink);

    // Remove everything from the disk cache.
    void
    clear_cache();

    // Stop processing requests. Requests issued after this, as well as
    // active requests when they reach their next step, fail.
    void
    shut_down();

    bool
    is_shut_down() const;

    disk_cache&
    cache();

    request_gate&
    gate();

 private:
    std::unique_ptr<image_loader_impl> impl_;
};

} // namespace larder

#endif
