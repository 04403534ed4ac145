#ifndef LARDER_LOADER_TYPES_HPP
#define LARDER_LOADER_TYPES_HPP

#include <functional>
#include <ostream>
#include <variant>

#include <larder/imaging/bitmap.hpp>
#include <larder/imaging/transformations.h>

namespace larder {

// What gets persisted when a fetched image is cached?
enum class save_strategy
{
    // the bytes exactly as they were fetched
    SAVE_ORIGINAL,
    // the image after the request's transformations were applied
    SAVE_TRANSFORMED
};

enum class load_status
{
    COMPLETED,
    FAILED,
    // Another request for the same key was already active, so this one was
    // rejected.
    IN_PROGRESS
};

char const*
get_load_status_name(load_status status);

std::ostream&
operator<<(std::ostream& s, load_status status);

// the states that a request passes through
enum class request_state
{
    ADMITTING,
    CACHE_LOOKUP,
    CACHE_HIT,
    FETCHING,
    TRANSFORMING,
    PERSISTING,
    COMPLETED,
    REJECTED,
    FAILED
};

char const*
get_request_state_name(request_state state);

struct load_result
{
    string key;

    load_status status = load_status::FAILED;

    // the final image (only present when status is COMPLETED)
    optional<bitmap> image;

    // the transformations that this request actually applied
    transformation_type_list applied;

    // the requested transformations that were skipped because the cached
    // image already reflected them
    transformation_type_list skipped;

    // Was the image served from the disk cache?
    bool from_cache = false;

    // a description of what went wrong (for FAILED results)
    optional<string> error;
};

typedef std::function<void(load_result const&)> load_result_sink;

// The result is only available through the task returned by
// image_loader::load().
struct async_delivery
{
};

// The result is also handed to :sink. The sink must tolerate being called
// after whatever it was going to display has gone away.
struct sink_delivery
{
    load_result_sink sink;
};

typedef std::variant<async_delivery, sink_delivery> delivery_mode;

struct load_request
{
    // the key for the image (its URL)
    string key;

    // transformations to apply (in order)
    transformation_list transformations;

    save_strategy strategy = save_strategy::SAVE_ORIGINAL;

    delivery_mode delivery = async_delivery();
};

} // namespace larder

#endif
