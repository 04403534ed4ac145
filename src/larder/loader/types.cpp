#include <larder/loader/types.hpp>

namespace larder {

char const*
get_load_status_name(load_status status)
{
    switch (status)
    {
        case load_status::COMPLETED:
            return "completed";
        case load_status::FAILED:
            return "failed";
        case load_status::IN_PROGRESS:
            return "in_progress";
    }
    return "unknown";
}

std::ostream&
operator<<(std::ostream& s, load_status status)
{
    s << get_load_status_name(status);
    return s;
}

char const*
get_request_state_name(request_state state)
{
    switch (state)
    {
        case request_state::ADMITTING:
            return "admitting";
        case request_state::CACHE_LOOKUP:
            return "cache_lookup";
        case request_state::CACHE_HIT:
            return "cache_hit";
        case request_state::FETCHING:
            return "fetching";
        case request_state::TRANSFORMING:
            return "transforming";
        case request_state::PERSISTING:
            return "persisting";
        case request_state::COMPLETED:
            return "completed";
        case request_state::REJECTED:
            return "rejected";
        case request_state::FAILED:
            return "failed";
    }
    return "unknown";
}

} // namespace larder
