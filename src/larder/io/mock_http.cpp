#include <larder/io/mock_http.h>

#include <algorithm>

#include <larder/utilities/errors.h>

namespace larder {

void
mock_http_session::set_script(mock_http_script script)
{
    std::scoped_lock<std::mutex> lock(mutex_);
    script_ = std::move(script);
    in_order_ = true;
}

bool
mock_http_session::is_complete() const
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return script_.empty();
}

bool
mock_http_session::is_in_order() const
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return in_order_;
}

std::size_t
mock_http_session::request_count() const
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return request_count_;
}

http_response
mock_http_connection::perform_request(
    check_in_interface& check_in,
    progress_reporter_interface& reporter,
    http_request const& request)
{
    check_in();

    mock_http_exchange exchange;
    {
        std::scoped_lock<std::mutex> lock(session_.mutex_);
        ++session_.request_count_;
        auto match = std::ranges::find_if(
            session_.script_,
            [&](auto const& exchange) { return exchange.request == request; });
        if (match == session_.script_.end())
        {
            LARDER_THROW(
                internal_check_failed() << internal_error_message_info(
                    "unrecognized mock HTTP request"));
        }
        if (match != session_.script_.begin())
            session_.in_order_ = false;
        exchange = std::move(*match);
        session_.script_.erase(match);
    }

    if (exchange.failure)
    {
        LARDER_THROW(
            http_request_failure()
            << attempted_http_request_info(request)
            << internal_error_message_info(*exchange.failure));
    }

    reporter(1);

    auto& response = exchange.response;
    if (response.status_code < 200 || response.status_code > 299)
    {
        LARDER_THROW(
            bad_http_status_code() << attempted_http_request_info(request)
                                   << http_response_info(response));
    }
    return response;
}

} // namespace larder
