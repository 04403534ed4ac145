#include <larder/loader/fetcher.h>

#include <larder/io/mock_http.h>
#include <larder/utilities/logging.h>

namespace larder {

static http_request_system&
get_http_request_system()
{
    static http_request_system the_system;
    return the_system;
}

http_image_fetcher::http_image_fetcher()
{
    // Make sure the system is initialized before any threads need it.
    get_http_request_system();
}

static http_connection_interface&
http_connection_for_thread()
{
    thread_local http_connection the_connection(get_http_request_system());
    return the_connection;
}

static fetch_response
make_fetch_response(http_response const& response)
{
    return fetch_response{
        response.status_code,
        find_header(response.headers, "Content-Type"),
        response.body};
}

fetch_response
http_image_fetcher::fetch(string const& key)
{
    null_check_in check_in;
    null_progress_reporter reporter;
    auto request = make_get_request(key);
    try
    {
        if (mock_session_)
        {
            mock_http_connection connection(*mock_session_);
            return make_fetch_response(
                connection.perform_request(check_in, reporter, request));
        }
        return make_fetch_response(http_connection_for_thread().perform_request(
            check_in, reporter, request));
    }
    catch (bad_http_status_code& e)
    {
        auto const& response = get_required_error_info<http_response_info>(e);
        get_logger()->warn(
            "GET {} returned HTTP {}", key, response.status_code);
        return make_fetch_response(response);
    }
}

} // namespace larder
