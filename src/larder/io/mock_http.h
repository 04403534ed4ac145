#ifndef LARDER_IO_MOCK_HTTP_H
#define LARDER_IO_MOCK_HTTP_H

#include <mutex>
#include <vector>

#include <larder/io/http_requests.hpp>

namespace larder {

// An exchange in a mock HTTP script. If :failure is set, the request fails
// at the transport level with that message (as if the server couldn't be
// reached) rather than producing :response.
struct mock_http_exchange
{
    http_request request;
    http_response response;
    optional<string> failure = none;
};

typedef std::vector<mock_http_exchange> mock_http_script;

// A mock_http_session holds a script of expected exchanges. Connections made
// from it match incoming requests against the script (in any order), and
// each exchange is consumed as it's used.
struct mock_http_session
{
    mock_http_session()
    {
    }

    mock_http_session(mock_http_script script)
    {
        set_script(std::move(script));
    }

    // Set the script of expected exchanges for this mock HTTP session.
    void
    set_script(mock_http_script script);

    // Have all exchanges in the script been executed?
    bool
    is_complete() const;

    // Has the script been executed in order so far?
    bool
    is_in_order() const;

    // the number of requests that have been made through this session
    std::size_t
    request_count() const;

 private:
    friend struct mock_http_connection;

    mutable std::mutex mutex_;

    mock_http_script script_;

    // Has the script been executed in order so far?
    bool in_order_ = true;

    std::size_t request_count_ = 0;
};

struct mock_http_connection : http_connection_interface
{
    mock_http_connection(mock_http_session& session) : session_(session)
    {
    }

    http_response
    perform_request(
        check_in_interface& check_in,
        progress_reporter_interface& reporter,
        http_request const& request) override;

 private:
    mock_http_session& session_;
};

} // namespace larder

#endif
