#ifndef LARDER_LOADER_FETCHER_H
#define LARDER_LOADER_FETCHER_H

#include <larder/io/http_requests.hpp>

namespace larder {

struct fetch_response
{
    int status_code;
    optional<string> content_type;
    blob body;
};

// An image fetcher retrieves the encoded image for a key.
// A response with a non-2xx status is returned normally. Failures that
// preclude getting a response at all are thrown.
struct image_fetcher_interface
{
    virtual ~image_fetcher_interface()
    {
    }

    virtual fetch_response
    fetch(string const& key) = 0;
};

struct mock_http_session;

// Fetches images by treating keys as URLs and issuing GET requests.
// This is safe to use from multiple threads.
struct http_image_fetcher : image_fetcher_interface
{
    // Use real HTTP connections.
    http_image_fetcher();

    // Issue requests against a mock HTTP session instead.
    explicit http_image_fetcher(mock_http_session& session)
        : mock_session_(&session)
    {
    }

    fetch_response
    fetch(string const& key) override;

 private:
    mock_http_session* mock_session_ = nullptr;
};

} // namespace larder

#endif
