#ifndef LARDER_IO_HTTP_REQUESTS_HPP
#define LARDER_IO_HTTP_REQUESTS_HPP

#include <map>
#include <memory>
#include <ostream>

#include <larder/core.h>
#include <larder/utilities/errors.h>

// This file defines a low-level facility for doing HTTP requests.

namespace larder {

// HTTP headers are specified as a mapping from field names to values.
typedef std::map<string, string> http_header_list;

// supported HTTP request methods
enum class http_request_method
{
    GET
};

char const*
get_method_name(http_request_method method);

struct http_request
{
    http_request_method method;
    string url;
    http_header_list headers;
};

bool
operator==(http_request const& a, http_request const& b);
bool
operator!=(http_request const& a, http_request const& b);

std::ostream&
operator<<(std::ostream& s, http_request const& request);

// Construct a GET request (in a convenient way).
inline http_request
make_get_request(string url, http_header_list headers = http_header_list())
{
    return http_request{
        http_request_method::GET, std::move(url), std::move(headers)};
}

struct http_response
{
    int status_code;
    http_header_list headers;
    blob body;
};

bool
operator==(http_response const& a, http_response const& b);
bool
operator!=(http_response const& a, http_response const& b);

std::ostream&
operator<<(std::ostream& s, http_response const& response);

// Make a successful (200) HTTP response with the given body and content type.
http_response
make_http_200_response(string body, string content_type = "text/plain");

// Get the value of a response header (if it's present).
// Header names are compared case-insensitively.
optional<string>
find_header(http_header_list const& headers, string const& name);

// This exception indicates a general failure in the HTTP request
// system (e.g., a failure to initialize).
LARDER_DEFINE_EXCEPTION(http_request_system_error)

// This exception indicates that a failure occurred in the processing
// of a HTTP request that precluded getting a response from the server
// (e.g., the server couldn't be reached).
LARDER_DEFINE_EXCEPTION(http_request_failure)
// This exception also provides internal_error_message_info.
LARDER_DEFINE_ERROR_INFO(http_request, attempted_http_request)

// This exception indicates that an HTTP request was resolved but
// resulted in a status code outside the 2xx range. The full response
// is included.
LARDER_DEFINE_EXCEPTION(bad_http_status_code)
// This exception also provides attempted_http_request_info.
LARDER_DEFINE_ERROR_INFO(http_response, http_response)

// http_request_system provides global initialization and shutdown of the HTTP
// request system. Exactly one of these objects must be instantiated by the
// application, and its scope must dominate the scope of all http_connection
// objects.

struct http_request_system : noncopyable
{
    http_request_system();
    ~http_request_system();
};

// http_connection provides a network connection over which HTTP requests can
// be made.

struct http_connection_interface
{
    virtual ~http_connection_interface()
    {
    }

    // Perform an HTTP request and return the response.
    // Since this may take a long time to complete, monitoring is provided.
    // Accurate progress reporting relies on the web server providing the size
    // of the response.
    virtual http_response
    perform_request(
        check_in_interface& check_in,
        progress_reporter_interface& reporter,
        http_request const& request)
        = 0;
};

struct http_connection_impl;

// A connection isn't thread-safe. Each thread needs its own.
struct http_connection : http_connection_interface
{
    http_connection(http_request_system& system);
    ~http_connection();

    http_response
    perform_request(
        check_in_interface& check_in,
        progress_reporter_interface& reporter,
        http_request const& request) override;

 private:
    std::unique_ptr<http_connection_impl> impl_;
};

} // namespace larder

#endif
