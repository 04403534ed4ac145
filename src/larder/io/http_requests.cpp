#include <larder/io/http_requests.hpp>

#include <cstring>
#include <sstream>

#include <boost/algorithm/string.hpp>
#include <boost/numeric/conversion/cast.hpp>

#include <curl/curl.h>

#include <larder/utilities/logging.h>

namespace larder {

char const*
get_method_name(http_request_method method)
{
    switch (method)
    {
        case http_request_method::GET:
            return "GET";
    }
    return "GET";
}

bool
operator==(http_request const& a, http_request const& b)
{
    return a.method == b.method && a.url == b.url && a.headers == b.headers;
}
bool
operator!=(http_request const& a, http_request const& b)
{
    return !(a == b);
}

std::ostream&
operator<<(std::ostream& s, http_request const& request)
{
    s << get_method_name(request.method) << " " << request.url;
    return s;
}

bool
operator==(http_response const& a, http_response const& b)
{
    return a.status_code == b.status_code && a.headers == b.headers
           && a.body == b.body;
}
bool
operator!=(http_response const& a, http_response const& b)
{
    return !(a == b);
}

std::ostream&
operator<<(std::ostream& s, http_response const& response)
{
    s << "HTTP " << response.status_code << " (" << response.body.size
      << " bytes)";
    return s;
}

http_response
make_http_200_response(string body, string content_type)
{
    http_response response;
    response.status_code = 200;
    response.headers["Content-Type"] = std::move(content_type);
    response.body = make_string_blob(std::move(body));
    return response;
}

optional<string>
find_header(http_header_list const& headers, string const& name)
{
    for (auto const& [field, value] : headers)
    {
        if (boost::algorithm::iequals(field, name))
            return value;
    }
    return none;
}

http_request_system::http_request_system()
{
    if (curl_global_init(CURL_GLOBAL_ALL))
    {
        LARDER_THROW(http_request_system_error());
    }
}
http_request_system::~http_request_system()
{
    curl_global_cleanup();
}

struct http_connection_impl
{
    CURL* curl;
};

static void
reset_curl_connection(http_connection_impl& connection)
{
    CURL* curl = connection.curl;
    curl_easy_reset(curl);

    // Allow requests to be redirected.
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

    // Tell CURL to accept and decode gzipped responses.
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "gzip");
    curl_easy_setopt(curl, CURLOPT_HTTP_CONTENT_DECODING, 1L);

    // Enable SSL verification.
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
}

http_connection::http_connection(http_request_system&)
{
    CURL* curl = curl_easy_init();
    if (!curl)
    {
        LARDER_THROW(http_request_system_error());
    }
    impl_.reset(new http_connection_impl{curl});
}
http_connection::~http_connection()
{
    curl_easy_cleanup(impl_->curl);
}

static size_t
record_http_response(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    auto& buffer = *reinterpret_cast<string*>(userdata);
    size_t n_bytes = size * nmemb;
    buffer.append(ptr, n_bytes);
    return n_bytes;
}

struct curl_progress_data
{
    check_in_interface* check_in;
    progress_reporter_interface* reporter;
};

static int
curl_progress_callback(
    void* clientp,
    curl_off_t dltotal,
    curl_off_t dlnow,
    curl_off_t ultotal,
    curl_off_t ulnow)
{
    curl_progress_data* data = reinterpret_cast<curl_progress_data*>(clientp);
    try
    {
        (*data->check_in)();
        (*data->reporter)(
            (dltotal + ultotal == 0)
                ? 0.f
                : float(double(dlnow + ulnow) / double(dltotal + ultotal)));
    }
    catch (...)
    {
        // Aborting the transfer makes curl_easy_perform() return, and the
        // check_in() afterwards rethrows the cancellation.
        return 1;
    }
    return 0;
}

struct scoped_curl_slist
{
    ~scoped_curl_slist()
    {
        curl_slist_free_all(list);
    }
    curl_slist* list;
};

static http_header_list
parse_response_headers(string const& text)
{
    // With redirects, CURL reports the headers of every response, so only
    // the last block counts.
    http_header_list headers;
    std::istringstream stream(text);
    string line;
    while (std::getline(stream, line))
    {
        if (boost::algorithm::starts_with(line, "HTTP/"))
        {
            headers.clear();
            continue;
        }
        auto index = line.find(':');
        if (index != string::npos)
        {
            headers[boost::algorithm::trim_copy(line.substr(0, index))]
                = boost::algorithm::trim_copy(line.substr(index + 1));
        }
    }
    return headers;
}

http_response
http_connection::perform_request(
    check_in_interface& check_in,
    progress_reporter_interface& reporter,
    http_request const& request)
{
    LARDER_LOG_CALL(<< LARDER_LOG_ARG(request))

    CURL* curl = impl_->curl;
    reset_curl_connection(*impl_);

    // Set the headers for the request.
    scoped_curl_slist curl_headers;
    curl_headers.list = NULL;
    for (auto const& header : request.headers)
    {
        auto header_string = header.first + ":" + header.second;
        curl_headers.list
            = curl_slist_append(curl_headers.list, header_string.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, curl_headers.list);

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());

    // Set up for receiving the response body.
    string body;
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, record_http_response);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);

    // Set up for receiving the response headers.
    string header_text;
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, record_http_response);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &header_text);

    // Set up progress monitoring.
    curl_progress_data progress_data;
    progress_data.check_in = &check_in;
    progress_data.reporter = &reporter;
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, curl_progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &progress_data);

    // Perform the request.
    CURLcode result = curl_easy_perform(curl);

    // Check in again here because if the request was canceled inside the
    // above call, it will just look like an error. We need the cancellation
    // exception to be rethrown.
    check_in();

    // Check for low-level CURL errors.
    if (result != CURLE_OK)
    {
        LARDER_THROW(
            http_request_failure()
            << attempted_http_request_info(request)
            << internal_error_message_info(curl_easy_strerror(result)));
    }

    // Construct the response.
    http_response response;
    response.headers = parse_response_headers(header_text);
    response.body = make_string_blob(std::move(body));
    long status_code;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);
    response.status_code = boost::numeric_cast<int>(status_code);

    // Check the status code.
    if (status_code < 200 || status_code > 299)
    {
        LARDER_THROW(
            bad_http_status_code() << attempted_http_request_info(request)
                                   << http_response_info(response));
    }

    return response;
}

} // namespace larder
