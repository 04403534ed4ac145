#ifndef LARDER_UTILITIES_LOGGING_H
#define LARDER_UTILITIES_LOGGING_H

#include <memory>
#include <sstream>
#include <type_traits>

#include <spdlog/spdlog.h>

#include <larder/core.h>

namespace larder {

// All LARDER code logs through a single spdlog logger named "larder".

// Create and register the "larder" logger (if it isn't already registered).
// Output always goes to stdout. If :log_file is provided, it also goes to a
// rotating log file at that location.
void
initialize_logging(
    optional<string> const& log_file = none,
    spdlog::level::level_enum level = spdlog::level::info);

// Get the "larder" logger.
// If nobody has initialized logging, this registers a plain stdout logger, so
// library code can always log.
std::shared_ptr<spdlog::logger>
get_logger();

namespace detail {

template<class Value>
struct arg_logger
{
    arg_logger(char const* name, Value const& value) : name(name), value(value)
    {
    }

    char const* name;
    Value const& value;
};

template<class Value>
std::ostream&
operator<<(std::ostream& stream, arg_logger<Value> arg)
{
    stream << "\n  " << arg.name << ": " << arg.value;
    return stream;
}

} // namespace detail

// Create a logger for a function call.
#define LARDER_LOG_CALL(args)                                                 \
    {                                                                         \
        auto logger = larder::get_logger();                                   \
        if (logger->should_log(spdlog::level::debug))                         \
        {                                                                     \
            std::ostringstream stream;                                        \
            stream << __func__ args;                                          \
            logger->debug(stream.str());                                      \
        }                                                                     \
    }

// Log an argument to a function call.
#define LARDER_LOG_ARG(arg)                                                   \
    larder::detail::arg_logger<                                               \
        std::remove_reference<std::remove_const<decltype(arg)>::type>::type>( \
        #arg, arg)

} // namespace larder

#endif
