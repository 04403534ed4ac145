#include <larder/utilities/logging.h>

#include <mutex>
#include <vector>

#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace larder {

static std::mutex logger_registration_mutex;

void
initialize_logging(
    optional<string> const& log_file, spdlog::level::level_enum level)
{
    std::scoped_lock<std::mutex> lock(logger_registration_mutex);

    auto existing = spdlog::get("larder");
    if (existing)
    {
        existing->set_level(level);
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(
        std::make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>());
    if (log_file)
    {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            *log_file, 262144, 2));
    }
    auto combined_logger
        = std::make_shared<spdlog::logger>("larder", begin(sinks), end(sinks));
    combined_logger->set_level(level);
    spdlog::register_logger(combined_logger);
}

std::shared_ptr<spdlog::logger>
get_logger()
{
    auto logger = spdlog::get("larder");
    if (logger)
        return logger;

    std::scoped_lock<std::mutex> lock(logger_registration_mutex);
    logger = spdlog::get("larder");
    if (!logger)
        logger = spdlog::stdout_color_mt("larder");
    return logger;
}

} // namespace larder
