#include <larder/loader/config.hpp>

#include <nlohmann/json.hpp>

#include <larder/fs/app_dirs.hpp>
#include <larder/fs/file_io.h>

namespace larder {

static void
throw_invalid_config(string const& message)
{
    LARDER_THROW(invalid_config() << internal_error_message_info(message));
}

static integer
read_positive_integer(nlohmann::json const& value, char const* field)
{
    if (!value.is_number_integer() || value.get<integer>() <= 0)
        throw_invalid_config(string(field) + " must be a positive integer");
    return value.get<integer>();
}

larder_config
parse_config(string const& json_text)
{
    nlohmann::json json;
    try
    {
        json = nlohmann::json::parse(json_text);
    }
    catch (nlohmann::json::exception& e)
    {
        throw_invalid_config(e.what());
    }
    if (!json.is_object())
        throw_invalid_config("the configuration must be a JSON object");

    larder_config config;
    for (auto const& [field, value] : json.items())
    {
        if (field == "cache_directory")
        {
            if (!value.is_string())
                throw_invalid_config("cache_directory must be a string");
            config.cache_directory = value.get<string>();
        }
        else if (field == "cache_budget")
        {
            config.cache_budget = read_positive_integer(value, "cache_budget");
        }
        else if (field == "worker_count")
        {
            config.worker_count = read_positive_integer(value, "worker_count");
        }
        else if (field == "command_queue_capacity")
        {
            config.command_queue_capacity
                = read_positive_integer(value, "command_queue_capacity");
        }
        else if (field == "log_level")
        {
            if (!value.is_string())
                throw_invalid_config("log_level must be a string");
            config.log_level = value.get<string>();
            get_log_level(config);
        }
        else if (field == "log_to_file")
        {
            if (!value.is_boolean())
                throw_invalid_config("log_to_file must be a boolean");
            config.log_to_file = value.get<bool>();
        }
        else
        {
            throw_invalid_config("unrecognized field: " + field);
        }
    }
    return config;
}

larder_config
read_config_file(file_path const& path)
{
    try
    {
        return parse_config(read_file_contents(path));
    }
    catch (boost::exception& e)
    {
        e << config_path_info(path);
        throw;
    }
}

optional<file_path>
find_config_file()
{
    return search_in_path(get_config_search_path("larder"), "config.json");
}

spdlog::level::level_enum
get_log_level(larder_config const& config)
{
    auto level = spdlog::level::from_str(config.log_level);
    // from_str() maps anything it doesn't recognize to "off".
    if (level == spdlog::level::off && config.log_level != "off")
        throw_invalid_config("unrecognized log level: " + config.log_level);
    return level;
}

disk_cache_config
make_disk_cache_config(larder_config const& config)
{
    disk_cache_config cache_config;
    cache_config.directory = config.cache_directory;
    cache_config.size_limit = config.cache_budget;
    cache_config.command_queue_capacity
        = static_cast<std::size_t>(config.command_queue_capacity);
    return cache_config;
}

} // namespace larder
