#ifndef LARDER_LOADER_CONFIG_HPP
#define LARDER_LOADER_CONFIG_HPP

#include <spdlog/common.h>

#include <larder/caching/disk_cache.hpp>

namespace larder {

// the configuration of a larder installation
//
// This is read from a JSON object like the following (where every field is
// optional):
//
// {
//     "cache_directory": "/home/me/.cache/larder/images",
//     "cache_budget": 67108864,
//     "worker_count": 2,
//     "command_queue_capacity": 1024,
//     "log_level": "info",
//     "log_to_file": false
// }
//
struct larder_config
{
    // where cached images are stored (If omitted, this is the "images"
    // directory within the user's cache directory.)
    optional<string> cache_directory;

    // the byte budget for the disk cache
    integer cache_budget = 0x4000000;

    // how many requests can be processed concurrently
    integer worker_count = 2;

    // the capacity of the disk cache's command queue
    integer command_queue_capacity = 1024;

    // one of spdlog's level names ("trace", "debug", "info", "warning",
    // "error", "critical", "off")
    string log_level = "info";

    // Should logs also be written to a rotating file in the user's log
    // directory?
    bool log_to_file = false;
};

// This exception indicates that a configuration couldn't be parsed or had
// invalid values.
LARDER_DEFINE_EXCEPTION(invalid_config)
LARDER_DEFINE_ERROR_INFO(file_path, config_path)
// This exception also provides internal_error_message_info.

// Parse a configuration from JSON text.
larder_config
parse_config(string const& json_text);

// Read a configuration from a JSON file.
larder_config
read_config_file(file_path const& path);

// Search the user's (and the system's) configuration directories for
// larder's config.json.
optional<file_path>
find_config_file();

spdlog::level::level_enum
get_log_level(larder_config const& config);

// Get the disk cache configuration implied by :config.
disk_cache_config
make_disk_cache_config(larder_config const& config);

} // namespace larder

#endif
