#ifndef LARDER_CACHING_CACHE_RECORD_HPP
#define LARDER_CACHING_CACHE_RECORD_HPP

#include <functional>
#include <system_error>
#include <vector>

#include <larder/core.h>
#include <larder/fs/types.hpp>
#include <larder/utilities/errors.h>

namespace larder {

// Identifies a kind of image transformation whose effect may be baked into
// a cached payload. The numeric values are part of the ledger format.
enum class transformation_type
{
    CENTER_CROP = 0,
    RESIZE = 1,
    CIRCLE_CROP = 2
};

// Get the transformation_type with the given numeric ID (if there is one).
optional<transformation_type>
transformation_type_from_id(integer id);

inline integer
get_transformation_id(transformation_type type)
{
    return static_cast<integer>(type);
}

char const*
get_transformation_name(transformation_type type);

std::ostream&
operator<<(std::ostream& s, transformation_type type);

typedef std::vector<transformation_type> transformation_type_list;

// the metadata that a disk cache keeps for each stored payload
struct cache_record
{
    // the key for the entry (in practice, the URL it was fetched from)
    string key;

    // the name of the payload file, relative to the cache directory
    string file_name;

    // the size of the payload (in bytes)
    integer size = 0;

    // the last time the entry was stored or accessed, in milliseconds since
    // the epoch (strictly increasing within a cache)
    integer timestamp = 0;

    // transformations whose effects are already present in the payload
    transformation_type_list applied_transformations;
};

bool
operator==(cache_record const& a, cache_record const& b);
bool
operator!=(cache_record const& a, cache_record const& b);

std::ostream&
operator<<(std::ostream& s, cache_record const& record);

// an entry as returned by a disk cache lookup
struct disk_cache_entry
{
    cache_record record;

    // the absolute path of the payload file
    file_path path;
};

// This exception indicates a failure in the operation of the disk cache.
LARDER_DEFINE_EXCEPTION(disk_cache_failure)
// This provides the path to the disk cache directory.
LARDER_DEFINE_ERROR_INFO(file_path, disk_cache_path)
// This exception also provides internal_error_message_info.

// Called when a payload file exists but couldn't be deleted.
// The cache drops its record for the file regardless.
typedef std::function<void(file_path const& path, std::error_code const& error)>
    deletion_warning_handler;

// Report a failure to delete :path to :on_failure (or log it, if that's
// empty).
void
report_deletion_failure(
    file_path const& path,
    std::error_code const& error,
    deletion_warning_handler const& on_failure);

// Delete a payload file. A file that's already gone is fine. Any other
// failure is reported to :on_failure (or logged, if that's empty).
void
remove_payload_file(
    file_path const& path, deletion_warning_handler const& on_failure);

} // namespace larder

#endif
