#include <larder/caching/cache_record.hpp>

#include <ostream>

#include <larder/fs/utilities.h>
#include <larder/utilities/logging.h>

namespace larder {

optional<transformation_type>
transformation_type_from_id(integer id)
{
    switch (id)
    {
        case 0:
            return transformation_type::CENTER_CROP;
        case 1:
            return transformation_type::RESIZE;
        case 2:
            return transformation_type::CIRCLE_CROP;
        default:
            return none;
    }
}

char const*
get_transformation_name(transformation_type type)
{
    switch (type)
    {
        case transformation_type::CENTER_CROP:
            return "center_crop";
        case transformation_type::RESIZE:
            return "resize";
        case transformation_type::CIRCLE_CROP:
            return "circle_crop";
    }
    return "unknown";
}

std::ostream&
operator<<(std::ostream& s, transformation_type type)
{
    s << get_transformation_name(type);
    return s;
}

bool
operator==(cache_record const& a, cache_record const& b)
{
    return a.key == b.key && a.file_name == b.file_name && a.size == b.size
           && a.timestamp == b.timestamp
           && a.applied_transformations == b.applied_transformations;
}
bool
operator!=(cache_record const& a, cache_record const& b)
{
    return !(a == b);
}

std::ostream&
operator<<(std::ostream& s, cache_record const& record)
{
    s << "{ key: " << record.key << ", file_name: " << record.file_name
      << ", size: " << record.size << ", timestamp: " << record.timestamp
      << ", applied_transformations: [";
    bool first = true;
    for (auto type : record.applied_transformations)
    {
        if (!first)
            s << ", ";
        s << type;
        first = false;
    }
    s << "] }";
    return s;
}

void
report_deletion_failure(
    file_path const& path,
    std::error_code const& error,
    deletion_warning_handler const& on_failure)
{
    if (on_failure)
    {
        on_failure(path, error);
    }
    else
    {
        get_logger()->warn(
            "unable to delete cache file {}: {}",
            path.string(),
            error.message());
    }
}

void
remove_payload_file(
    file_path const& path, deletion_warning_handler const& on_failure)
{
    auto error = remove_file_if_present(path);
    if (error)
        report_deletion_failure(path, error, on_failure);
}

} // namespace larder
