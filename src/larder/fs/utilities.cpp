#include <larder/fs/utilities.h>

#include <filesystem>

namespace larder {

void
reset_directory(file_path const& dir)
{
    if (exists(dir))
        remove_all(dir);
    create_directories(dir);
}

std::error_code
remove_file_if_present(file_path const& path)
{
    std::error_code error;
    std::filesystem::remove(path, error);
    // Removing a file that's already gone reports no error, but a race with
    // another deleter can still surface as "not found".
    if (error == std::errc::no_such_file_or_directory)
        error.clear();
    return error;
}

} // namespace larder
