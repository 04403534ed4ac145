#ifndef LARDER_FS_UTILITIES_H
#define LARDER_FS_UTILITIES_H

#include <system_error>

#include <larder/fs/types.hpp>

namespace larder {

// Remove everything in :dir (if it exists) and leave it as an empty
// directory.
void
reset_directory(file_path const& dir);

// Remove a regular file without treating its absence as an error.
// The return value is the error (if any) that prevented an existing file from
// being removed.
std::error_code
remove_file_if_present(file_path const& path);

} // namespace larder

#endif
