#ifndef LARDER_FS_TYPES_HPP
#define LARDER_FS_TYPES_HPP

#include <filesystem>

#include <larder/core.h>

namespace larder {

// Paths to files and directories alike (cache directories, payload files,
// the ledger, config files).
typedef std::filesystem::path file_path;

} // namespace larder

#endif
