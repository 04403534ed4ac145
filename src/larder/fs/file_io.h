#ifndef LARDER_FS_FILE_IO_H
#define LARDER_FS_FILE_IO_H

#include <fstream>

#include <larder/core/exception.h>
#include <larder/fs/types.hpp>

namespace larder {

// Open a file into the given fstream. Throw an error if the open operation
// fails, and enable the exception bits on the fstream so that subsequent
// failures will throw exceptions.
void
open_file(std::fstream& file, file_path const& path, std::ios::openmode mode);
void
open_file(std::ifstream& file, file_path const& path, std::ios::openmode mode);
void
open_file(std::ofstream& file, file_path const& path, std::ios::openmode mode);

// If the above fails, it throws the following exception.
LARDER_DEFINE_EXCEPTION(open_file_error)
LARDER_DEFINE_ERROR_INFO(file_path, file_path)
LARDER_DEFINE_ERROR_INFO(std::ios::openmode, open_mode)

// Get the contents of a file as a string.
string
read_file_contents(file_path const& path);

// Write a string to a file (overwriting anything that might have been in it).
void
dump_string_to_file(file_path const& path, string const& contents);

// Write a block of bytes to a file (overwriting anything that might have been
// in it).
void
dump_blob_to_file(file_path const& path, blob const& contents);

// Replace the contents of :path as a single step.
// The contents are first written in full to a sibling file named
// "<path>.tmp", which is then renamed over :path, so a failure part way
// through leaves the previous contents intact.
void
replace_file_contents(file_path const& path, string const& contents);

} // namespace larder

#endif
