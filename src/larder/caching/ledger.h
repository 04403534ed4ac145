#ifndef LARDER_CACHING_LEDGER_H
#define LARDER_CACHING_LEDGER_H

#include <larder/caching/cache_record.hpp>

// The ledger is the durable, line-oriented index of a disk cache. Each line
// describes one record:
//
//   key;file_name;timestamp;(t1,t2,...)
//
// where the t's are numeric transformation IDs (and an empty list is "()").
// Within the key, the characters ';', CR, LF and '%' are written as "%XX"
// (uppercase hex), so any nonempty string can be a key.
// Payload sizes aren't stored. They're taken from the files themselves.

namespace larder {

// the name of the ledger file within a cache directory
inline constexpr char const ledger_file_name[] = "disk-cache.dat";

// Is :key usable as a cache key? (It must be nonempty.)
bool
is_valid_cache_key(string const& key);

// Escape :key for the key field of a ledger line.
string
escape_ledger_key(string const& key);

// Undo escape_ledger_key. The result is none if :escaped contains a '%' that
// isn't followed by two hex digits.
optional<string>
unescape_ledger_key(string const& escaped);

// Parse a single ledger line (without its line terminator).
// The result is none if the line is malformed in any way. The returned
// record's size is left as 0.
optional<cache_record>
parse_ledger_line(string const& line);

// Format a record as a ledger line (without a line terminator).
string
format_ledger_line(cache_record const& record);

} // namespace larder

#endif
