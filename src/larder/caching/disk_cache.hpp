#ifndef LARDER_CACHING_DISK_CACHE_HPP
#define LARDER_CACHING_DISK_CACHE_HPP

#include <memory>
#include <vector>

#include <larder/caching/cache_record.hpp>
#include <larder/caching/command_queue.h>
#include <larder/caching/metadata_store.h>

namespace larder {

// A disk cache stores payloads (typically fetched images) as files in a
// directory, indexed by a ledger file in that same directory. The total size
// of the payloads is kept within a configured budget by evicting the least
// recently used entries.

// All operations are carried out, one at a time, by a worker thread that
// owns the cache's metadata. Callers block only until their own operation
// completes, so the cache can be used concurrently from multiple threads.

// Note that a disk cache will generate exceptions any time an operation
// fails. Of course, since caching is by definition not essential to the
// correct operation of a program, there should always be a way to recover
// from these exceptions.

struct disk_cache_config
{
    // If this is omitted, the cache lives in the user's cache directory.
    optional<string> directory;

    // the budget for the total size of all payloads (in bytes)
    integer size_limit = 0;

    // the maximum number of operations that can be waiting for the worker
    // thread (Beyond this, callers block until there's room.)
    std::size_t command_queue_capacity = 1024;

    // called when a payload file can't be deleted (If omitted, a warning is
    // logged.)
    deletion_warning_handler on_deletion_failure;
};

struct disk_cache_info
{
    // the directory where the cache is stored
    string directory;

    // the number of entries currently stored in the cache
    integer entry_count;

    // the total size (in bytes)
    integer total_size;

    // the configured budget (in bytes)
    integer size_limit;
};

// Keys are rejected with this if the ledger can't represent them.
LARDER_DEFINE_EXCEPTION(invalid_cache_key)
LARDER_DEFINE_ERROR_INFO(string, cache_key)

struct disk_cache_impl;

struct disk_cache
{
    // The default constructor creates an invalid disk cache that must be
    // initialized via reset().
    disk_cache();

    // Create a disk cache that's initialized with the given config.
    disk_cache(disk_cache_config const& config);

    ~disk_cache();

    // Reset the cache with a new config.
    // After a successful call to this, the cache is considered initialized.
    // If it fails, the cache is left uninitialized.
    void
    reset(disk_cache_config const& config);

    // Reset the cache to an uninitialized state.
    // Operations that were still waiting to execute fail with
    // disk_cache_shut_down, as do any that are issued afterwards.
    void
    reset();

    // Is the cache initialized?
    bool
    is_initialized() const;

    // the report from the most recent initialization
    ledger_load_report const&
    get_load_report() const;

    // Get summary information about the cache.
    disk_cache_info
    get_summary_info();

    // Get a list of all entries in the cache (in eviction order).
    std::vector<disk_cache_entry>
    get_entry_list();

    // Look up a key in the cache.
    //
    // A hit counts as a use of the entry, so it becomes the most recently
    // used one. If the entry's file has gone missing, the entry is dropped
    // and this is a miss.
    //
    optional<disk_cache_entry>
    get(string const& key);

    // Check whether the cache has an entry for :key (without touching the
    // disk).
    bool
    contains(string const& key);

    // Store a payload in the cache, replacing any existing entry for :key.
    //
    // :applied lists the transformations whose effects are present in
    // :value.
    //
    // If storing the payload would exceed the budget, older entries are
    // evicted first. A payload that's larger than the entire budget isn't
    // stored at all. (The result is none, and the cache is left without an
    // entry for :key.) Otherwise, the result is the new entry.
    //
    optional<disk_cache_entry>
    store(
        string const& key,
        blob const& value,
        transformation_type_list const& applied = {});

    // Same as above, but the payload is copied from a file.
    optional<disk_cache_entry>
    store_file(
        string const& key,
        file_path const& source,
        transformation_type_list const& applied = {});

    // Remove an individual entry from the cache.
    void
    remove(string const& key);

    // Clear the cache of all data.
    // This removes the cache directory itself. (It's recreated when
    // something new is stored.)
    void
    clear();

    // Evict the least recently used entry and return what it was.
    optional<disk_cache_entry>
    evict_oldest();

    // the total size of all payloads (in bytes)
    integer
    size();

 private:
    std::unique_ptr<disk_cache_impl> impl_;
};

} // namespace larder

#endif
