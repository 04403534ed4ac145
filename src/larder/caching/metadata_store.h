#ifndef LARDER_CACHING_METADATA_STORE_H
#define LARDER_CACHING_METADATA_STORE_H

#include <map>
#include <vector>

#include <larder/caching/cache_record.hpp>

namespace larder {

// what happened while loading a ledger
struct ledger_load_report
{
    // the number of nonempty lines in the ledger
    integer lines_read = 0;
    // lines that couldn't be parsed (or named a key or file that an earlier
    // line already claimed)
    integer lines_rejected = 0;
    // records dropped because their payload file was missing
    integer records_dropped = 0;
    // files in the cache directory that no record referenced (and that were
    // therefore deleted)
    integer orphaned_files_deleted = 0;
    // Did the ledger disagree with the directory? (If so, the directory and
    // ledger were reconciled.)
    bool reconciled = false;
};

// A metadata_store is the in-memory index of a disk cache, mirrored to the
// ledger file in the cache directory.
//
// It isn't internally synchronized. (Within a disk_cache, it's only ever
// touched by the cache's worker thread.)
//
struct metadata_store
{
    explicit metadata_store(file_path directory);

    // Load the ledger, creating it (and the directory) if necessary.
    //
    // Lines that can't be parsed, records whose files are missing and files
    // that no record references all mark the load as corrupted, in which
    // case the directory and ledger are reconciled: orphaned files are
    // deleted, broken records are dropped, and the ledger is rewritten.
    //
    // Failure to create or read the ledger throws disk_cache_failure.
    //
    ledger_load_report
    load(deletion_warning_handler const& on_deletion_failure = nullptr);

    // Write every record to the ledger, replacing its previous contents as a
    // single step. (The cache directory is recreated if necessary.)
    void
    persist() const;

    file_path const&
    directory() const
    {
        return directory_;
    }

    file_path
    ledger_path() const;

    file_path
    path_for(cache_record const& record) const
    {
        return directory_ / record.file_name;
    }

    cache_record const*
    find(string const& key) const;

    // Insert a record, replacing any existing record with the same key.
    void
    put(cache_record record);

    // Remove the record for :key and return it (if there was one).
    optional<cache_record>
    take(string const& key);

    void
    clear();

    bool
    contains(string const& key) const
    {
        return records_.find(key) != records_.end();
    }

    std::size_t
    record_count() const
    {
        return records_.size();
    }

    integer
    total_size() const;

    // the largest timestamp of any record (or 0 if there are none)
    integer
    latest_timestamp() const;

    // all records, in eviction order
    std::vector<cache_record>
    get_records() const;

 private:
    file_path directory_;
    std::map<string, cache_record> records_;
};

} // namespace larder

#endif
