#include <larder/caching/disk_cache.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <thread>

#include <boost/crc.hpp>

#include <fmt/format.h>

#include <larder/caching/eviction.h>
#include <larder/caching/ledger.h>
#include <larder/fs/app_dirs.hpp>
#include <larder/fs/file_io.h>
#include <larder/fs/utilities.h>
#include <larder/utilities/logging.h>

namespace larder {

struct disk_cache_impl
{
    disk_cache_impl(file_path dir, disk_cache_config const& config)
        : store(std::move(dir)),
          size_limit(config.size_limit),
          on_deletion_failure(config.on_deletion_failure),
          queue(config.command_queue_capacity)
    {
    }

    metadata_store store;

    integer size_limit;

    deletion_warning_handler on_deletion_failure;

    // the most recently issued timestamp
    integer latest_timestamp = 0;

    ledger_load_report load_report;

    // operations waiting for the worker
    cache_command_queue queue;

    // the thread that executes all operations
    std::thread worker;
};

// COMMAND EXECUTION

static void
run_commands(disk_cache_impl& cache)
{
    while (auto command = cache.queue.pop())
        command->execute();
}

// Execute :function on the worker thread and wait for its result.
template<class Function>
static auto
execute_command(disk_cache_impl& cache, Function function)
{
    typedef decltype(function()) result_type;
    auto command
        = std::make_unique<typed_cache_command<result_type, Function>>(
            std::move(function));
    auto result = command->get_future();
    cache.queue.push(std::move(command));
    return result.get();
}

static disk_cache_impl&
get_active_impl(std::unique_ptr<disk_cache_impl> const& impl)
{
    if (!impl)
        LARDER_THROW(disk_cache_shut_down());
    return *impl;
}

static void
shut_down(disk_cache_impl& cache)
{
    cache.queue.shut_down();
    if (cache.worker.joinable())
        cache.worker.join();
}

// UTILITIES (for use on the worker thread)

static integer
issue_timestamp(disk_cache_impl& cache)
{
    integer now = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();
    cache.latest_timestamp = std::max(now, cache.latest_timestamp + 1);
    return cache.latest_timestamp;
}

static string
make_payload_file_name(integer timestamp, string const& key)
{
    boost::crc_32_type crc;
    crc.process_bytes(key.data(), key.size());
    return fmt::format("{}_{:08x}.cached", timestamp, crc.checksum());
}

static disk_cache_entry
make_entry(disk_cache_impl const& cache, cache_record record)
{
    auto path = cache.store.path_for(record);
    return disk_cache_entry{std::move(record), std::move(path)};
}

// Persist the store after :removed have been taken out of it (and, if
// :added_key is given, after that key's new record was put in). The files
// of :removed are only deleted once the ledger has been written. If writing
// it fails, the store is returned to its previous state and nothing is
// deleted.
static void
commit_changes(
    disk_cache_impl& cache,
    std::vector<cache_record> const& removed,
    optional<string> const& added_key = none)
{
    try
    {
        cache.store.persist();
    }
    catch (...)
    {
        if (added_key)
            cache.store.take(*added_key);
        for (auto const& record : removed)
            cache.store.put(record);
        throw;
    }
    for (auto const& record : removed)
    {
        remove_payload_file(
            cache.store.path_for(record), cache.on_deletion_failure);
    }
}

static std::vector<cache_record>
take_victims(disk_cache_impl& cache, std::vector<cache_record> const& victims)
{
    std::vector<cache_record> taken;
    for (auto const& victim : victims)
    {
        get_logger()->info(
            "evicting {} ({} bytes) from disk cache", victim.key, victim.size);
        if (auto record = cache.store.take(victim.key))
            taken.push_back(std::move(*record));
    }
    return taken;
}

static void
check_cache_key(string const& key)
{
    if (!is_valid_cache_key(key))
        LARDER_THROW(invalid_cache_key() << cache_key_info(key));
}

// Store a payload of :size bytes, which :write_payload writes to the path
// it's given.
template<class PayloadWriter>
static optional<disk_cache_entry>
store_payload(
    disk_cache_impl& cache,
    string const& key,
    integer size,
    transformation_type_list const& applied,
    PayloadWriter const& write_payload)
{
    if (size > cache.size_limit)
    {
        get_logger()->warn(
            "{} ({} bytes) exceeds the disk cache budget ({} bytes); "
            "not caching it",
            key,
            size,
            cache.size_limit);
        if (auto previous = cache.store.take(key))
            commit_changes(cache, {*previous});
        return none;
    }

    auto timestamp = issue_timestamp(cache);
    cache_record record{
        key, make_payload_file_name(timestamp, key), size, timestamp, applied};
    auto path = cache.store.path_for(record);

    // Write the payload under a temporary name first so that a failure
    // never leaves a partial payload under a real name.
    std::filesystem::create_directories(cache.store.directory());
    file_path temporary = path;
    temporary += ".tmp";
    try
    {
        write_payload(temporary);
        std::filesystem::rename(temporary, path);
    }
    catch (...)
    {
        remove_file_if_present(temporary);
        throw;
    }

    std::vector<cache_record> removed;
    if (auto previous = cache.store.take(key))
        removed.push_back(std::move(*previous));
    integer total = cache.store.total_size();
    if (total + size > cache.size_limit)
    {
        auto bytes_to_reclaim = std::max(cache.size_limit * 3 / 10, size);
        get_logger()->info(
            "disk cache is full ({} + {} > {} bytes); reclaiming {} bytes",
            total,
            size,
            cache.size_limit,
            bytes_to_reclaim);
        for (auto& victim : take_victims(
                 cache,
                 select_eviction_victims(
                     cache.store.get_records(), bytes_to_reclaim)))
        {
            removed.push_back(std::move(victim));
        }
    }

    cache.store.put(record);
    try
    {
        commit_changes(cache, removed, key);
    }
    catch (...)
    {
        remove_file_if_present(path);
        throw;
    }

    get_logger()->debug("stored {} in {}", key, record.file_name);
    return make_entry(cache, std::move(record));
}

static optional<disk_cache_entry>
look_up(disk_cache_impl& cache, string const& key)
{
    auto record = cache.store.find(key);
    if (!record)
    {
        get_logger()->debug("disk cache miss on {}", key);
        return none;
    }

    std::error_code error;
    if (!std::filesystem::is_regular_file(cache.store.path_for(*record), error))
    {
        get_logger()->warn(
            "cache file {} for {} is missing; dropping the entry",
            record->file_name,
            key);
        cache.store.take(key);
        cache.store.persist();
        return none;
    }

    get_logger()->debug("disk cache hit on {}", key);
    cache_record original = *record;
    cache_record refreshed = original;
    refreshed.timestamp = issue_timestamp(cache);
    cache.store.put(refreshed);
    try
    {
        cache.store.persist();
    }
    catch (...)
    {
        cache.store.put(std::move(original));
        throw;
    }
    return make_entry(cache, std::move(refreshed));
}

static void
clear_everything(disk_cache_impl& cache)
{
    for (auto const& record : cache.store.get_records())
    {
        remove_payload_file(
            cache.store.path_for(record), cache.on_deletion_failure);
    }
    cache.store.clear();

    std::error_code error;
    std::filesystem::remove_all(cache.store.directory(), error);
    if (error)
    {
        report_deletion_failure(
            cache.store.directory(), error, cache.on_deletion_failure);
    }
    get_logger()->info("cleared disk cache in {}", cache.store.directory().string());
}

// INITIALIZATION

static file_path
get_cache_directory(disk_cache_config const& config)
{
    if (config.directory)
        return file_path(*config.directory);
    try
    {
        return get_user_cache_dir("larder") / "images";
    }
    catch (directory_creation_failure& e)
    {
        LARDER_THROW(
            disk_cache_failure()
            << disk_cache_path_info(
                   get_required_error_info<directory_path_info>(e))
            << internal_error_message_info(
                   "failed to create the user cache directory"));
    }
}

static std::unique_ptr<disk_cache_impl>
initialize(disk_cache_config const& config)
{
    auto dir = get_cache_directory(config);
    if (config.size_limit < 0)
    {
        LARDER_THROW(
            disk_cache_failure()
            << disk_cache_path_info(dir)
            << internal_error_message_info("negative size limit"));
    }

    auto cache = std::make_unique<disk_cache_impl>(dir, config);
    cache->load_report = cache->store.load(config.on_deletion_failure);
    cache->latest_timestamp = cache->store.latest_timestamp();

    // The budget may have shrunk since the ledger was written.
    integer total = cache->store.total_size();
    if (total > cache->size_limit)
    {
        commit_changes(
            *cache,
            take_victims(
                *cache,
                select_eviction_victims(
                    cache->store.get_records(), total - cache->size_limit)));
    }

    get_logger()->info(
        "disk cache initialized in {} ({} entries, {} of {} bytes)",
        dir.string(),
        cache->store.record_count(),
        cache->store.total_size(),
        cache->size_limit);

    auto& impl = *cache;
    cache->worker = std::thread([&impl] { run_commands(impl); });
    return cache;
}

// API

disk_cache::disk_cache()
{
}

disk_cache::disk_cache(disk_cache_config const& config)
{
    this->reset(config);
}

disk_cache::~disk_cache()
{
    if (this->impl_)
        shut_down(*this->impl_);
}

void
disk_cache::reset(disk_cache_config const& config)
{
    if (this->impl_)
    {
        shut_down(*this->impl_);
        this->impl_.reset();
    }
    this->impl_ = initialize(config);
}

void
disk_cache::reset()
{
    if (this->impl_)
        shut_down(*this->impl_);
    this->impl_.reset();
}

bool
disk_cache::is_initialized() const
{
    return impl_ ? true : false;
}

ledger_load_report const&
disk_cache::get_load_report() const
{
    static ledger_load_report const empty_report;
    return impl_ ? impl_->load_report : empty_report;
}

disk_cache_info
disk_cache::get_summary_info()
{
    auto& cache = get_active_impl(this->impl_);
    return execute_command(cache, [&cache] {
        disk_cache_info info;
        info.directory = cache.store.directory().string();
        info.entry_count = static_cast<integer>(cache.store.record_count());
        info.total_size = cache.store.total_size();
        info.size_limit = cache.size_limit;
        return info;
    });
}

std::vector<disk_cache_entry>
disk_cache::get_entry_list()
{
    auto& cache = get_active_impl(this->impl_);
    return execute_command(cache, [&cache] {
        std::vector<disk_cache_entry> entries;
        for (auto& record : cache.store.get_records())
            entries.push_back(make_entry(cache, std::move(record)));
        return entries;
    });
}

optional<disk_cache_entry>
disk_cache::get(string const& key)
{
    auto& cache = get_active_impl(this->impl_);
    return execute_command(cache, [&] { return look_up(cache, key); });
}

bool
disk_cache::contains(string const& key)
{
    auto& cache = get_active_impl(this->impl_);
    return execute_command(
        cache, [&] { return cache.store.contains(key); });
}

optional<disk_cache_entry>
disk_cache::store(
    string const& key,
    blob const& value,
    transformation_type_list const& applied)
{
    LARDER_LOG_CALL(<< LARDER_LOG_ARG(key) << LARDER_LOG_ARG(value.size))
    check_cache_key(key);
    auto& cache = get_active_impl(this->impl_);
    return execute_command(cache, [&] {
        return store_payload(
            cache,
            key,
            static_cast<integer>(value.size),
            applied,
            [&](file_path const& path) { dump_blob_to_file(path, value); });
    });
}

optional<disk_cache_entry>
disk_cache::store_file(
    string const& key,
    file_path const& source,
    transformation_type_list const& applied)
{
    LARDER_LOG_CALL(<< LARDER_LOG_ARG(key) << LARDER_LOG_ARG(source))
    check_cache_key(key);
    auto& cache = get_active_impl(this->impl_);
    return execute_command(cache, [&] {
        return store_payload(
            cache,
            key,
            static_cast<integer>(std::filesystem::file_size(source)),
            applied,
            [&](file_path const& path) {
                std::filesystem::copy_file(
                    source,
                    path,
                    std::filesystem::copy_options::overwrite_existing);
            });
    });
}

void
disk_cache::remove(string const& key)
{
    auto& cache = get_active_impl(this->impl_);
    execute_command(cache, [&] {
        if (auto record = cache.store.take(key))
            commit_changes(cache, {*record});
    });
}

void
disk_cache::clear()
{
    auto& cache = get_active_impl(this->impl_);
    execute_command(cache, [&cache] { clear_everything(cache); });
}

optional<disk_cache_entry>
disk_cache::evict_oldest()
{
    auto& cache = get_active_impl(this->impl_);
    return execute_command(cache, [&cache]() -> optional<disk_cache_entry> {
        auto oldest = select_oldest_record(cache.store.get_records());
        if (!oldest)
            return none;
        commit_changes(cache, take_victims(cache, {*oldest}));
        return make_entry(cache, std::move(*oldest));
    });
}

integer
disk_cache::size()
{
    auto& cache = get_active_impl(this->impl_);
    return execute_command(
        cache, [&cache] { return cache.store.total_size(); });
}

} // namespace larder
