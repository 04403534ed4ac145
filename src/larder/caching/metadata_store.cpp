#include <larder/caching/metadata_store.h>

#include <filesystem>
#include <set>

#include <boost/algorithm/string.hpp>

#include <larder/caching/eviction.h>
#include <larder/caching/ledger.h>
#include <larder/fs/file_io.h>
#include <larder/utilities/logging.h>

namespace larder {

metadata_store::metadata_store(file_path directory)
    : directory_(std::move(directory))
{
}

file_path
metadata_store::ledger_path() const
{
    return directory_ / ledger_file_name;
}

static void
throw_disk_cache_failure(file_path const& dir, string const& message)
{
    LARDER_THROW(
        disk_cache_failure() << disk_cache_path_info(dir)
                             << internal_error_message_info(message));
}

static void
ensure_directory_exists(file_path const& dir)
{
    std::error_code error;
    if (!std::filesystem::is_directory(dir, error))
    {
        std::filesystem::create_directories(dir, error);
        if (error)
        {
            throw_disk_cache_failure(
                dir, "failed to create cache directory: " + error.message());
        }
    }
}

static string
read_ledger(file_path const& dir, file_path const& ledger)
{
    try
    {
        if (!exists(ledger))
            dump_string_to_file(ledger, "");
        return read_file_contents(ledger);
    }
    catch (std::exception& e)
    {
        throw_disk_cache_failure(
            dir, string("failed to create or read the ledger: ") + e.what());
    }
    return string();
}

ledger_load_report
metadata_store::load(deletion_warning_handler const& on_deletion_failure)
{
    ledger_load_report report;
    records_.clear();

    ensure_directory_exists(directory_);
    auto ledger = ledger_path();
    auto contents = read_ledger(directory_, ledger);

    std::vector<string> lines;
    boost::split(lines, contents, [](char c) { return c == '\n'; });
    std::set<string> referenced_files;
    for (auto& line : lines)
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty())
            continue;
        ++report.lines_read;
        auto record = parse_ledger_line(line);
        if (!record || records_.count(record->key)
            || referenced_files.count(record->file_name)
            || record->file_name == ledger_file_name)
        {
            get_logger()->warn("rejecting cache ledger line: {}", line);
            ++report.lines_rejected;
            continue;
        }
        referenced_files.insert(record->file_name);
        records_[record->key] = std::move(*record);
    }

    // Drop records whose files are missing, and fill in the sizes of the
    // others.
    for (auto i = records_.begin(); i != records_.end();)
    {
        std::error_code error;
        auto path = path_for(i->second);
        if (std::filesystem::is_regular_file(path, error))
        {
            i->second.size
                = static_cast<integer>(std::filesystem::file_size(path));
            ++i;
        }
        else
        {
            get_logger()->warn(
                "cache file {} is missing; dropping record for {}",
                i->second.file_name,
                i->first);
            referenced_files.erase(i->second.file_name);
            i = records_.erase(i);
            ++report.records_dropped;
        }
    }

    // Look for files that nothing references.
    std::vector<file_path> orphans;
    for (auto const& item : std::filesystem::directory_iterator(directory_))
    {
        if (!item.is_regular_file())
            continue;
        auto name = item.path().filename().string();
        if (name == ledger_file_name || referenced_files.count(name))
            continue;
        orphans.push_back(item.path());
    }

    if (report.lines_rejected != 0 || report.records_dropped != 0
        || !orphans.empty())
    {
        get_logger()->warn(
            "cache ledger in {} is inconsistent with its directory; "
            "reconciling",
            directory_.string());
        for (auto const& orphan : orphans)
        {
            get_logger()->warn(
                "deleting unreferenced cache file {}", orphan.string());
            remove_payload_file(orphan, on_deletion_failure);
            ++report.orphaned_files_deleted;
        }
        persist();
        report.reconciled = true;
    }

    return report;
}

void
metadata_store::persist() const
{
    ensure_directory_exists(directory_);
    string contents;
    for (auto const& record : get_records())
        contents += format_ledger_line(record) + "\n";
    try
    {
        replace_file_contents(ledger_path(), contents);
    }
    catch (std::exception& e)
    {
        throw_disk_cache_failure(
            directory_, string("failed to write the ledger: ") + e.what());
    }
}

cache_record const*
metadata_store::find(string const& key) const
{
    auto i = records_.find(key);
    return i != records_.end() ? &i->second : nullptr;
}

void
metadata_store::put(cache_record record)
{
    auto key = record.key;
    records_[key] = std::move(record);
}

optional<cache_record>
metadata_store::take(string const& key)
{
    auto i = records_.find(key);
    if (i == records_.end())
        return none;
    auto record = std::move(i->second);
    records_.erase(i);
    return record;
}

void
metadata_store::clear()
{
    records_.clear();
}

integer
metadata_store::total_size() const
{
    integer total = 0;
    for (auto const& [key, record] : records_)
        total += record.size;
    return total;
}

integer
metadata_store::latest_timestamp() const
{
    integer latest = 0;
    for (auto const& [key, record] : records_)
        latest = std::max(latest, record.timestamp);
    return latest;
}

std::vector<cache_record>
metadata_store::get_records() const
{
    std::vector<cache_record> records;
    records.reserve(records_.size());
    for (auto const& [key, record] : records_)
        records.push_back(record);
    sort_into_eviction_order(records);
    return records;
}

} // namespace larder
