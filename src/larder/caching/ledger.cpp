#include <larder/caching/ledger.h>

#include <algorithm>
#include <set>

#include <boost/algorithm/string.hpp>

#include <fmt/format.h>

#include <larder/utilities/text.h>

namespace larder {

bool
is_valid_cache_key(string const& key)
{
    return !key.empty();
}

string
escape_ledger_key(string const& key)
{
    string escaped;
    escaped.reserve(key.size());
    for (char c : key)
    {
        if (c == ';' || c == '\r' || c == '\n' || c == '%')
            escaped += fmt::format("%{:02X}", static_cast<unsigned char>(c));
        else
            escaped += c;
    }
    return escaped;
}

static optional<int>
parse_hex_digit(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    return none;
}

optional<string>
unescape_ledger_key(string const& escaped)
{
    string key;
    key.reserve(escaped.size());
    for (std::size_t i = 0; i != escaped.size(); ++i)
    {
        if (escaped[i] != '%')
        {
            key += escaped[i];
            continue;
        }
        if (i + 2 >= escaped.size())
            return none;
        auto high = parse_hex_digit(escaped[i + 1]);
        auto low = parse_hex_digit(escaped[i + 2]);
        if (!high || !low)
            return none;
        key += static_cast<char>(*high * 16 + *low);
        i += 2;
    }
    return key;
}

static optional<integer>
parse_nonnegative_integer(string const& text)
{
    if (text.empty()
        || !std::all_of(text.begin(), text.end(), [](char c) {
               return c >= '0' && c <= '9';
           }))
    {
        return none;
    }
    try
    {
        return lexical_cast<integer>(text);
    }
    catch (boost::bad_lexical_cast&)
    {
        // out of range
        return none;
    }
}

static optional<transformation_type_list>
parse_transformation_list(string const& text)
{
    if (text.size() < 2 || text.front() != '(' || text.back() != ')')
        return none;
    auto contents = text.substr(1, text.size() - 2);
    transformation_type_list list;
    if (contents.empty())
        return list;
    std::vector<string> items;
    boost::split(items, contents, [](char c) { return c == ','; });
    std::set<transformation_type> seen;
    for (auto const& item : items)
    {
        auto id = parse_nonnegative_integer(item);
        if (!id)
            return none;
        auto type = transformation_type_from_id(*id);
        if (!type || !seen.insert(*type).second)
            return none;
        list.push_back(*type);
    }
    return list;
}

optional<cache_record>
parse_ledger_line(string const& line)
{
    std::vector<string> fields;
    boost::split(fields, line, [](char c) { return c == ';'; });
    if (fields.size() != 4)
        return none;

    cache_record record;
    auto key = unescape_ledger_key(fields[0]);
    if (!key)
        return none;
    record.key = std::move(*key);
    record.file_name = fields[1];
    if (record.key.empty() || record.file_name.empty())
        return none;
    // File names are always bare names within the cache directory.
    if (record.file_name.find('/') != string::npos
        || record.file_name == "." || record.file_name == "..")
    {
        return none;
    }

    auto timestamp = parse_nonnegative_integer(fields[2]);
    if (!timestamp)
        return none;
    record.timestamp = *timestamp;

    auto transformations = parse_transformation_list(fields[3]);
    if (!transformations)
        return none;
    record.applied_transformations = std::move(*transformations);

    return record;
}

string
format_ledger_line(cache_record const& record)
{
    string line = escape_ledger_key(record.key) + ";" + record.file_name + ";"
                  + lexical_cast<string>(record.timestamp) + ";(";
    bool first = true;
    for (auto type : record.applied_transformations)
    {
        if (!first)
            line += ",";
        line += lexical_cast<string>(get_transformation_id(type));
        first = false;
    }
    line += ")";
    return line;
}

} // namespace larder
