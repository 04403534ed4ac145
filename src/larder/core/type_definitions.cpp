#include <larder/core/type_definitions.h>

#include <cstring>
#include <memory>

namespace larder {

bool
operator==(blob const& a, blob const& b)
{
    return a.size == b.size
           && (a.data == b.data || a.size == 0
               || std::memcmp(a.data, b.data, a.size) == 0);
}

bool
operator!=(blob const& a, blob const& b)
{
    return !(a == b);
}

blob
make_string_blob(string s)
{
    blob b;
    // This is a little roundabout, but it seems like the most reasonable way
    // to ensure that a) the string contents don't move if the blob is moved
    // and b) the string contents aren't actually copied if they're large.
    b.ownership = std::make_shared<string>(std::move(s));
    string const& owned_string
        = *std::any_cast<std::shared_ptr<string> const&>(b.ownership);
    b.data = owned_string.c_str();
    b.size = owned_string.length();
    return b;
}

blob
make_blob(byte_vector bytes)
{
    blob b;
    b.ownership = std::make_shared<byte_vector>(std::move(bytes));
    byte_vector const& owned_bytes
        = *std::any_cast<std::shared_ptr<byte_vector> const&>(b.ownership);
    b.data = reinterpret_cast<char const*>(owned_bytes.data());
    b.size = owned_bytes.size();
    return b;
}

string
to_string(blob const& b)
{
    return b.size != 0 ? string(b.data, b.size) : string();
}

} // namespace larder
