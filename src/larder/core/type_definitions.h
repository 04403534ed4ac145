#ifndef LARDER_CORE_TYPE_DEFINITIONS_H
#define LARDER_CORE_TYPE_DEFINITIONS_H

#include <any>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <boost/core/noncopyable.hpp>

namespace larder {

using boost::noncopyable;

using std::string;

using std::optional;
typedef std::nullopt_t none_t;
inline constexpr std::nullopt_t none(std::nullopt);

// some(x) creates an optional of the proper type with the value of :x.
template<class T>
auto
some(T&& x)
{
    return optional<std::remove_cv_t<std::remove_reference_t<T>>>(
        std::forward<T>(x));
}

typedef int64_t integer;

typedef std::vector<uint8_t> byte_vector;

// ownership_holder is meant to express polymorphic ownership of a resource.
// The idea is that the resource may be owned in many different ways, and we
// don't care what way. We only want an object that will provide ownership of
// the resource until it's destructed. We can achieve this by using an any
// object to hold the ownership object.
typedef std::any ownership_holder;

// A blob is an immutable block of bytes whose storage is kept alive by
// :ownership. Copying a blob never copies the bytes.
struct blob
{
    ownership_holder ownership;
    char const* data = nullptr;
    std::size_t size = 0;
};

bool
operator==(blob const& a, blob const& b);
bool
operator!=(blob const& a, blob const& b);

// Make a blob that holds the contents of the given string.
blob
make_string_blob(string s);

// Make a blob that takes ownership of the given byte vector.
blob
make_blob(byte_vector bytes);

// Copy the contents of a blob into a string.
string
to_string(blob const& b);

} // namespace larder

#endif
