#ifndef LARDER_IMAGING_BITMAP_HPP
#define LARDER_IMAGING_BITMAP_HPP

#include <larder/core.h>

namespace larder {

struct rgba_color
{
    uint8_t r = 0, g = 0, b = 0, a = 0xff;
};

inline bool
operator==(rgba_color const& x, rgba_color const& y)
{
    return x.r == y.r && x.g == y.g && x.b == y.b && x.a == y.a;
}
inline bool
operator!=(rgba_color const& x, rgba_color const& y)
{
    return !(x == y);
}

// A bitmap is a decoded image: 8-bit RGBA pixels, stored row by row with no
// padding.
struct bitmap
{
    int width = 0;
    int height = 0;
    byte_vector pixels;
};

// Create a bitmap of the given size, filled with :fill.
bitmap
make_bitmap(int width, int height, rgba_color fill = rgba_color());

inline rgba_color
get_pixel(bitmap const& image, int x, int y)
{
    auto const* p = &image.pixels[(std::size_t(y) * image.width + x) * 4];
    return rgba_color{p[0], p[1], p[2], p[3]};
}

inline void
set_pixel(bitmap& image, int x, int y, rgba_color color)
{
    auto* p = &image.pixels[(std::size_t(y) * image.width + x) * 4];
    p[0] = color.r;
    p[1] = color.g;
    p[2] = color.b;
    p[3] = color.a;
}

} // namespace larder

#endif
