#include <larder/imaging/bitmap.hpp>

namespace larder {

bitmap
make_bitmap(int width, int height, rgba_color fill)
{
    bitmap image;
    image.width = width;
    image.height = height;
    image.pixels.resize(std::size_t(width) * height * 4);
    for (std::size_t i = 0; i != image.pixels.size(); i += 4)
    {
        image.pixels[i] = fill.r;
        image.pixels[i + 1] = fill.g;
        image.pixels[i + 2] = fill.b;
        image.pixels[i + 3] = fill.a;
    }
    return image;
}

} // namespace larder
