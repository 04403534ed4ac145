#include <larder/imaging/png_codec.h>

#include <cstring>

#include <boost/algorithm/string.hpp>

#include <png.h>

#include <larder/utilities/errors.h>

namespace larder {

bool
png_codec::supports(string const& content_type) const
{
    // Ignore any parameters (e.g., "image/png; charset=binary").
    auto type = content_type.substr(0, content_type.find(';'));
    boost::algorithm::trim(type);
    return boost::algorithm::iequals(type, "image/png");
}

// png_image holds libpng's internal state for a read or write. This makes
// sure that's always released.
struct png_image_holder : noncopyable
{
    png_image_holder()
    {
        std::memset(&image, 0, sizeof(image));
        image.version = PNG_IMAGE_VERSION;
    }
    ~png_image_holder()
    {
        png_image_free(&image);
    }
    png_image image;
};

bitmap
png_codec::decode(blob const& data) const
{
    png_image_holder holder;
    auto& image = holder.image;
    if (!png_image_begin_read_from_memory(&image, data.data, data.size))
    {
        LARDER_THROW(
            image_decoding_failure()
            << content_type_info("image/png")
            << internal_error_message_info(image.message));
    }

    image.format = PNG_FORMAT_RGBA;
    bitmap result;
    result.width = static_cast<int>(image.width);
    result.height = static_cast<int>(image.height);
    result.pixels.resize(PNG_IMAGE_SIZE(image));
    if (!png_image_finish_read(
            &image, nullptr, result.pixels.data(), 0, nullptr))
    {
        LARDER_THROW(
            image_decoding_failure()
            << content_type_info("image/png")
            << internal_error_message_info(image.message));
    }
    return result;
}

blob
png_codec::encode(bitmap const& source) const
{
    if (source.width <= 0 || source.height <= 0
        || source.pixels.size() != std::size_t(source.width) * source.height * 4)
    {
        LARDER_THROW(
            image_encoding_failure()
            << content_type_info("image/png")
            << internal_error_message_info("malformed bitmap"));
    }

    png_image_holder holder;
    auto& image = holder.image;
    image.width = static_cast<png_uint_32>(source.width);
    image.height = static_cast<png_uint_32>(source.height);
    image.format = PNG_FORMAT_RGBA;

    // The first call measures the encoded size, and the second one does the
    // actual encoding.
    png_alloc_size_t size = 0;
    if (!png_image_write_to_memory(
            &image, nullptr, &size, 0, source.pixels.data(), 0, nullptr))
    {
        LARDER_THROW(
            image_encoding_failure()
            << content_type_info("image/png")
            << internal_error_message_info(image.message));
    }
    byte_vector encoded(size);
    if (!png_image_write_to_memory(
            &image,
            encoded.data(),
            &size,
            0,
            source.pixels.data(),
            0,
            nullptr))
    {
        LARDER_THROW(
            image_encoding_failure()
            << content_type_info("image/png")
            << internal_error_message_info(image.message));
    }
    encoded.resize(size);
    return make_blob(std::move(encoded));
}

} // namespace larder
