#ifndef LARDER_IMAGING_PNG_CODEC_H
#define LARDER_IMAGING_PNG_CODEC_H

#include <larder/imaging/codec.h>

namespace larder {

// a codec for PNG images (via libpng)
struct png_codec : image_codec_interface
{
    bool
    supports(string const& content_type) const;

    string
    encoded_content_type() const
    {
        return "image/png";
    }

    bitmap
    decode(blob const& data) const;

    blob
    encode(bitmap const& image) const;
};

} // namespace larder

#endif
