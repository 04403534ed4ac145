#ifndef LARDER_IMAGING_CODEC_H
#define LARDER_IMAGING_CODEC_H

#include <larder/imaging/bitmap.hpp>

namespace larder {

LARDER_DEFINE_EXCEPTION(image_decoding_failure)
LARDER_DEFINE_EXCEPTION(image_encoding_failure)
// These exceptions also provide internal_error_message_info.
LARDER_DEFINE_ERROR_INFO(string, content_type)

// An image codec translates between encoded image files and bitmaps.
struct image_codec_interface
{
    virtual ~image_codec_interface()
    {
    }

    // Can this codec decode images with the given MIME type?
    virtual bool
    supports(string const& content_type) const = 0;

    // the MIME type of the images that encode() produces
    virtual string
    encoded_content_type() const = 0;

    virtual bitmap
    decode(blob const& data) const = 0;

    virtual blob
    encode(bitmap const& image) const = 0;
};

} // namespace larder

#endif
