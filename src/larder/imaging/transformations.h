#ifndef LARDER_IMAGING_TRANSFORMATIONS_H
#define LARDER_IMAGING_TRANSFORMATIONS_H

#include <variant>
#include <vector>

#include <larder/caching/cache_record.hpp>
#include <larder/imaging/bitmap.hpp>

namespace larder {

// Crop the largest centered region with the target's aspect ratio, then
// scale it to exactly :width x :height.
struct center_crop
{
    int width;
    int height;
};

// Scale the whole image to exactly :width x :height.
struct resize
{
    int width;
    int height;
};

struct circle_stroke
{
    double width;
    rgba_color color;
};

// Mask a square image to the inscribed circle. Everything outside the circle
// becomes :background, and the edge can optionally be stroked.
struct circle_crop
{
    rgba_color background = rgba_color{0, 0, 0, 0xff};
    optional<circle_stroke> stroke;
};

typedef std::variant<center_crop, resize, circle_crop> transformation;

transformation_type
get_transformation_type(transformation const& t);

// A list can't contain two transformations of the same kind.
LARDER_DEFINE_EXCEPTION(duplicate_transformation)
LARDER_DEFINE_ERROR_INFO(transformation_type, transformation_type)

// Dimensions must be positive, and stroke widths can't be negative.
LARDER_DEFINE_EXCEPTION(invalid_transformation_parameters)
// This exception also provides transformation_type_info and
// internal_error_message_info.

// A transformation was given an image that it can't handle. (e.g., circle
// cropping a non-square image)
LARDER_DEFINE_EXCEPTION(transformation_failure)
// This exception also provides transformation_type_info and
// internal_error_message_info.

// An ordered list of transformations, with at most one of each kind.
struct transformation_list
{
    transformation_list()
    {
    }

    // Validate :items and construct a list from them.
    explicit transformation_list(std::vector<transformation> items);

    std::vector<transformation> const&
    items() const
    {
        return items_;
    }

    bool
    empty() const
    {
        return items_.empty();
    }

    // the types of the transformations, in order
    transformation_type_list
    types() const;

 private:
    std::vector<transformation> items_;
};

// Apply a single transformation.
bitmap
apply_transformation(transformation const& t, bitmap const& image);

struct transformation_outcome
{
    bitmap image;
    // the transformations that were actually applied (in order)
    transformation_type_list applied;
    // the transformations that were skipped because :image already reflected
    // them
    transformation_type_list skipped;
};

// Apply :list to :image in order, skipping any transformation whose type is
// in :already_applied.
transformation_outcome
apply_transformations(
    transformation_list const& list,
    bitmap image,
    transformation_type_list const& already_applied = {});

} // namespace larder

#endif
