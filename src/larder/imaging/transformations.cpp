#include <larder/imaging/transformations.h>

#include <algorithm>
#include <cmath>
#include <set>

namespace larder {

transformation_type
get_transformation_type(transformation const& t)
{
    struct visitor
    {
        transformation_type
        operator()(center_crop const&) const
        {
            return transformation_type::CENTER_CROP;
        }
        transformation_type
        operator()(resize const&) const
        {
            return transformation_type::RESIZE;
        }
        transformation_type
        operator()(circle_crop const&) const
        {
            return transformation_type::CIRCLE_CROP;
        }
    };
    return std::visit(visitor(), t);
}

static void
check_dimensions(transformation_type type, int width, int height)
{
    if (width <= 0 || height <= 0)
    {
        LARDER_THROW(
            invalid_transformation_parameters()
            << transformation_type_info(type)
            << internal_error_message_info(
                   "target dimensions must be positive"));
    }
}

static void
check_parameters(transformation const& t)
{
    if (auto const* crop = std::get_if<center_crop>(&t))
        check_dimensions(get_transformation_type(t), crop->width, crop->height);
    else if (auto const* r = std::get_if<resize>(&t))
        check_dimensions(get_transformation_type(t), r->width, r->height);
    else if (auto const* circle = std::get_if<circle_crop>(&t))
    {
        if (circle->stroke && !(circle->stroke->width >= 0))
        {
            LARDER_THROW(
                invalid_transformation_parameters()
                << transformation_type_info(transformation_type::CIRCLE_CROP)
                << internal_error_message_info(
                       "stroke width can't be negative"));
        }
    }
}

transformation_list::transformation_list(std::vector<transformation> items)
{
    std::set<transformation_type> seen;
    for (auto const& item : items)
    {
        auto type = get_transformation_type(item);
        if (!seen.insert(type).second)
        {
            LARDER_THROW(
                duplicate_transformation() << transformation_type_info(type));
        }
        check_parameters(item);
    }
    items_ = std::move(items);
}

transformation_type_list
transformation_list::types() const
{
    transformation_type_list types;
    for (auto const& item : items_)
        types.push_back(get_transformation_type(item));
    return types;
}

// PIXEL OPERATIONS

// Scale :image to the given size. Each output pixel is the area-weighted
// average of the source pixels it covers.
static bitmap
scale_bitmap(bitmap const& image, int width, int height)
{
    if (image.width == width && image.height == height)
        return image;

    auto result = make_bitmap(width, height);
    if (image.width == 0 || image.height == 0)
        return result;

    double x_scale = double(image.width) / width;
    double y_scale = double(image.height) / height;
    for (int y = 0; y != height; ++y)
    {
        double top = y * y_scale;
        double bottom = (y + 1) * y_scale;
        for (int x = 0; x != width; ++x)
        {
            double left = x * x_scale;
            double right = (x + 1) * x_scale;
            double sums[4] = {0, 0, 0, 0};
            double total_weight = 0;
            int sy_end = std::min(image.height, int(std::ceil(bottom)));
            int sx_end = std::min(image.width, int(std::ceil(right)));
            for (int sy = int(top); sy < sy_end; ++sy)
            {
                double y_weight = std::min(bottom, sy + 1.0)
                                  - std::max(top, double(sy));
                for (int sx = int(left); sx < sx_end; ++sx)
                {
                    double weight = y_weight
                                    * (std::min(right, sx + 1.0)
                                       - std::max(left, double(sx)));
                    if (weight <= 0)
                        continue;
                    auto const* p
                        = &image.pixels[(std::size_t(sy) * image.width + sx) * 4];
                    for (int c = 0; c != 4; ++c)
                        sums[c] += p[c] * weight;
                    total_weight += weight;
                }
            }
            auto* out = &result.pixels[(std::size_t(y) * width + x) * 4];
            for (int c = 0; c != 4; ++c)
            {
                out[c] = uint8_t(std::clamp(
                    std::lround(sums[c] / total_weight), 0L, 255L));
            }
        }
    }
    return result;
}

static bitmap
crop_bitmap(bitmap const& image, int left, int top, int width, int height)
{
    bitmap result;
    result.width = width;
    result.height = height;
    result.pixels.resize(std::size_t(width) * height * 4);
    for (int y = 0; y != height; ++y)
    {
        auto begin = image.pixels.begin()
                     + (std::size_t(top + y) * image.width + left) * 4;
        std::copy(
            begin,
            begin + std::size_t(width) * 4,
            result.pixels.begin() + std::size_t(y) * width * 4);
    }
    return result;
}

static bitmap
apply_center_crop(center_crop const& crop, bitmap const& image)
{
    if (image.width == crop.width && image.height == crop.height)
        return image;

    // Find the largest centered region with the target aspect ratio.
    double target_aspect = double(crop.width) / crop.height;
    double source_aspect = double(image.width) / image.height;
    int region_width = image.width;
    int region_height = image.height;
    if (source_aspect > target_aspect)
    {
        region_width = std::max(
            1, int(std::lround(image.height * target_aspect)));
    }
    else
    {
        region_height = std::max(
            1, int(std::lround(image.width / target_aspect)));
    }
    region_width = std::min(region_width, image.width);
    region_height = std::min(region_height, image.height);

    auto region = crop_bitmap(
        image,
        (image.width - region_width) / 2,
        (image.height - region_height) / 2,
        region_width,
        region_height);
    return scale_bitmap(region, crop.width, crop.height);
}

static uint8_t
blend_channel(uint8_t over, uint8_t under, double coverage)
{
    return uint8_t(std::lround(over * coverage + under * (1 - coverage)));
}

static rgba_color
blend(rgba_color over, rgba_color under, double coverage)
{
    return rgba_color{
        blend_channel(over.r, under.r, coverage),
        blend_channel(over.g, under.g, coverage),
        blend_channel(over.b, under.b, coverage),
        blend_channel(over.a, under.a, coverage)};
}

static bitmap
apply_circle_crop(circle_crop const& crop, bitmap const& image)
{
    if (image.width != image.height)
    {
        LARDER_THROW(
            transformation_failure()
            << transformation_type_info(transformation_type::CIRCLE_CROP)
            << internal_error_message_info(
                   "circle cropping requires a square image"));
    }

    int size = image.width;
    auto result = make_bitmap(size, size, crop.background);
    double radius = size / 2.0;
    for (int y = 0; y != size; ++y)
    {
        for (int x = 0; x != size; ++x)
        {
            double dx = x + 0.5 - radius;
            double dy = y + 0.5 - radius;
            double distance = std::sqrt(dx * dx + dy * dy);
            // Edges are antialiased over a one-pixel band.
            double coverage = std::clamp(radius - distance + 0.5, 0.0, 1.0);
            if (coverage <= 0)
                continue;
            auto color
                = blend(get_pixel(image, x, y), crop.background, coverage);
            if (crop.stroke && crop.stroke->width > 0)
            {
                // The stroke straddles the edge, but only the part inside
                // the circle is visible.
                double stroke_coverage = std::clamp(
                    distance - (radius - crop.stroke->width / 2) + 0.5,
                    0.0,
                    1.0);
                color = blend(
                    crop.stroke->color, color, stroke_coverage * coverage);
            }
            set_pixel(result, x, y, color);
        }
    }
    return result;
}

bitmap
apply_transformation(transformation const& t, bitmap const& image)
{
    check_parameters(t);
    if (auto const* crop = std::get_if<center_crop>(&t))
        return apply_center_crop(*crop, image);
    if (auto const* r = std::get_if<resize>(&t))
        return scale_bitmap(image, r->width, r->height);
    return apply_circle_crop(std::get<circle_crop>(t), image);
}

transformation_outcome
apply_transformations(
    transformation_list const& list,
    bitmap image,
    transformation_type_list const& already_applied)
{
    transformation_outcome outcome;
    outcome.image = std::move(image);
    for (auto const& item : list.items())
    {
        auto type = get_transformation_type(item);
        if (std::find(already_applied.begin(), already_applied.end(), type)
            != already_applied.end())
        {
            outcome.skipped.push_back(type);
            continue;
        }
        outcome.image = apply_transformation(item, outcome.image);
        outcome.applied.push_back(type);
    }
    return outcome;
}

} // namespace larder
