#include <larder/imaging/transformations.h>

#include <larder/utilities/testing.h>

using namespace larder;

namespace {

rgba_color const red{0xff, 0, 0, 0xff};
rgba_color const blue{0, 0, 0xff, 0xff};
rgba_color const white{0xff, 0xff, 0xff, 0xff};

// Make an image whose left half is red and whose right half is blue.
bitmap
make_split_image(int width, int height)
{
    auto image = make_bitmap(width, height, red);
    for (int y = 0; y != height; ++y)
    {
        for (int x = width / 2; x != width; ++x)
            set_pixel(image, x, y, blue);
    }
    return image;
}

} // namespace

TEST_CASE("transformation list validation", "[imaging][transformations]")
{
    transformation_list list({center_crop{10, 10}, circle_crop{}});
    REQUIRE(
        list.types()
        == transformation_type_list{
            transformation_type::CENTER_CROP,
            transformation_type::CIRCLE_CROP});
    REQUIRE(!list.empty());
    REQUIRE(transformation_list().empty());

    try
    {
        transformation_list({resize{5, 5}, center_crop{5, 5}, resize{2, 2}});
        FAIL("no exception thrown");
    }
    catch (duplicate_transformation& e)
    {
        REQUIRE(
            get_required_error_info<transformation_type_info>(e)
            == transformation_type::RESIZE);
    }

    REQUIRE_THROWS_AS(
        transformation_list({resize{0, 5}}), invalid_transformation_parameters);
    REQUIRE_THROWS_AS(
        transformation_list({center_crop{5, -1}}),
        invalid_transformation_parameters);
    REQUIRE_THROWS_AS(
        transformation_list({circle_crop{white, circle_stroke{-1, red}}}),
        invalid_transformation_parameters);
}

TEST_CASE("resizing", "[imaging][transformations]")
{
    auto image = make_split_image(40, 20);
    auto resized = apply_transformation(resize{4, 8}, image);
    REQUIRE(resized.width == 4);
    REQUIRE(resized.height == 8);
    REQUIRE(resized.pixels.size() == 4 * 8 * 4);
    REQUIRE(get_pixel(resized, 0, 0) == red);
    REQUIRE(get_pixel(resized, 3, 7) == blue);

    // Scaling a uniform image leaves it uniform.
    auto uniform = apply_transformation(
        resize{7, 3}, make_bitmap(10, 10, white));
    for (int y = 0; y != 3; ++y)
    {
        for (int x = 0; x != 7; ++x)
            REQUIRE(get_pixel(uniform, x, y) == white);
    }
}

TEST_CASE("center cropping", "[imaging][transformations]")
{
    // A wide image loses its sides when it's cropped to a square.
    auto image = make_bitmap(30, 10, white);
    for (int y = 0; y != 10; ++y)
    {
        for (int x = 0; x != 10; ++x)
        {
            set_pixel(image, x, y, red);
            set_pixel(image, x + 20, y, blue);
        }
    }
    auto cropped = apply_transformation(center_crop{5, 5}, image);
    REQUIRE(cropped.width == 5);
    REQUIRE(cropped.height == 5);
    for (int y = 0; y != 5; ++y)
    {
        for (int x = 0; x != 5; ++x)
            REQUIRE(get_pixel(cropped, x, y) == white);
    }

    // A tall image loses its top and bottom.
    auto tall = make_bitmap(4, 12, red);
    for (int y = 4; y != 8; ++y)
    {
        for (int x = 0; x != 4; ++x)
            set_pixel(tall, x, y, blue);
    }
    auto tall_cropped = apply_transformation(center_crop{2, 2}, tall);
    REQUIRE(tall_cropped.width == 2);
    REQUIRE(get_pixel(tall_cropped, 0, 0) == blue);
    REQUIRE(get_pixel(tall_cropped, 1, 1) == blue);
}

TEST_CASE("circle cropping", "[imaging][transformations]")
{
    auto image = make_bitmap(20, 20, white);

    auto cropped = apply_transformation(circle_crop{red, none}, image);
    REQUIRE(cropped.width == 20);
    // The corners are outside the circle and the center is inside.
    REQUIRE(get_pixel(cropped, 0, 0) == red);
    REQUIRE(get_pixel(cropped, 19, 19) == red);
    REQUIRE(get_pixel(cropped, 10, 10) == white);

    auto stroked = apply_transformation(
        circle_crop{red, circle_stroke{4, blue}}, image);
    // Just inside the edge is stroked, but the middle isn't.
    REQUIRE(get_pixel(stroked, 10, 1) == blue);
    REQUIRE(get_pixel(stroked, 10, 10) == white);
    REQUIRE(get_pixel(stroked, 0, 0) == red);

    try
    {
        apply_transformation(circle_crop{}, make_bitmap(20, 10));
        FAIL("no exception thrown");
    }
    catch (transformation_failure& e)
    {
        REQUIRE(
            get_required_error_info<transformation_type_info>(e)
            == transformation_type::CIRCLE_CROP);
    }
}

TEST_CASE("transformation sequences", "[imaging][transformations]")
{
    transformation_list list(
        {center_crop{200, 200}, resize{150, 150}, circle_crop{}});
    auto outcome = apply_transformations(list, make_split_image(400, 300));
    REQUIRE(outcome.image.width == 150);
    REQUIRE(outcome.image.height == 150);
    REQUIRE(outcome.applied == list.types());
    REQUIRE(outcome.skipped.empty());

    // Order matters: circle cropping first would fail on this image.
    transformation_list reversed({circle_crop{}, center_crop{10, 10}});
    REQUIRE_THROWS_AS(
        apply_transformations(reversed, make_bitmap(20, 10)),
        transformation_failure);
}

TEST_CASE("skipping applied transformations", "[imaging][transformations]")
{
    transformation_list list({resize{10, 10}, circle_crop{}});
    auto image = make_bitmap(10, 10, white);
    auto outcome = apply_transformations(
        list, image, {transformation_type::CIRCLE_CROP});
    REQUIRE(
        outcome.applied == transformation_type_list{transformation_type::RESIZE});
    REQUIRE(
        outcome.skipped
        == transformation_type_list{transformation_type::CIRCLE_CROP});
    // The circle crop really was skipped.
    REQUIRE(get_pixel(outcome.image, 0, 0) == white);

    auto everything_skipped
        = apply_transformations(list, image, list.types());
    REQUIRE(everything_skipped.applied.empty());
    REQUIRE(everything_skipped.skipped == list.types());
    REQUIRE(everything_skipped.image.pixels == image.pixels);
}
