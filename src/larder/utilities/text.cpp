#include <larder/utilities/text.h>

namespace larder {

std::pair<int, int>
parse_dimensions(string const& text)
{
    auto separator = text.find('x');
    try
    {
        if (separator == string::npos)
            throw boost::bad_lexical_cast();
        auto width = lexical_cast<int>(text.substr(0, separator));
        auto height = lexical_cast<int>(text.substr(separator + 1));
        return std::make_pair(width, height);
    }
    catch (boost::bad_lexical_cast&)
    {
        LARDER_THROW(
            parsing_error() << expected_format_info("<width>x<height>")
                            << parsed_text_info(text));
    }
}

} // namespace larder
