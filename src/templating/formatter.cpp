#include "easymcp/templating/formatter.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace easymcp::templating
{

std::string to_display_string(const Json& value)
{
    if (value.is_string())
        return value.get<std::string>();
    return value.dump(-1, ' ', false, Json::error_handler_t::replace);
}

std::string url_encode(const std::string& decoded)
{
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;

    for (unsigned char c : decoded)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
            encoded << c;
        else
            encoded << '%' << std::setw(2) << static_cast<int>(c);
    }

    return encoded.str();
}

FormatterRegistry FormatterRegistry::with_builtins()
{
    FormatterRegistry registry;
    registry.register_formatter("url_encode",
                                [](const Json& value)
                                { return url_encode(to_display_string(value)); });
    return registry;
}

const FormatterRegistry& default_formatters()
{
    static const FormatterRegistry registry = FormatterRegistry::with_builtins();
    return registry;
}

} // namespace easymcp::templating
