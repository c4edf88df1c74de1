#pragma once
#include "easymcp/templating/formatter.hpp"
#include "easymcp/types.hpp"

#include <string>
#include <vector>

namespace easymcp::templating
{

/// Root symbol every template expression is addressed under.
constexpr const char* INPUT_ROOT = "input";

/// One node of a compiled template: literal text, or a field-path lookup with
/// an optional formatter.
struct Segment
{
    enum class Kind
    {
        Literal,
        Lookup
    };

    Kind kind{Kind::Literal};
    std::string text;              ///< Literal text, or the expression source for lookups
    std::vector<std::string> path; ///< Lookup path below the root, e.g. {"user", "name"}
    std::string formatter_name;    ///< Empty when no formatter is applied
    Formatter formatter;
};

/// Compiled template.
///
/// Syntax:
///   { input }                    whole input value
///   { input.a.b }                nested object field
///   { input.items.0 }            array element
///   { input.q | url_encode }     value passed through a named formatter
///
/// Whitespace inside the braces is optional. A "{" that does not open a
/// well-formed expression (JSON bodies, shell snippets) is literal text.
class Template
{
  public:
    Template() = default;

    /// Parse source into segments. Throws ConfigError for an unknown formatter.
    static Template compile(const std::string& source,
                            const FormatterRegistry& formatters = default_formatters());

    /// Render against a context object holding the root symbol, i.e.
    /// {"input": <value>}. Throws RenderError when a lookup cannot be resolved.
    std::string render(const Json& context) const;

    /// Shorthand for render({"input": input}).
    std::string render_input(const Json& input) const;

    const std::string& source() const
    {
        return source_;
    }
    const std::vector<Segment>& segments() const
    {
        return segments_;
    }
    bool is_literal() const;

  private:
    std::string source_;
    std::vector<Segment> segments_;
};

/// Compile and render in one step with the default formatters.
std::string render(const std::string& source, const Json& context);

} // namespace easymcp::templating
