#include "easymcp/templating/template.hpp"

#include "easymcp/exceptions.hpp"

#include <cctype>
#include <cstring>
#include <optional>

namespace easymcp::templating
{

namespace
{

bool is_ident_start(char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_path_char(char c)
{
    return is_ident_char(c) || c == '-';
}

void skip_ws(const std::string& s, size_t& pos)
{
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos])))
        ++pos;
}

struct ParsedExpression
{
    std::vector<std::string> path;
    std::string formatter;
    size_t end; // one past the closing brace
};

// Try to read an expression whose "{" sits at open. Anything that is not a
// complete expression leaves the brace to be emitted literally.
std::optional<ParsedExpression> parse_expression(const std::string& s, size_t open)
{
    size_t pos = open + 1;
    skip_ws(s, pos);

    const size_t root_len = std::strlen(INPUT_ROOT);
    if (s.compare(pos, root_len, INPUT_ROOT) != 0)
        return std::nullopt;
    pos += root_len;
    if (pos < s.size() && is_ident_char(s[pos]))
        return std::nullopt; // e.g. "{ inputs }"

    ParsedExpression expr;
    while (pos < s.size() && s[pos] == '.')
    {
        ++pos;
        size_t start = pos;
        while (pos < s.size() && is_path_char(s[pos]))
            ++pos;
        if (pos == start)
            return std::nullopt;
        expr.path.push_back(s.substr(start, pos - start));
    }

    skip_ws(s, pos);
    if (pos < s.size() && s[pos] == '|')
    {
        ++pos;
        skip_ws(s, pos);
        if (pos >= s.size() || !is_ident_start(s[pos]))
            return std::nullopt;
        size_t start = pos;
        while (pos < s.size() && is_ident_char(s[pos]))
            ++pos;
        expr.formatter = s.substr(start, pos - start);
        skip_ws(s, pos);
    }

    if (pos >= s.size() || s[pos] != '}')
        return std::nullopt;
    expr.end = pos + 1;
    return expr;
}

bool is_index(const std::string& segment)
{
    if (segment.empty())
        return false;
    for (char c : segment)
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
    return true;
}

std::string dotted(const std::vector<std::string>& path, size_t count)
{
    std::string out = INPUT_ROOT;
    for (size_t i = 0; i < count && i < path.size(); ++i)
        out += "." + path[i];
    return out;
}

const Json& resolve(const Json& context, const Segment& seg)
{
    auto fail = [&](const std::string& reason) -> RenderError
    {
        return RenderError("cannot resolve '" + dotted(seg.path, seg.path.size()) +
                               "' in template expression '" + seg.text + "': " + reason,
                           seg.text);
    };

    if (!context.is_object() || !context.contains(INPUT_ROOT))
        throw fail("no '" + std::string(INPUT_ROOT) + "' value in context");

    const Json* cur = &context[INPUT_ROOT];
    for (size_t i = 0; i < seg.path.size(); ++i)
    {
        const auto& key = seg.path[i];
        if (cur->is_object())
        {
            auto it = cur->find(key);
            if (it == cur->end())
                throw fail("'" + dotted(seg.path, i) + "' has no field '" + key + "'");
            cur = &*it;
        }
        else if (cur->is_array())
        {
            if (!is_index(key))
                throw fail("'" + dotted(seg.path, i) + "' is an array, '" + key +
                           "' is not an index");
            size_t idx = key.size() > 9 ? cur->size() : std::stoul(key);
            if (idx >= cur->size())
                throw fail("index " + key + " out of range for '" + dotted(seg.path, i) +
                           "' (size " + std::to_string(cur->size()) + ")");
            cur = &(*cur)[idx];
        }
        else
        {
            throw fail("'" + dotted(seg.path, i) + "' is " + std::string(cur->type_name()) +
                       ", not an object or array");
        }
    }
    return *cur;
}

} // namespace

Template Template::compile(const std::string& source, const FormatterRegistry& formatters)
{
    Template tpl;
    tpl.source_ = source;

    std::string literal;
    size_t pos = 0;
    while (pos < source.size())
    {
        size_t open = source.find('{', pos);
        if (open == std::string::npos)
        {
            literal.append(source, pos, std::string::npos);
            break;
        }
        literal.append(source, pos, open - pos);

        auto expr = parse_expression(source, open);
        if (!expr)
        {
            literal.push_back('{');
            pos = open + 1;
            continue;
        }

        if (!literal.empty())
        {
            Segment lit;
            lit.text = std::move(literal);
            tpl.segments_.push_back(std::move(lit));
            literal.clear();
        }

        Segment seg;
        seg.kind = Segment::Kind::Lookup;
        seg.text = source.substr(open, expr->end - open);
        seg.path = std::move(expr->path);
        if (!expr->formatter.empty())
        {
            const Formatter* f = formatters.find(expr->formatter);
            if (!f)
                throw ConfigError("unknown formatter '" + expr->formatter +
                                  "' in template expression '" + seg.text + "'");
            seg.formatter_name = expr->formatter;
            seg.formatter = *f;
        }
        tpl.segments_.push_back(std::move(seg));
        pos = expr->end;
    }

    if (!literal.empty())
    {
        Segment lit;
        lit.text = std::move(literal);
        tpl.segments_.push_back(std::move(lit));
    }
    return tpl;
}

std::string Template::render(const Json& context) const
{
    std::string out;
    out.reserve(source_.size());
    for (const auto& seg : segments_)
    {
        if (seg.kind == Segment::Kind::Literal)
        {
            out += seg.text;
            continue;
        }
        const Json& value = resolve(context, seg);
        out += seg.formatter ? seg.formatter(value) : to_display_string(value);
    }
    return out;
}

std::string Template::render_input(const Json& input) const
{
    return render(Json{{INPUT_ROOT, input}});
}

bool Template::is_literal() const
{
    for (const auto& seg : segments_)
        if (seg.kind == Segment::Kind::Lookup)
            return false;
    return true;
}

std::string render(const std::string& source, const Json& context)
{
    return Template::compile(source).render(context);
}

} // namespace easymcp::templating
