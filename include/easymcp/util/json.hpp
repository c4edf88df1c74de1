#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace easymcp::util::json
{

using json = nlohmann::json;

inline json parse(const std::string& s)
{
    return json::parse(s);
}

/// Parse without throwing; nullopt when the text is not a JSON document.
inline std::optional<json> try_parse(const std::string& s)
{
    json j = json::parse(s, nullptr, false);
    if (j.is_discarded())
        return std::nullopt;
    return j;
}

inline std::string dump(const json& j)
{
    return j.dump();
}

} // namespace easymcp::util::json
