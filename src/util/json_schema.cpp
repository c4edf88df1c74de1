#include "easymcp/util/json_schema.hpp"

namespace easymcp::util::schema
{

namespace
{

bool is_type(const Json& inst, const std::string& type)
{
    if (type == "object")
        return inst.is_object();
    if (type == "array")
        return inst.is_array();
    if (type == "string")
        return inst.is_string();
    if (type == "number")
        return inst.is_number();
    if (type == "integer")
        return inst.is_number_integer();
    if (type == "boolean")
        return inst.is_boolean();
    if (type == "null")
        return inst.is_null();
    throw ValidationError("unsupported schema type '" + type + "'");
}

void validate_at(const Json& schema, const Json& inst, const std::string& path);

void validate_object(const Json& schema, const Json& inst, const std::string& path)
{
    if (schema.contains("required"))
    {
        const auto& required = schema["required"];
        if (!required.is_array())
            throw ValidationError("schema at " + path + ": 'required' must be an array", path);
        for (const auto& req : required)
        {
            if (!req.is_string())
                throw ValidationError("schema at " + path + ": 'required' entries must be strings",
                                      path);
            auto key = req.get<std::string>();
            if (!inst.contains(key))
                throw ValidationError(path + ": missing required property '" + key + "'",
                                      path + "." + key);
        }
    }

    if (schema.contains("properties"))
    {
        const auto& props = schema["properties"];
        if (!props.is_object())
            throw ValidationError("schema at " + path + ": 'properties' must be an object", path);
        for (const auto& [name, subschema] : props.items())
        {
            auto it = inst.find(name);
            if (it != inst.end())
                validate_at(subschema, *it, path + "." + name);
        }
    }
}

void validate_array(const Json& schema, const Json& inst, const std::string& path)
{
    if (!schema.contains("items"))
        return;
    const auto& items = schema["items"];
    for (size_t i = 0; i < inst.size(); ++i)
        validate_at(items, inst[i], path + "[" + std::to_string(i) + "]");
}

void validate_at(const Json& schema, const Json& inst, const std::string& path)
{
    if (schema.is_boolean())
    {
        if (!schema.get<bool>())
            throw ValidationError(path + ": no value is allowed here", path);
        return;
    }
    if (!schema.is_object())
        throw ValidationError("schema at " + path + " is not an object (got " +
                                  type_name(schema) + ")",
                              path);

    std::string declared;
    if (schema.contains("type"))
    {
        const auto& t = schema["type"];
        if (!t.is_string())
            throw ValidationError("schema at " + path + ": 'type' must be a string", path);
        declared = t.get<std::string>();
        bool matches = false;
        try
        {
            matches = is_type(inst, declared);
        }
        catch (const ValidationError& e)
        {
            throw ValidationError("schema at " + path + ": " + e.what(), path);
        }
        if (!matches)
            throw ValidationError(path + ": expected " + declared + ", got " + type_name(inst),
                                  path);
    }

    // Untyped schemas still constrain whatever shape the value has
    if (inst.is_object() && (declared.empty() || declared == "object"))
        validate_object(schema, inst, path);
    else if (inst.is_array() && (declared.empty() || declared == "array"))
        validate_array(schema, inst, path);
}

} // namespace

std::string type_name(const Json& instance)
{
    if (instance.is_object())
        return "object";
    if (instance.is_array())
        return "array";
    if (instance.is_string())
        return "string";
    if (instance.is_number_integer())
        return "integer";
    if (instance.is_number())
        return "number";
    if (instance.is_boolean())
        return "boolean";
    if (instance.is_null())
        return "null";
    return "unknown";
}

bool is_unconstrained(const Json& schema)
{
    return schema.is_null() || (schema.is_object() && schema.empty());
}

void validate(const Json& schema, const Json& instance)
{
    if (is_unconstrained(schema))
        return;
    validate_at(schema, instance, "$");
}

} // namespace easymcp::util::schema
