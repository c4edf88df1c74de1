#pragma once
#include "easymcp/types.hpp"

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace easymcp::templating
{

/// Turns a resolved template value into the text substituted for it.
using Formatter = std::function<std::string(const Json&)>;

/// String form of a value: strings verbatim, everything else as compact JSON.
std::string to_display_string(const Json& value);

/// Percent-encode every byte outside the RFC 3986 unreserved set
/// (ALPHA / DIGIT / "-" / "." / "_" / "~"). Not idempotent: "%" is encoded too.
std::string url_encode(const std::string& decoded);

/// Name-indexed table of formatters. Templates look formatters up here when
/// they are compiled, so adding one never changes the template grammar.
class FormatterRegistry
{
  public:
    /// Registry holding the built-in formatters ("url_encode").
    static FormatterRegistry with_builtins();

    void register_formatter(const std::string& name, Formatter formatter)
    {
        formatters_[name] = std::move(formatter);
    }

    /// nullptr when no formatter of that name is registered.
    const Formatter* find(const std::string& name) const
    {
        auto it = formatters_.find(name);
        return it == formatters_.end() ? nullptr : &it->second;
    }

  private:
    std::unordered_map<std::string, Formatter> formatters_;
};

/// Shared read-only registry with the built-ins.
const FormatterRegistry& default_formatters();

} // namespace easymcp::templating
