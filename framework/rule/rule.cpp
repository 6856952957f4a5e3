// framework/rule/rule.cpp
#include "rule.hpp"
#include "exception/router_exception.hpp"
#include <fmt/core.h>

namespace routekit::framework
{
  WarningHandler default_warning_handler()
  {
    return [](const std::string& message)
    {
      fmt::print(stderr, "Warning: {}\n", message);
    };
  }

  Rule::Rule(std::string pattern, RouteHandler handler)
  {
    set_pattern(std::move(pattern));
    set_handler(std::move(handler));
  }

  Rule& Rule::set_pattern(std::string pattern)
  {
    pattern_ = std::move(pattern);
    segments_ = split(pattern_);
    return *this;
  }

  Rule& Rule::set_handler(RouteHandler handler)
  {
    if (!handler)
    {
      throw PreconditionError(fmt::format("Route rule: \"{}\" requires a callable handler.", pattern_));
    }
    handler_ = std::move(handler);
    return *this;
  }

  Rule& Rule::add_param(const std::string& key, std::string value)
  {
    params_[key] = std::move(value);
    return *this;
  }

  Rule& Rule::add_params(const RouteParams& params)
  {
    for (const auto& [key, value] : params)
    {
      add_param(key, value);
    }
    return *this;
  }

  std::optional<std::string> Rule::get_param(const std::string& key) const
  {
    if (const auto it = params_.find(key); it != params_.end())
    {
      return it->second;
    }
    return std::nullopt;
  }

  Rule& Rule::set_filter(const std::string& route_var, const std::string& expression)
  {
    try
    {
      filters_[route_var] = RouteFilter{expression, std::regex(expression)};
    }
    catch (const std::regex_error& e)
    {
      throw InvalidPatternError(expression, e.what());
    }
    return *this;
  }

  std::optional<std::string> Rule::get_filter(const std::string& route_var) const
  {
    if (const auto it = filters_.find(route_var); it != filters_.end())
    {
      return it->second.source;
    }
    return std::nullopt;
  }

  bool Rule::has_filter(const std::string& route_var) const
  {
    return filters_.count(route_var) != 0;
  }

  bool Rule::filter_accepts(const std::string& route_var, const std::string& value) const
  {
    const auto it = filters_.find(route_var);
    if (it == filters_.end())
    {
      return true;
    }
    return std::regex_search(value, it->second.regex);
  }

  Rule& Rule::add_requisite(Requisite requisite)
  {
    if (!requisite)
    {
      throw PreconditionError(fmt::format("Route rule: \"{}\" cannot take an empty requisite.", pattern_));
    }
    requisites_.push_back(std::move(requisite));
    return *this;
  }

  bool Rule::passes_requisites(const RequisitePolicy policy, const WarningHandler& warn) const
  {
    for (const auto& requisite : requisites_)
    {
      const std::optional<bool> result = requisite();
      if (result.has_value())
      {
        if (!*result)
        {
          return false;
        }
        continue;
      }

      if (policy == RequisitePolicy::Strict)
      {
        if (warn)
        {
          warn(fmt::format("A requisite for route rule: {} does not return a boolean; the rule is rejected.",
                           pattern_));
        }
        return false;
      }
      if (warn)
      {
        warn(fmt::format("A requisite for route rule: {} does not return a boolean; it will be ignored.", pattern_));
      }
    }
    return true;
  }

  std::vector<std::string> Rule::split(const std::string_view path)
  {
    std::vector<std::string> segments;
    std::size_t start = 0;
    std::size_t found = path.find('/');
    while (found != std::string_view::npos)
    {
      segments.emplace_back(path.substr(start, found - start));
      start = found + 1;
      found = path.find('/', start);
    }
    segments.emplace_back(path.substr(start));
    return segments;
  }

  bool Rule::is_wildcard(const std::string_view segment)
  {
    return segment == WILDCARD;
  }

  bool Rule::is_variable(const std::string_view segment)
  {
    return segment.size() > 2 && segment.front() == VARIABLE_FIRST && segment.back() == VARIABLE_LAST;
  }

  std::string Rule::variable_name(const std::string_view segment)
  {
    return std::string(segment.substr(1, segment.size() - 2));
  }
}
