// framework/rule/route_data.cpp
#include "route_data.hpp"

namespace routekit::framework
{
  RouteData::RouteData(RouteHandler handler, RouteParams route_vars, RouteParams params)
    : handler_(std::move(handler)), route_vars_(std::move(route_vars)), params_(std::move(params))
  {
  }

  std::optional<std::string> RouteData::get_route_var(const std::string& name) const
  {
    if (const auto it = route_vars_.find(name); it != route_vars_.end())
    {
      return it->second;
    }
    return std::nullopt;
  }

  std::optional<std::string> RouteData::get_param(const std::string& key) const
  {
    if (const auto it = params_.find(key); it != params_.end())
    {
      return it->second;
    }
    return std::nullopt;
  }

  RouteParams RouteData::merged() const
  {
    RouteParams result = params_;
    // insert() keeps existing keys, so params stay ahead of route variables
    result.insert(route_vars_.begin(), route_vars_.end());
    return result;
  }
}
