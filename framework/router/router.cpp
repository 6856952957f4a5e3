// framework/router/router.cpp
#include "router.hpp"
#include <fmt/core.h>

namespace routekit::framework
{
  namespace
  {
    RouterOptions with_default_warning(RouterOptions options)
    {
      if (!options.on_warning)
      {
        options.on_warning = default_warning_handler();
      }
      return options;
    }
  }

  Router::Router() : Router(RouterOptions{})
  {
  }

  Router::Router(RouterOptions options)
    : options_(with_default_warning(std::move(options))),
      table_(options_.uri_prefix, options_.on_warning, options_.verbose),
      matcher_(table_, options_.strict_requisites ? RequisitePolicy::Strict : RequisitePolicy::Lenient,
               options_.on_warning)
  {
  }

  Rule& Router::add_route(const std::string& rule, RouteHandler handler)
  {
    return table_.add(rule, std::move(handler));
  }

  Rule& Router::override_route(const std::string& rule, RouteHandler handler)
  {
    return table_.override(rule, std::move(handler));
  }

  void Router::set_uri_prefix(std::string prefix)
  {
    table_.set_prefix(prefix);
    options_.uri_prefix = std::move(prefix);
  }

  const std::string& Router::uri_prefix() const
  {
    return table_.prefix();
  }

  std::optional<RouteData> Router::match(const std::string& uri, const bool ignore_wildcard) const
  {
    return matcher_.match(uri, ignore_wildcard);
  }

  bool Router::dispatch(const std::string& uri) const
  {
    std::optional<RouteData> route_data = match(uri);
    if (!route_data)
    {
      route_data = match(options_.not_found_rule);
    }
    if (!route_data)
    {
      options_.on_warning(fmt::format("No {} route is defined for the router", options_.not_found_rule));
      return false;
    }

    if (options_.verbose)
    {
      fmt::print("Dispatching {} with {} route variable(s)\n", uri, route_data->route_vars().size());
    }
    route_data->handler()(route_data->merged());
    return true;
  }
}
