// framework/rule/route_data.hpp
#ifndef ROUTEKIT_FRAMEWORK_RULE_ROUTE_DATA_HPP
#define ROUTEKIT_FRAMEWORK_RULE_ROUTE_DATA_HPP

#include "rule.hpp"
#include <optional>
#include <string>

namespace routekit::framework
{
  // Result of a successful match. A variable whose URI segment was missing has no entry.
  class RouteData
  {
  public:
    RouteData(RouteHandler handler, RouteParams route_vars, RouteParams params);

    const RouteHandler& handler() const { return handler_; }
    const RouteParams& route_vars() const { return route_vars_; }
    const RouteParams& params() const { return params_; }

    std::optional<std::string> get_route_var(const std::string& name) const;
    std::optional<std::string> get_param(const std::string& key) const;

    // Route variables overlaid with the static params; params win on a shared key.
    RouteParams merged() const;

  private:
    RouteHandler handler_;
    RouteParams route_vars_;
    RouteParams params_;
  };
}

#endif // ROUTEKIT_FRAMEWORK_RULE_ROUTE_DATA_HPP
