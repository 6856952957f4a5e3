// framework/router/router.hpp
#ifndef ROUTEKIT_FRAMEWORK_ROUTER_ROUTER_HPP
#define ROUTEKIT_FRAMEWORK_ROUTER_ROUTER_HPP

#include "config/router_options.hpp"
#include "matcher.hpp"
#include "rule_table.hpp"
#include <optional>
#include <string>

namespace routekit::framework
{
  class Router
  {
  public:
    Router();
    explicit Router(RouterOptions options);

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    Rule& add_route(const std::string& rule, RouteHandler handler);
    Rule& override_route(const std::string& rule, RouteHandler handler);

    void set_uri_prefix(std::string prefix);
    const std::string& uri_prefix() const;

    std::optional<RouteData> match(const std::string& uri, bool ignore_wildcard = false) const;

    /**
     * @brief Matches the URI, falling back to the not-found rule, and invokes the handler with
     * the route variables overlaid by the rule's params.
     * @return false if neither the URI nor the not-found rule matched.
     */
    bool dispatch(const std::string& uri) const;

    const RuleTable& routes() const { return table_; }
    const RouterOptions& options() const { return options_; }

  private:
    RouterOptions options_;
    RuleTable table_;
    Matcher matcher_;
  };
}

#endif // ROUTEKIT_FRAMEWORK_ROUTER_ROUTER_HPP
