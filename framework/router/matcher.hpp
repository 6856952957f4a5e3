// framework/router/matcher.hpp
#ifndef ROUTEKIT_FRAMEWORK_ROUTER_MATCHER_HPP
#define ROUTEKIT_FRAMEWORK_ROUTER_MATCHER_HPP

#include "rule_table.hpp"
#include "rule/route_data.hpp"
#include <optional>
#include <string>
#include <vector>

namespace routekit::framework
{
  /**
   * @brief First-match-wins matching over a RuleTable in registration order.
   *
   * A wildcard segment accepts a rule only when no other rule matches the URI with wildcards
   * ignored, so a catch-all never shadows a more specific rule regardless of where it was
   * registered. The table must not be modified while a match is running.
   */
  class Matcher
  {
  public:
    explicit Matcher(const RuleTable& table, RequisitePolicy policy = RequisitePolicy::Lenient,
                     WarningHandler warn = default_warning_handler());

    std::optional<RouteData> match(const std::string& uri, bool ignore_wildcard = false) const;

    void set_requisite_policy(RequisitePolicy policy) { policy_ = policy; }
    RequisitePolicy requisite_policy() const { return policy_; }
    // An empty handler restores default_warning_handler().
    void set_warning_handler(WarningHandler warn);

  private:
    enum class Verdict
    {
      Reject,
      Accept,
      AcceptByWildcard
    };

    const RuleTable& table_;
    RequisitePolicy policy_;
    WarningHandler warn_;

    Verdict match_rule(const Rule& rule, const std::string& uri, const std::vector<std::string>& uri_segments,
                       bool ignore_wildcard, RouteParams& route_vars) const;
  };
}

#endif // ROUTEKIT_FRAMEWORK_ROUTER_MATCHER_HPP
