// framework/router/matcher.cpp
#include "matcher.hpp"
#include <cstddef>

namespace routekit::framework
{
  Matcher::Matcher(const RuleTable& table, const RequisitePolicy policy, WarningHandler warn)
    : table_(table), policy_(policy)
  {
    set_warning_handler(std::move(warn));
  }

  void Matcher::set_warning_handler(WarningHandler warn)
  {
    warn_ = warn ? std::move(warn) : default_warning_handler();
  }

  std::optional<RouteData> Matcher::match(const std::string& uri, const bool ignore_wildcard) const
  {
    const std::vector<std::string> uri_segments = Rule::split(uri);

    for (const auto& entry : table_)
    {
      const Rule& rule = *entry.rule;
      if (!rule.passes_requisites(policy_, warn_))
      {
        continue;
      }

      RouteParams route_vars;
      if (match_rule(rule, uri, uri_segments, ignore_wildcard, route_vars) != Verdict::Reject)
      {
        return RouteData(rule.handler(), std::move(route_vars), rule.params());
      }
    }
    return std::nullopt;
  }

  Matcher::Verdict Matcher::match_rule(const Rule& rule, const std::string& uri,
                                       const std::vector<std::string>& uri_segments, const bool ignore_wildcard,
                                       RouteParams& route_vars) const
  {
    const std::vector<std::string>& segments = rule.segments();

    for (std::size_t i = 0; i < segments.size(); ++i)
    {
      const std::string& segment = segments[i];
      const std::string* uri_segment = i < uri_segments.size() ? &uri_segments[i] : nullptr;

      if (!ignore_wildcard && Rule::is_wildcard(segment))
      {
        // The inner pass ignores wildcards, so the recursion is one level deep.
        if (match(uri, true).has_value())
        {
          return Verdict::Reject;
        }
        return Verdict::AcceptByWildcard;
      }

      if (!Rule::is_variable(segment))
      {
        if (uri_segment == nullptr || *uri_segment != segment)
        {
          return Verdict::Reject;
        }
        continue;
      }

      std::string name = Rule::variable_name(segment);
      if (rule.has_filter(name) && (uri_segment == nullptr || !rule.filter_accepts(name, *uri_segment)))
      {
        return Verdict::Reject;
      }
      if (uri_segment != nullptr)
      {
        route_vars[std::move(name)] = *uri_segment;
      }
      else
      {
        route_vars.erase(name);
      }
    }

    return segments.size() == uri_segments.size() ? Verdict::Accept : Verdict::Reject;
  }
}
