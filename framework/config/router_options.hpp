// framework/config/router_options.hpp
#ifndef ROUTEKIT_FRAMEWORK_CONFIG_ROUTER_OPTIONS_HPP
#define ROUTEKIT_FRAMEWORK_CONFIG_ROUTER_OPTIONS_HPP

#include "dto/tag_invoke.hpp"
#include "rule/rule.hpp"
#include <boost/describe.hpp>
#include <boost/json.hpp>
#include <string>

namespace routekit::framework
{
  struct RouterOptions
  {
    std::string uri_prefix;
    bool strict_requisites = false;
    std::string not_found_rule = "404";
    bool verbose = false;
    WarningHandler on_warning; // empty means default_warning_handler(); not part of the JSON form
  };

  BOOST_DESCRIBE_STRUCT(RouterOptions, (), (uri_prefix, strict_requisites, not_found_rule, verbose))

  /**
   * @brief Reads options from a JSON object. Recognized keys: uri_prefix, strict_requisites,
   * not_found_rule, verbose. Missing keys keep their defaults, unknown keys are ignored.
   * @throws ConfigurationError on malformed JSON or a wrongly typed value.
   */
  RouterOptions parse_router_options(const std::string& json_text);
  RouterOptions load_router_options(const std::string& path);
}

#endif // ROUTEKIT_FRAMEWORK_CONFIG_ROUTER_OPTIONS_HPP
