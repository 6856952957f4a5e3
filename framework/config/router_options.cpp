// framework/config/router_options.cpp
#include "router_options.hpp"
#include "exception/router_exception.hpp"
#include <fmt/core.h>
#include <fstream>
#include <sstream>

namespace routekit::framework
{
  namespace json = boost::json;

  RouterOptions parse_router_options(const std::string& json_text)
  {
    boost::system::error_code ec;
    const json::value jv = json::parse(json_text, ec);
    if (ec)
    {
      throw ConfigurationError(fmt::format("Failed to parse router options: {}", ec.message()));
    }
    if (!jv.is_object())
    {
      throw ConfigurationError("Router options must be a JSON object.");
    }

    try
    {
      return json::value_to<RouterOptions>(jv);
    }
    catch (const std::exception& e)
    {
      throw ConfigurationError(fmt::format("Invalid router options: {}", e.what()));
    }
  }

  RouterOptions load_router_options(const std::string& path)
  {
    std::ifstream file(path);
    if (!file)
    {
      throw ConfigurationError(fmt::format("Failed to open router options file: {}", path));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_router_options(buffer.str());
  }
}
