// example/route_demo.cpp
// Usage: routekit_demo [--config options.json] <uri>...
#include "router/router.hpp"
#include "exception/router_exception.hpp"
#include <fmt/core.h>
#include <string>
#include <vector>

namespace rk = routekit::framework;

namespace
{
  void print_route(const std::string& name, const rk::RouteParams& params)
  {
    fmt::print("-> {}", name);
    for (const auto& [key, value] : params)
    {
      fmt::print(" {}={}", key, value);
    }
    fmt::print("\n");
  }

  void register_routes(rk::Router& router, const bool& logged_in)
  {
    router.add_route("/", [](const rk::RouteParams& p) { print_route("home", p); });
    router.add_route("/about", [](const rk::RouteParams& p) { print_route("about", p); });

    router.add_route("/user/{id}", [](const rk::RouteParams& p) { print_route("user", p); })
          .set_filter("id", "^[0-9]+$")
          .add_param("section", "users");

    router.add_route("/account/{tab}", [](const rk::RouteParams& p) { print_route("account", p); })
          .add_requisite([&logged_in]
          {
            fmt::print("   checking session for /account\n");
            return logged_in;
          });

    router.add_route("/files/[*]", [](const rk::RouteParams& p) { print_route("files", p); });
    router.add_route("/files/{name}", [](const rk::RouteParams& p) { print_route("file", p); });

    router.add_route("404", [](const rk::RouteParams& p) { print_route("not found", p); });
  }
}

int main(int argc, char* argv[])
{
  std::vector<std::string> uris;
  rk::RouterOptions options;

  try
  {
    for (int i = 1; i < argc; ++i)
    {
      const std::string arg = argv[i];
      if (arg == "--config" && i + 1 < argc)
      {
        options = rk::load_router_options(argv[++i]);
      }
      else
      {
        uris.push_back(arg);
      }
    }

    if (uris.empty())
    {
      uris = {"/", "/about", "/user/7", "/user/abc", "/account/settings", "/files/a.pdf", "/files/x/y"};
    }

    const bool logged_in = false;
    rk::Router router(options);
    register_routes(router, logged_in);

    for (const auto& uri : uris)
    {
      fmt::print("{}\n", uri);
      router.dispatch(uri);
    }
  }
  catch (const rk::RouterError& e)
  {
    fmt::print(stderr, "Router configuration failed: {}\n", e.what());
    return 1;
  }
  return 0;
}
