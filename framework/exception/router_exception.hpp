#ifndef ROUTEKIT_FRAMEWORK_EXCEPTION_ROUTER_EXCEPTION_HPP_
#define ROUTEKIT_FRAMEWORK_EXCEPTION_ROUTER_EXCEPTION_HPP_

#include <fmt/format.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace routekit::framework
{
  class RouterError : public std::runtime_error
  {
  public:
    explicit RouterError(const std::string& what) : std::runtime_error(what)
    {
    }
  };

  /**
   * @brief Programmer mistakes discoverable at startup: duplicate rules, bad filters, bad prefixes,
   * unreadable configuration.
   */
  class ConfigurationError : public RouterError
  {
  public:
    explicit ConfigurationError(const std::string& what) : RouterError(what)
    {
    }
  };

  class DuplicateRuleError : public ConfigurationError
  {
  public:
    explicit DuplicateRuleError(std::string rule)
      : ConfigurationError(fmt::format(
          "Route rule: \"{}\" already exists. To override this route rule, use override_route.", rule)),
        rule_(std::move(rule))
    {
    }

    const std::string& rule() const { return rule_; }

  private:
    std::string rule_;
  };

  class InvalidPatternError : public ConfigurationError
  {
  public:
    InvalidPatternError(std::string expression, const std::string& reason)
      : ConfigurationError(fmt::format("Filter must be a valid regular expression. Input was: {} ({})",
                                       expression, reason)),
        expression_(std::move(expression))
    {
    }

    const std::string& expression() const { return expression_; }

  private:
    std::string expression_;
  };

  class InvalidArgumentError : public ConfigurationError
  {
  public:
    explicit InvalidArgumentError(const std::string& what) : ConfigurationError(what)
    {
    }
  };

  // Argument shapes the type system cannot rule out, e.g. an empty std::function.
  class PreconditionError : public RouterError
  {
  public:
    explicit PreconditionError(const std::string& what) : RouterError(what)
    {
    }
  };
}

#endif // ROUTEKIT_FRAMEWORK_EXCEPTION_ROUTER_EXCEPTION_HPP_
