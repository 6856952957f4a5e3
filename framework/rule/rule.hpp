// framework/rule/rule.hpp
#ifndef ROUTEKIT_FRAMEWORK_RULE_RULE_HPP
#define ROUTEKIT_FRAMEWORK_RULE_RULE_HPP

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace routekit::framework
{
  using RouteParams = std::map<std::string, std::string>;
  using RouteHandler = std::function<void(const RouteParams&)>;

  // A requisite answers true/false, or std::nullopt when it has no boolean answer.
  using Requisite = std::function<std::optional<bool>()>;
  using WarningHandler = std::function<void(const std::string&)>;

  // Prints "Warning: <message>" to stderr.
  WarningHandler default_warning_handler();

  enum class RequisitePolicy
  {
    Lenient, // a requisite without a boolean answer passes (after a warning)
    Strict // a requisite without a boolean answer fails the rule
  };

  struct RouteFilter
  {
    std::string source;
    std::regex regex;
  };

  class Rule
  {
  public:
    static constexpr std::string_view WILDCARD = "[*]";
    static constexpr char VARIABLE_FIRST = '{';
    static constexpr char VARIABLE_LAST = '}';

    Rule(std::string pattern, RouteHandler handler);

    // Rebuilds the segment list. Does not re-key the rule inside a RuleTable.
    Rule& set_pattern(std::string pattern);
    const std::string& pattern() const { return pattern_; }
    const std::vector<std::string>& segments() const { return segments_; }

    Rule& set_handler(RouteHandler handler);
    const RouteHandler& handler() const { return handler_; }

    /**
     * @brief Adds a static parameter, merged into every match of this rule.
     * Parameters take precedence over route variables with the same name at dispatch.
     */
    Rule& add_param(const std::string& key, std::string value);
    Rule& add_params(const RouteParams& params);
    std::optional<std::string> get_param(const std::string& key) const;
    const RouteParams& params() const { return params_; }

    /**
     * @brief Constrains a route variable with a regular expression (ECMAScript grammar).
     * The captured value must contain a match; the expression is not implicitly anchored.
     * @throws InvalidPatternError if the expression does not compile.
     */
    Rule& set_filter(const std::string& route_var, const std::string& expression);
    std::optional<std::string> get_filter(const std::string& route_var) const;
    const std::map<std::string, RouteFilter>& filters() const { return filters_; }
    bool has_filter(const std::string& route_var) const;
    bool filter_accepts(const std::string& route_var, const std::string& value) const;

    Rule& add_requisite(Requisite requisite);
    const std::vector<Requisite>& requisites() const { return requisites_; }

    /**
     * @brief Evaluates every requisite in registration order, stopping at the first false.
     * @param policy What a requisite without a boolean answer counts as.
     * @param warn Receives the advisory message for a requisite without a boolean answer.
     */
    bool passes_requisites(RequisitePolicy policy, const WarningHandler& warn) const;

    // Splits on '/', keeping empty segments: "/a/" -> {"", "a", ""}.
    static std::vector<std::string> split(std::string_view path);
    static bool is_wildcard(std::string_view segment);
    // "{name}" with a non-empty name.
    static bool is_variable(std::string_view segment);
    static std::string variable_name(std::string_view segment);

  private:
    std::string pattern_;
    std::vector<std::string> segments_;
    RouteHandler handler_;
    RouteParams params_;
    std::map<std::string, RouteFilter> filters_;
    std::vector<Requisite> requisites_;
  };
}

#endif // ROUTEKIT_FRAMEWORK_RULE_RULE_HPP
