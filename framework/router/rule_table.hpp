// framework/router/rule_table.hpp
#ifndef ROUTEKIT_FRAMEWORK_ROUTER_RULE_TABLE_HPP
#define ROUTEKIT_FRAMEWORK_ROUTER_RULE_TABLE_HPP

#include "rule/rule.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace routekit::framework
{
  struct RuleEntry
  {
    std::string key; // normalized pattern, variables collapsed to "{}"
    std::unique_ptr<Rule> rule;
  };

  // Rules in registration order, keyed by normalized pattern.
  class RuleTable
  {
  public:
    explicit RuleTable(std::string prefix = "", WarningHandler warn = default_warning_handler(), bool verbose = false);

    RuleTable(const RuleTable&) = delete;
    RuleTable& operator=(const RuleTable&) = delete;

    /**
     * @brief Registers a new rule. The prefix is prepended when the pattern starts with '/'.
     * @return The stored rule, valid until it is removed or overridden.
     * @throws DuplicateRuleError if a rule with the same normalized pattern exists.
     */
    Rule& add(const std::string& pattern, RouteHandler handler);

    /**
     * @brief Replaces the rule with the same normalized pattern, or adds it with a warning if
     * there was nothing to replace. The new rule goes to the end of the order.
     * The existing rule is kept if the new one cannot be built.
     */
    Rule& override(const std::string& pattern, RouteHandler handler);

    // @throws InvalidArgumentError unless prefix is empty, or starts with '/' and does not end with '/'.
    void set_prefix(std::string prefix);
    const std::string& prefix() const { return prefix_; }

    // An empty handler restores default_warning_handler().
    void set_warning_handler(WarningHandler warn);
    void set_verbose(bool verbose) { verbose_ = verbose; }

    // Lookups resolve the pattern against the current prefix first.
    bool contains(const std::string& pattern) const;
    Rule* find(const std::string& pattern);
    const Rule* find(const std::string& pattern) const;
    bool remove(const std::string& pattern);

    std::string apply_prefix(const std::string& pattern) const;
    static std::string normalize(const std::string& pattern);
    static void validate_prefix(const std::string& prefix);

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const std::vector<RuleEntry>& entries() const { return entries_; }
    auto begin() const { return entries_.begin(); }
    auto end() const { return entries_.end(); }

  private:
    std::vector<RuleEntry> entries_;
    std::string prefix_;
    WarningHandler warn_;
    bool verbose_;

    std::vector<RuleEntry>::const_iterator find_key(const std::string& key) const;
    Rule& store(std::unique_ptr<Rule> rule, std::string key);
  };
}

#endif // ROUTEKIT_FRAMEWORK_ROUTER_RULE_TABLE_HPP
