// framework/router/rule_table.cpp
#include "rule_table.hpp"
#include "exception/router_exception.hpp"
#include <fmt/core.h>
#include <algorithm>

namespace routekit::framework
{
  RuleTable::RuleTable(std::string prefix, WarningHandler warn, const bool verbose)
    : verbose_(verbose)
  {
    set_prefix(std::move(prefix));
    set_warning_handler(std::move(warn));
  }

  void RuleTable::set_warning_handler(WarningHandler warn)
  {
    warn_ = warn ? std::move(warn) : default_warning_handler();
  }

  void RuleTable::validate_prefix(const std::string& prefix)
  {
    if (prefix.empty())
    {
      return;
    }
    if (prefix.front() != '/')
    {
      throw InvalidArgumentError(fmt::format(
        "URI prefix must start with a forward slash(\"/\"). Input was: {}", prefix));
    }
    if (prefix.back() == '/')
    {
      throw InvalidArgumentError(fmt::format(
        "URI prefix must not end with a forward slash(\"/\"). Input was: {}", prefix));
    }
  }

  void RuleTable::set_prefix(std::string prefix)
  {
    validate_prefix(prefix);
    prefix_ = std::move(prefix);
  }

  std::string RuleTable::apply_prefix(const std::string& pattern) const
  {
    if (!prefix_.empty() && !pattern.empty() && pattern.front() == '/')
    {
      return prefix_ + pattern;
    }
    return pattern;
  }

  std::string RuleTable::normalize(const std::string& pattern)
  {
    std::string key;
    key.reserve(pattern.size());
    bool first = true;
    for (const auto& segment : Rule::split(pattern))
    {
      if (!first) key += '/';
      first = false;
      if (Rule::is_variable(segment))
      {
        key += Rule::VARIABLE_FIRST;
        key += Rule::VARIABLE_LAST;
      }
      else
      {
        key += segment;
      }
    }
    return key;
  }

  std::vector<RuleEntry>::const_iterator RuleTable::find_key(const std::string& key) const
  {
    return std::find_if(entries_.begin(), entries_.end(),
                        [&key](const RuleEntry& entry) { return entry.key == key; });
  }

  Rule& RuleTable::store(std::unique_ptr<Rule> rule, std::string key)
  {
    Rule& ref = *rule;
    entries_.push_back(RuleEntry{std::move(key), std::move(rule)});
    if (verbose_)
    {
      fmt::print("Registered route rule: {} (key: {})\n", ref.pattern(), entries_.back().key);
    }
    return ref;
  }

  Rule& RuleTable::add(const std::string& pattern, RouteHandler handler)
  {
    std::string rule = apply_prefix(pattern);
    std::string key = normalize(rule);
    if (find_key(key) != entries_.end())
    {
      throw DuplicateRuleError(rule);
    }
    return store(std::make_unique<Rule>(std::move(rule), std::move(handler)), std::move(key));
  }

  Rule& RuleTable::override(const std::string& pattern, RouteHandler handler)
  {
    std::string rule = apply_prefix(pattern);
    std::string key = normalize(rule);
    // Built before anything is erased: a rejected handler leaves the table untouched.
    auto replacement = std::make_unique<Rule>(rule, std::move(handler));

    if (const auto it = find_key(key); it != entries_.end())
    {
      entries_.erase(it);
      if (verbose_)
      {
        fmt::print("Overriding route rule: {}\n", rule);
      }
    }
    else
    {
      warn_(fmt::format("There is no route to override with: \"{}\". Adding specified route anyway...", pattern));
    }
    return store(std::move(replacement), std::move(key));
  }

  bool RuleTable::contains(const std::string& pattern) const
  {
    return find_key(normalize(apply_prefix(pattern))) != entries_.end();
  }

  Rule* RuleTable::find(const std::string& pattern)
  {
    const auto it = find_key(normalize(apply_prefix(pattern)));
    return it != entries_.end() ? it->rule.get() : nullptr;
  }

  const Rule* RuleTable::find(const std::string& pattern) const
  {
    const auto it = find_key(normalize(apply_prefix(pattern)));
    return it != entries_.end() ? it->rule.get() : nullptr;
  }

  bool RuleTable::remove(const std::string& pattern)
  {
    const auto it = find_key(normalize(apply_prefix(pattern)));
    if (it == entries_.end())
    {
      return false;
    }
    entries_.erase(it);
    return true;
  }
}
