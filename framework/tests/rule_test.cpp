#include <gtest/gtest.h>
#include "framework/rule/rule.hpp"
#include "framework/rule/route_data.hpp"
#include "framework/exception/router_exception.hpp"
#include <string>
#include <vector>

using namespace routekit::framework;

namespace
{
  RouteHandler noop_handler()
  {
    return [](const RouteParams&) {};
  }

  // Collects advisory messages instead of printing them
  struct WarningSink
  {
    std::vector<std::string> messages;

    WarningHandler handler()
    {
      return [this](const std::string& message) { messages.push_back(message); };
    }
  };
}

TEST(RuleTest, SplitKeepsEmptySegments)
{
  ASSERT_EQ(Rule::split(""), (std::vector<std::string>{""}));
  ASSERT_EQ(Rule::split("/"), (std::vector<std::string>{"", ""}));
  ASSERT_EQ(Rule::split("/a/b/"), (std::vector<std::string>{"", "a", "b", ""}));
  ASSERT_EQ(Rule::split("404"), (std::vector<std::string>{"404"}));
}

TEST(RuleTest, SegmentClassification)
{
  ASSERT_TRUE(Rule::is_wildcard("[*]"));
  ASSERT_FALSE(Rule::is_wildcard("*"));

  ASSERT_TRUE(Rule::is_variable("{id}"));
  ASSERT_FALSE(Rule::is_variable("{}"));
  ASSERT_FALSE(Rule::is_variable("{id"));
  ASSERT_FALSE(Rule::is_variable("id}"));
  ASSERT_FALSE(Rule::is_variable("x{id}"));
  ASSERT_EQ(Rule::variable_name("{id}"), "id");
}

TEST(RuleTest, SetPatternRebuildsSegments)
{
  Rule rule("/user/{id}", noop_handler());
  ASSERT_EQ(rule.segments().size(), 3u);

  rule.set_pattern("/a/b/c/d");
  ASSERT_EQ(rule.pattern(), "/a/b/c/d");
  ASSERT_EQ(rule.segments().size(), 5u);
  ASSERT_EQ(rule.segments()[4], "d");
}

TEST(RuleTest, EmptyHandlerIsRejected)
{
  ASSERT_THROW(Rule("/a", nullptr), PreconditionError);

  Rule rule("/a", noop_handler());
  ASSERT_THROW(rule.set_handler(nullptr), PreconditionError);
  ASSERT_THROW(rule.add_requisite(nullptr), PreconditionError);
}

TEST(RuleTest, ParamsLaterValuesOverwrite)
{
  Rule rule("/a", noop_handler());
  rule.add_param("lang", "en").add_params({{"lang", "fr"}, {"page", "1"}});

  ASSERT_EQ(rule.get_param("lang").value(), "fr");
  ASSERT_EQ(rule.get_param("page").value(), "1");
  ASSERT_FALSE(rule.get_param("missing").has_value());
  ASSERT_EQ(rule.params().size(), 2u);
}

TEST(RuleTest, FilterSearchesWithoutImplicitAnchors)
{
  Rule rule("/user/{id}", noop_handler());
  rule.set_filter("id", "[0-9]+");

  ASSERT_EQ(rule.get_filter("id").value(), "[0-9]+");
  ASSERT_TRUE(rule.filter_accepts("id", "42"));
  ASSERT_TRUE(rule.filter_accepts("id", "abc42")); // a match anywhere is enough
  ASSERT_FALSE(rule.filter_accepts("id", "abc"));

  rule.set_filter("id", "^[0-9]+$");
  ASSERT_FALSE(rule.filter_accepts("id", "abc42"));
  ASSERT_TRUE(rule.filter_accepts("id", "42"));

  // Unfiltered variables accept anything
  ASSERT_FALSE(rule.has_filter("name"));
  ASSERT_TRUE(rule.filter_accepts("name", "whatever"));
}

TEST(RuleTest, InvalidFilterThrows)
{
  Rule rule("/user/{id}", noop_handler());
  try
  {
    rule.set_filter("id", "([0-9]+");
    FAIL() << "Expected InvalidPatternError";
  }
  catch (const InvalidPatternError& e)
  {
    ASSERT_EQ(e.expression(), "([0-9]+");
  }
  ASSERT_FALSE(rule.has_filter("id"));
  ASSERT_THROW(rule.set_filter("id", "[a-"), ConfigurationError);
}

TEST(RuleTest, RequisitesShortCircuitOnFirstFalse)
{
  Rule rule("/admin", noop_handler());
  std::vector<int> calls;
  rule.add_requisite([&] { calls.push_back(1); return true; })
      .add_requisite([&] { calls.push_back(2); return false; })
      .add_requisite([&] { calls.push_back(3); return true; });

  ASSERT_FALSE(rule.passes_requisites(RequisitePolicy::Lenient, nullptr));
  ASSERT_EQ(calls, (std::vector<int>{1, 2}));
}

TEST(RuleTest, RequisiteWithoutAnswerLenientPassesWithWarning)
{
  Rule rule("/admin", noop_handler());
  WarningSink sink;
  rule.add_requisite([]() -> std::optional<bool> { return std::nullopt; });

  ASSERT_TRUE(rule.passes_requisites(RequisitePolicy::Lenient, sink.handler()));
  ASSERT_EQ(sink.messages.size(), 1u);
  ASSERT_NE(sink.messages[0].find("/admin"), std::string::npos);
  ASSERT_NE(sink.messages[0].find("does not return a boolean"), std::string::npos);
}

TEST(RuleTest, RequisiteWithoutAnswerStrictFails)
{
  Rule rule("/admin", noop_handler());
  WarningSink sink;
  bool later_called = false;
  rule.add_requisite([]() -> std::optional<bool> { return std::nullopt; })
      .add_requisite([&] { later_called = true; return true; });

  ASSERT_FALSE(rule.passes_requisites(RequisitePolicy::Strict, sink.handler()));
  ASSERT_FALSE(later_called);
  ASSERT_EQ(sink.messages.size(), 1u);
}

TEST(RuleTest, NoRequisitesPass)
{
  Rule rule("/", noop_handler());
  ASSERT_TRUE(rule.passes_requisites(RequisitePolicy::Strict, nullptr));
}

TEST(RouteDataTest, MergedPrefersParams)
{
  RouteData data(noop_handler(), {{"id", "7"}, {"lang", "from-uri"}}, {{"lang", "en"}, {"section", "users"}});

  ASSERT_EQ(data.get_route_var("id").value(), "7");
  ASSERT_EQ(data.get_param("section").value(), "users");
  ASSERT_FALSE(data.get_route_var("section").has_value());

  const RouteParams merged = data.merged();
  ASSERT_EQ(merged.size(), 3u);
  ASSERT_EQ(merged.at("lang"), "en");
  ASSERT_EQ(merged.at("id"), "7");
  ASSERT_EQ(merged.at("section"), "users");
}
