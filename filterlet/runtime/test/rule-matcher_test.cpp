#include "filterlet/rule-matcher.hpp"

#include <gtest/gtest.h>
#include <spdlog/sinks/ringbuffer_sink.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "filterlet/json-codec.hpp"
#include "filterlet/log.hpp"
#include "filterlet/request-info.hpp"

namespace filterlet::test {

namespace {

struct NameConfig {
  std::string name;
  std::string inherited;
};

Json MakeJson(std::string_view text) {
  Json json;
  if (!ParseJson(text, json)) {
    throw std::invalid_argument("invalid json in test");
  }
  return json;
}

void ParseName(const Json& json, NameConfig& config) {
  const auto name = StringMember(json, "name");
  if (!name) {
    throw std::invalid_argument("missing 'name'");
  }
  config.name = *name;
}

void ParseNameOverride(const Json& json, const NameConfig& global, NameConfig& config) {
  config.inherited = global.name;
  ParseName(json, config);
}

RequestMetadata Request(std::string_view host, std::string_view path, std::string_view route = {},
                        std::string_view service = {}) {
  return RequestMetadata{std::string(host), std::string(path), std::string(route), std::string(service)};
}

}  // namespace

class RuleMatcherTest : public ::testing::Test {
 protected:
  // Last lines logged through the plugin logger
  [[nodiscard]] std::string loggedLines() const {
    std::string lines;
    for (const std::string& line : sink->last_formatted()) {
      lines.append(line);
    }
    return lines;
  }

  std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16);
  LoggerPtr logger = std::make_shared<Logger>("rule-matcher-test", sink);
};

TEST_F(RuleMatcherTest, DomainMatches) {
  EXPECT_TRUE(DomainMatches("example.com", "example.com"));
  EXPECT_TRUE(DomainMatches("example.com", "example.com:8080"));
  EXPECT_FALSE(DomainMatches("example.com", "api.example.com"));
  EXPECT_TRUE(DomainMatches("*.example.com", "api.example.com"));
  EXPECT_TRUE(DomainMatches("*.example.com", "api.example.com:443"));
  EXPECT_FALSE(DomainMatches("*.example.com", "example.org"));
  EXPECT_TRUE(DomainMatches("example.*", "example.org"));
  EXPECT_FALSE(DomainMatches("example.*", "foo.example.org"));
  EXPECT_TRUE(DomainMatches("[::1]", "[::1]:8080"));
}

TEST_F(RuleMatcherTest, PathMatches) {
  EXPECT_TRUE(PathMatches("/a", "/a"));
  EXPECT_TRUE(PathMatches("/a", "/a?x=1"));
  EXPECT_FALSE(PathMatches("/a", "/ab"));
  EXPECT_TRUE(PathMatches("/api/*", "/api/v1/items"));
  EXPECT_FALSE(PathMatches("/api/*", "/other"));
}

TEST_F(RuleMatcherTest, CriteriaParse) {
  EXPECT_TRUE(RuleMatchCriteria::Parse(MakeJson(R"({"name":"x"})"), *logger).empty());
  EXPECT_FALSE(RuleMatchCriteria::Parse(MakeJson(R"({"_match_route_":["r"]})"), *logger).empty());
  EXPECT_THROW(RuleMatchCriteria::Parse(MakeJson(R"({"_match_route_":"r"})"), *logger), std::invalid_argument);
  EXPECT_THROW(RuleMatchCriteria::Parse(MakeJson(R"({"_match_domain_":[1]})"), *logger), std::invalid_argument);
}

TEST_F(RuleMatcherTest, CriteriaAllKindsMustMatch) {
  const auto criteria =
      RuleMatchCriteria::Parse(MakeJson(R"({"_match_route_":["r1","r2"],"_match_path_":["/a","/b*"]})"), *logger);
  EXPECT_TRUE(criteria.matches(Request("h", "/a", "r1")));
  EXPECT_TRUE(criteria.matches(Request("h", "/bcd", "r2")));
  EXPECT_FALSE(criteria.matches(Request("h", "/a", "r3")));
  EXPECT_FALSE(criteria.matches(Request("h", "/c", "r1")));
}

TEST_F(RuleMatcherTest, CriteriaService) {
  const auto criteria = RuleMatchCriteria::Parse(MakeJson(R"({"_match_service_":["svc-a"]})"), *logger);
  EXPECT_TRUE(criteria.matches(Request("h", "/", "", "svc-a")));
  EXPECT_FALSE(criteria.matches(Request("h", "/", "", "svc-b")));
}

TEST_F(RuleMatcherTest, EmptyConfigEnablesGlobally) {
  RuleMatcher<NameConfig> matcher;
  int nbCalls = 0;
  matcher.build(
      MakeJson("{}"), [&nbCalls](const Json&, NameConfig& config) {
        ++nbCalls;
        config.name = "default";
      },
      {}, *logger);
  EXPECT_EQ(nbCalls, 1);
  EXPECT_TRUE(matcher.hasGlobalConfig());
  EXPECT_EQ(matcher.nbRules(), 0U);
  const auto config = matcher.resolve(Request("any.host", "/any"));
  ASSERT_NE(config, nullptr);
  EXPECT_EQ(config->name, "default");
}

TEST_F(RuleMatcherTest, GlobalOnly) {
  RuleMatcher<NameConfig> matcher;
  matcher.build(MakeJson(R"({"name":"global"})"), ParseName, {}, *logger);
  const auto config = matcher.resolve(Request("h", "/"));
  ASSERT_NE(config, nullptr);
  EXPECT_EQ(config->name, "global");
}

TEST_F(RuleMatcherTest, FirstMatchingRuleWins) {
  RuleMatcher<NameConfig> matcher;
  matcher.build(MakeJson(R"({
    "name": "global",
    "_rules_": [
      {"_match_path_": ["/a"], "name": "R"},
      {"_match_path_": ["/a", "/c"], "name": "S"}
    ]
  })"),
                ParseName, {}, *logger);
  EXPECT_EQ(matcher.nbRules(), 2U);
  EXPECT_EQ(matcher.resolve(Request("h", "/a"))->name, "R");
  EXPECT_EQ(matcher.resolve(Request("h", "/c"))->name, "S");
  EXPECT_EQ(matcher.resolve(Request("h", "/b"))->name, "global");
}

TEST_F(RuleMatcherTest, RulesWithoutGlobalLeaveOthersUnmatched) {
  RuleMatcher<NameConfig> matcher;
  matcher.build(MakeJson(R"({"_rules_": [{"_match_domain_": ["*.example.com"], "name": "R"}]})"), ParseName, {},
                *logger);
  EXPECT_FALSE(matcher.hasGlobalConfig());
  ASSERT_NE(matcher.resolve(Request("api.example.com", "/")), nullptr);
  EXPECT_EQ(matcher.resolve(Request("example.org", "/")), nullptr);
}

TEST_F(RuleMatcherTest, RuleSharesConfigInstance) {
  RuleMatcher<NameConfig> matcher;
  matcher.build(MakeJson(R"({"_rules_": [{"_match_route_": ["r"], "name": "R"}]})"), ParseName, {}, *logger);
  const auto first = matcher.resolve(Request("h", "/", "r"));
  const auto second = matcher.resolve(Request("h", "/", "r"));
  EXPECT_EQ(first.get(), second.get());
}

TEST_F(RuleMatcherTest, OverrideParserReceivesGlobal) {
  RuleMatcher<NameConfig> matcher;
  matcher.build(MakeJson(R"({"name": "global", "_rules_": [{"_match_route_": ["r"], "name": "R"}]})"), ParseName,
                ParseNameOverride, *logger);
  const auto config = matcher.resolve(Request("h", "/", "r"));
  ASSERT_NE(config, nullptr);
  EXPECT_EQ(config->name, "R");
  EXPECT_EQ(config->inherited, "global");
}

TEST_F(RuleMatcherTest, OverrideParserWithoutGlobalReceivesZeroConfig) {
  RuleMatcher<NameConfig> matcher;
  matcher.build(MakeJson(R"({"_rules_": [{"_match_route_": ["r"], "name": "R"}]})"), ParseName, ParseNameOverride,
                *logger);
  const auto config = matcher.resolve(Request("h", "/", "r"));
  ASSERT_NE(config, nullptr);
  EXPECT_EQ(config->inherited, "");
}

TEST_F(RuleMatcherTest, InvalidGlobalIsIgnoredWhenRulesExist) {
  RuleMatcher<NameConfig> matcher;
  matcher.build(MakeJson(R"({"other": 1, "_rules_": [{"_match_route_": ["r"], "name": "R"}]})"), ParseName, {},
                *logger);
  EXPECT_FALSE(matcher.hasGlobalConfig());
  EXPECT_EQ(matcher.nbRules(), 1U);
  EXPECT_NE(loggedLines().find("global configuration is ignored"), std::string::npos);
  EXPECT_NE(loggedLines().find("rule-matcher-test"), std::string::npos);
}

TEST_F(RuleMatcherTest, InvalidMatchKeyIsLoggedToGivenLogger) {
  EXPECT_THROW(RuleMatchCriteria::Parse(MakeJson(R"({"_match_path_":"/a"})"), *logger), std::invalid_argument);
  EXPECT_NE(loggedLines().find("_match_path_"), std::string::npos);
}

TEST_F(RuleMatcherTest, InvalidGlobalWithoutRulesThrows) {
  RuleMatcher<NameConfig> matcher;
  EXPECT_THROW(matcher.build(MakeJson(R"({"other": 1})"), ParseName, {}, *logger), std::invalid_argument);
  EXPECT_THROW(matcher.build(MakeJson(R"({"other": 1, "_rules_": []})"), ParseName, {}, *logger),
               std::invalid_argument);
}

TEST_F(RuleMatcherTest, RuleWithoutCriteriaThrows) {
  RuleMatcher<NameConfig> matcher;
  EXPECT_THROW(matcher.build(MakeJson(R"({"_rules_": [{"name": "R"}]})"), ParseName, {}, *logger),
               std::invalid_argument);
}

TEST_F(RuleMatcherTest, RulesMustBeAnArray) {
  RuleMatcher<NameConfig> matcher;
  EXPECT_THROW(matcher.build(MakeJson(R"({"_rules_": {"name": "R"}})"), ParseName, {}, *logger), std::invalid_argument);
}

TEST_F(RuleMatcherTest, ConfigMustBeAnObject) {
  RuleMatcher<NameConfig> matcher;
  EXPECT_THROW(matcher.build(MakeJson(R"([1, 2])"), ParseName, {}, *logger), std::invalid_argument);
}

TEST_F(RuleMatcherTest, FailedBuildKeepsPreviousRuleSet) {
  RuleMatcher<NameConfig> matcher;
  matcher.build(MakeJson(R"({"name": "first"})"), ParseName, {}, *logger);
  EXPECT_THROW(matcher.build(MakeJson(R"({"name": "second", "_rules_": [{"name": "R"}]})"), ParseName, {}, *logger),
               std::invalid_argument);
  const auto config = matcher.resolve(Request("h", "/"));
  ASSERT_NE(config, nullptr);
  EXPECT_EQ(config->name, "first");
}

}  // namespace filterlet::test
