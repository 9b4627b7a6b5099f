#include "filterlet/attribute-propagator.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>

#include "filterlet/fake-host.hpp"
#include "filterlet/host-constants.hpp"
#include "filterlet/host.hpp"
#include "filterlet/json-codec.hpp"
#include "filterlet/log.hpp"
#include "filterlet/value.hpp"

namespace filterlet::test {

class AttributePropagatorTest : public ::testing::Test {
 protected:
  AttributeExportStatus merge(const ValueMap& attributes) {
    return MergeAttributesIntoLog(host, property::CustomLog, attributes, *logger);
  }

  [[nodiscard]] std::string customLog() const {
    const std::string* pValue = host.findProperty(property::CustomLog);
    return pValue == nullptr ? std::string{} : *pValue;
  }

  FakeHost host;
  LoggerPtr logger = MakeNamedLogger("attribute-propagator-test");
};

TEST_F(AttributePropagatorTest, MergeIntoAbsentProperty) {
  EXPECT_EQ(merge({{"a", "1"}}), AttributeExportStatus::Ok);
  EXPECT_EQ(customLog(), R"({\"a\":\"1\"})");
}

TEST_F(AttributePropagatorTest, MergeKeepsPriorKeys) {
  ASSERT_EQ(merge({{"a", "1"}}), AttributeExportStatus::Ok);
  ASSERT_EQ(merge({{"b", "2"}}), AttributeExportStatus::Ok);

  EXPECT_EQ(customLog(), R"({\"a\":\"1\",\"b\":\"2\"})");

  const auto unescaped = JsonUnescape(customLog());
  ASSERT_TRUE(unescaped.has_value());
  Json json;
  ASSERT_TRUE(ParseJson(*unescaped, json));
  EXPECT_EQ(StringMember(json, "a"), "1");
  EXPECT_EQ(StringMember(json, "b"), "2");
}

TEST_F(AttributePropagatorTest, LargeIntegersAreExact) {
  // 2^53 + 1 is not representable as a double
  ASSERT_EQ(merge({{"id", int64_t{9007199254740993}}}), AttributeExportStatus::Ok);
  EXPECT_EQ(customLog(), R"({\"id\":9007199254740993})");

  ASSERT_EQ(merge({{"min", std::numeric_limits<int64_t>::min()}}), AttributeExportStatus::Ok);
  EXPECT_EQ(customLog(), R"({\"id\":9007199254740993,\"min\":-9223372036854775808})");
}

TEST_F(AttributePropagatorTest, PriorValuesAreKeptVerbatim) {
  host.setProperty(property::CustomLog, R"({\"big\":12345678901234567891,\"list\":[1,2]})");
  ASSERT_EQ(merge({{"a", "1"}}), AttributeExportStatus::Ok);
  EXPECT_EQ(customLog(), R"({\"a\":\"1\",\"big\":12345678901234567891,\"list\":[1,2]})");
}

TEST_F(AttributePropagatorTest, LastWriteWins) {
  ASSERT_EQ(merge({{"a", "1"}}), AttributeExportStatus::Ok);
  ASSERT_EQ(merge({{"a", "2"}}), AttributeExportStatus::Ok);
  EXPECT_EQ(customLog(), R"({\"a\":\"2\"})");
}

TEST_F(AttributePropagatorTest, RepeatedMergeIsIdempotent) {
  const ValueMap attributes{{"model", "qwen"}, {"tokens", 42}, {"stream", true}};
  ASSERT_EQ(merge(attributes), AttributeExportStatus::Ok);
  const std::string first = customLog();
  ASSERT_EQ(merge(attributes), AttributeExportStatus::Ok);
  EXPECT_EQ(customLog(), first);
}

TEST_F(AttributePropagatorTest, EmptyPriorIsAnEmptyObject) {
  host.setProperty(property::CustomLog, "");
  EXPECT_EQ(merge({{"a", "1"}}), AttributeExportStatus::Ok);
  EXPECT_EQ(customLog(), R"({\"a\":\"1\"})");
}

TEST_F(AttributePropagatorTest, MalformedPriorIsLeftUntouched) {
  host.setProperty(property::CustomLog, "not a json object");
  EXPECT_EQ(merge({{"a", "1"}}), AttributeExportStatus::MalformedPriorValue);
  EXPECT_EQ(customLog(), "not a json object");
}

TEST_F(AttributePropagatorTest, PriorJsonArrayIsMalformed) {
  host.setProperty(property::CustomLog, R"([\"a\"])");
  EXPECT_EQ(merge({{"a", "1"}}), AttributeExportStatus::MalformedPriorValue);
  EXPECT_EQ(customLog(), R"([\"a\"])");
}

TEST_F(AttributePropagatorTest, ReadFailure) {
  host.propertyReadStatus = HostStatus::InternalFailure;
  EXPECT_EQ(merge({{"a", "1"}}), AttributeExportStatus::HostFailure);
  host.propertyReadStatus = HostStatus::Ok;
  EXPECT_EQ(host.findProperty(property::CustomLog), nullptr);
}

TEST_F(AttributePropagatorTest, WriteFailure) {
  host.rejectedProperties.emplace_back(property::CustomLog);
  EXPECT_EQ(merge({{"a", "1"}}), AttributeExportStatus::HostFailure);
  EXPECT_EQ(host.findProperty(property::CustomLog), nullptr);
}

TEST_F(AttributePropagatorTest, CustomKey) {
  EXPECT_EQ(MergeAttributesIntoLog(host, property::AiLog, {{"a", "1"}}, *logger), AttributeExportStatus::Ok);
  ASSERT_NE(host.findProperty(property::AiLog), nullptr);
  EXPECT_EQ(*host.findProperty(property::AiLog), R"({\"a\":\"1\"})");
  EXPECT_EQ(host.findProperty(property::CustomLog), nullptr);
}

TEST_F(AttributePropagatorTest, StringWithQuotesSurvivesEscaping) {
  ASSERT_EQ(merge({{"q", R"(say "hi")"}}), AttributeExportStatus::Ok);
  ASSERT_EQ(merge({{"b", "2"}}), AttributeExportStatus::Ok);

  const auto unescaped = JsonUnescape(customLog());
  ASSERT_TRUE(unescaped.has_value());
  Json json;
  ASSERT_TRUE(ParseJson(*unescaped, json));
  EXPECT_EQ(StringMember(json, "q"), R"(say "hi")");
}

TEST_F(AttributePropagatorTest, WriteToTrace) {
  const ValueMap attributes{{"user", "alice"}, {"count", 3}, {"empty", ""}};
  EXPECT_EQ(WriteAttributesToTrace(host, attributes, *logger), 2U);

  const std::string* pUser = host.findProperty("trace_span_tag.user");
  ASSERT_NE(pUser, nullptr);
  EXPECT_EQ(*pUser, "alice");
  const std::string* pCount = host.findProperty("trace_span_tag.count");
  ASSERT_NE(pCount, nullptr);
  EXPECT_EQ(*pCount, "3");
  EXPECT_EQ(host.findProperty("trace_span_tag.empty"), nullptr);
}

TEST_F(AttributePropagatorTest, WriteToTraceSkipsRejectedTags) {
  host.rejectedProperties.emplace_back("trace_span_tag.a");
  EXPECT_EQ(WriteAttributesToTrace(host, {{"a", "1"}, {"b", "2"}}, *logger), 1U);
  EXPECT_EQ(host.findProperty("trace_span_tag.a"), nullptr);
  EXPECT_NE(host.findProperty("trace_span_tag.b"), nullptr);
}

}  // namespace filterlet::test
