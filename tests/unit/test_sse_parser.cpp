#include <string>
#include <gtest/gtest.h>
#include "mcp/http_client.hpp"
#include "mcp/sse_parser.hpp"

namespace {

using toolbridge::mcp::resolve_url;
using toolbridge::mcp::SseParser;

TEST(SseParserTest, ParsesEventsSplitAcrossChunks) {
    SseParser parser;
    auto first = parser.feed("event: endpoint\nda");
    EXPECT_TRUE(first.empty());

    auto second = parser.feed("ta: /messages?session=1\n\ndata: {\"id\":1}\n");
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].event, "endpoint");
    EXPECT_EQ(second[0].data, "/messages?session=1");

    auto third = parser.feed("\n");
    ASSERT_EQ(third.size(), 1u);
    EXPECT_EQ(third[0].event, "message");
    EXPECT_EQ(third[0].data, "{\"id\":1}");
}

TEST(SseParserTest, JoinsMultiLineDataAndHandlesCrLf) {
    SseParser parser;
    auto events = parser.feed("id: 7\r\ndata: line one\r\ndata: line two\r\n\r\n");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].id, "7");
    EXPECT_EQ(events[0].data, "line one\nline two");
}

TEST(SseParserTest, IgnoresCommentsAndEmptyEvents) {
    SseParser parser;
    auto events = parser.feed(": keep-alive\n\nevent: ping\n\n");
    EXPECT_TRUE(events.empty());
}

TEST(SseParserTest, FinishFlushesOpenEvent) {
    SseParser parser;
    EXPECT_TRUE(parser.feed("data: {\"done\":true}").empty());
    auto events = parser.finish();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].data, "{\"done\":true}");
}

TEST(ResolveUrlTest, ResolvesRelativeEndpoints) {
    EXPECT_EQ(resolve_url("http://host:9000/sse", "/messages?s=1"),
              "http://host:9000/messages?s=1");
    EXPECT_EQ(resolve_url("http://host:9000/mcp/sse", "messages"), "http://host:9000/mcp/messages");
    EXPECT_EQ(resolve_url("http://host:9000/sse", "https://other/post"), "https://other/post");
    EXPECT_EQ(resolve_url("http://host:9000", "/messages"), "http://host:9000/messages");
}

}  // namespace
