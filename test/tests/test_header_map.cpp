#include <gtest/gtest.h>
#include "access_trace.hpp"

class HeaderMapTest : public ::testing::Test {};

TEST_F(HeaderMapTest, LookupIsCaseInsensitive) {
    atrace::HeaderMap headers;
    headers.add("User-Agent", "curl/8.5.0");

    ASSERT_NE(headers.find("user-agent"), nullptr);
    ASSERT_NE(headers.find("USER-AGENT"), nullptr);
    EXPECT_EQ(headers.find("user-agent")->front(), "curl/8.5.0");
    EXPECT_TRUE(headers.contains("uSeR-aGeNt"));
}

TEST_F(HeaderMapTest, MissingHeaderReturnsNull) {
    atrace::HeaderMap headers;
    headers.add("Accept", "*/*");
    EXPECT_EQ(headers.find("Referer"), nullptr);
    EXPECT_EQ(headers.first("Referer", "-"), "-");
}

TEST_F(HeaderMapTest, RepeatedAddKeepsValueOrder) {
    atrace::HeaderMap headers;
    headers.add("Set-Cookie", "a=1");
    headers.add("set-cookie", "b=2");
    headers.add("SET-COOKIE", "c=3");

    ASSERT_EQ(headers.size(), 1u);
    const std::vector<std::string>* values = headers.find("Set-Cookie");
    ASSERT_NE(values, nullptr);
    ASSERT_EQ(values->size(), 3u);
    EXPECT_EQ((*values)[0], "a=1");
    EXPECT_EQ((*values)[1], "b=2");
    EXPECT_EQ((*values)[2], "c=3");
}

TEST_F(HeaderMapTest, FirstSpellingIsKeptForDisplay) {
    atrace::HeaderMap headers;
    headers.add("X-Request-Id", "1");
    headers.add("x-request-id", "2");
    ASSERT_EQ(headers.size(), 1u);
    EXPECT_EQ(headers.begin()->name, "X-Request-Id");
    EXPECT_EQ(headers.begin()->key, "x-request-id");
}

TEST_F(HeaderMapTest, DistinctNamesKeepInsertionOrder) {
    atrace::HeaderMap headers = {{"Host", "example.com"}, {"Accept", "*/*"}, {"Referer", "/home"}};
    std::vector<std::string> names;
    for (const auto& entry : headers) {
        names.push_back(entry.name);
    }
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "Host");
    EXPECT_EQ(names[1], "Accept");
    EXPECT_EQ(names[2], "Referer");
}

TEST_F(HeaderMapTest, SetReplacesAllValues) {
    atrace::HeaderMap headers;
    headers.add("Accept", "text/html");
    headers.add("Accept", "application/json");
    headers.set("ACCEPT", "*/*");
    const std::vector<std::string>* values = headers.find("accept");
    ASSERT_NE(values, nullptr);
    ASSERT_EQ(values->size(), 1u);
    EXPECT_EQ(values->front(), "*/*");
}

TEST_F(HeaderMapTest, RemoveDropsHeader) {
    atrace::HeaderMap headers;
    headers.add("Accept", "*/*");
    EXPECT_TRUE(headers.remove("accept"));
    EXPECT_FALSE(headers.remove("accept"));
    EXPECT_TRUE(headers.empty());
}
