#include "core/downloader/Request.hpp"

#include <gtest/gtest.h>

#include <unordered_set>

using namespace courier::core::downloader;

TEST(RequestTest, AcceptsRetryBounds) {
    EXPECT_NO_THROW(Request("https://example.com/a", {}, {}, {}, 0));
    EXPECT_NO_THROW(Request("https://example.com/a", {}, {}, {}, 10));
}

TEST(RequestTest, RejectsRetriesOutOfRange) {
    EXPECT_THROW(Request("https://example.com/a", {}, {}, {}, -1), ValidationError);
    EXPECT_THROW(Request("https://example.com/a", {}, {}, {}, 11), ValidationError);
}

TEST(RequestTest, ValidationErrorIsInvalidArgument) {
    try {
        Request("https://example.com/a", {}, {}, {}, 42);
        FAIL() << "expected ValidationError";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("42"), std::string::npos);
    }
}

TEST(RequestTest, AppendsQueryWithQuestionMark) {
    Request request("https://example.com/file", {{"a", "1"}, {"b", "2"}});
    EXPECT_EQ(request.url(), "https://example.com/file?a=1&b=2");
}

TEST(RequestTest, AppendsQueryToExistingQuery) {
    Request request("https://example.com/file?x=0", {{"a", "1"}});
    EXPECT_EQ(request.url(), "https://example.com/file?x=0&a=1");
}

TEST(RequestTest, EncodesUnsafeCharactersOnce) {
    Request request("https://example.com/my file.txt", {{"q", "a b"}});
    EXPECT_EQ(request.url(), "https://example.com/my%20file.txt?q=a%20b");

    Request again(request.url());
    EXPECT_EQ(again.url(), request.url());
}

TEST(RequestTest, RetriesRemainingStartsAtRetries) {
    Request request("https://example.com/a", {}, {}, {}, 3);
    EXPECT_EQ(request.retries(), 3);
    EXPECT_EQ(request.retriesRemaining(), 3);
}

TEST(RequestTest, WithRetryConsumedReturnsDecrementedCopy) {
    Request request("https://example.com/a", {}, {}, {}, 2);
    Request once = request.withRetryConsumed();

    EXPECT_EQ(request.retriesRemaining(), 2);
    EXPECT_EQ(once.retriesRemaining(), 1);
    EXPECT_EQ(once.withRetryConsumed().retriesRemaining(), 0);
    EXPECT_THROW(once.withRetryConsumed().withRetryConsumed(), std::logic_error);
}

TEST(RequestTest, WithRetriesRemainingValidatesRange) {
    Request request("https://example.com/a", {}, {}, {}, 2);
    EXPECT_EQ(request.withRetriesRemaining(0).retriesRemaining(), 0);
    EXPECT_THROW(request.withRetriesRemaining(3), ValidationError);
    EXPECT_THROW(request.withRetriesRemaining(-1), ValidationError);
}

TEST(RequestTest, BodySelectsMethod) {
    EXPECT_EQ(Request("https://example.com/a").method(), "GET");
    EXPECT_EQ(Request("https://example.com/a", {}, {}, std::string("x=1")).method(), "POST");
    EXPECT_EQ(Request("https://example.com/a", {}, {}, Bytes{1, 2, 3}).method(), "POST");
}

TEST(RequestTest, EqualityAndHashUseUrlOnly) {
    Request a("https://example.com/a", {}, {{"Accept", "text/plain"}});
    Request b("https://example.com/a", {}, {}, std::string("body"), 4);
    Request c("https://example.com/c");

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(std::hash<Request>{}(a), std::hash<Request>{}(b));

    std::unordered_set<Request> set{a, b, c};
    EXPECT_EQ(set.size(), 2u);
}

TEST(RequestTest, BodyRecordShapes) {
    EXPECT_TRUE(Request::bodyToJson(std::monostate{}).is_null());
    EXPECT_EQ(Request::bodyToJson(std::string("text")), json("text"));
    EXPECT_EQ(Request::bodyToJson(Bytes{0, 255}), json::array({0, 255}));

    EXPECT_EQ(std::get<Bytes>(Request::bodyFromJson(json::array({7, 8}))), (Bytes{7, 8}));
    EXPECT_THROW(Request::bodyFromJson(json::object({{"a", 1}})), ValidationError);
    EXPECT_THROW(Request::bodyFromJson(json::array({300})), ValidationError);
    EXPECT_THROW(Request::bodyFromJson(json(12)), ValidationError);
}

TEST(RequestTest, RecordKeepsRetryProgress) {
    Request request = Request("https://example.com/a", {}, {{"X-Key", "v"}}, std::string("p"), 5)
                          .withRetryConsumed();
    Request restored = Request::fromJson(request.toJson());

    EXPECT_EQ(restored.url(), request.url());
    EXPECT_EQ(restored.headers(), request.headers());
    EXPECT_EQ(std::get<std::string>(restored.body()), "p");
    EXPECT_EQ(restored.retries(), 5);
    EXPECT_EQ(restored.retriesRemaining(), 4);
}

TEST(RequestTest, MalformedRecordIsValidationError) {
    EXPECT_THROW(Request::fromJson(json::object({{"headers", json::object()}})), ValidationError);
    EXPECT_THROW(Request::fromJson(json::object({{"url", 5}})), ValidationError);
}
