#pragma once

/**
 * Request.hpp
 *
 * Immutable description of one HTTP call: url, headers, optional body and
 * retry budget. Equality is defined on the url only.
 */

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace courier::core::downloader {

using json = nlohmann::json;

/**
 * Thrown when a Request or Task is constructed from invalid arguments
 */
class ValidationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

using Headers = std::map<std::string, std::string>;
using QueryParameters = std::map<std::string, std::string>;
using Bytes = std::vector<uint8_t>;

/**
 * Request body: absent (GET), UTF-8 text or raw bytes (POST)
 */
using RequestBody = std::variant<std::monostate, std::string, Bytes>;

class Request {
public:
    static constexpr int kMaxRetries = 10;

    /**
     * Create a request
     * @param url Raw (unencoded) url, may already contain a query
     * @param queryParameters Parameters appended to the url's query
     * @param headers Additional HTTP headers
     * @param body Body; a body turns the request into a POST
     * @param retries Retry budget in [0, 10]
     * @throws ValidationError if retries is out of range
     */
    explicit Request(const std::string& url,
                     const QueryParameters& queryParameters = {},
                     Headers headers = {},
                     RequestBody body = {},
                     int retries = 0);

    const std::string& url() const { return m_url; }
    const Headers& headers() const { return m_headers; }
    const RequestBody& body() const { return m_body; }
    int retries() const { return m_retries; }
    int retriesRemaining() const { return m_retriesRemaining; }

    bool hasBody() const { return !std::holds_alternative<std::monostate>(m_body); }
    std::string method() const { return hasBody() ? "POST" : "GET"; }

    /**
     * Copy with one retry consumed
     * @throws std::logic_error if no retries remain
     */
    Request withRetryConsumed() const;

    /**
     * Copy with an explicit remaining-retry count
     * @throws ValidationError unless 0 <= remaining <= retries()
     */
    Request withRetriesRemaining(int remaining) const;

    json toJson() const;

    /**
     * Rebuild from a persisted record
     * @throws ValidationError on a malformed record
     */
    static Request fromJson(const json& j);

    static RequestBody bodyFromJson(const json& j);
    static json bodyToJson(const RequestBody& body);

    friend bool operator==(const Request& a, const Request& b) { return a.m_url == b.m_url; }
    friend bool operator!=(const Request& a, const Request& b) { return !(a == b); }

private:
    std::string m_url;
    Headers m_headers;
    RequestBody m_body;
    int m_retries{0};
    int m_retriesRemaining{0};
};

} // namespace courier::core::downloader

namespace std {

template<>
struct hash<courier::core::downloader::Request> {
    size_t operator()(const courier::core::downloader::Request& request) const noexcept {
        return hash<string>{}(request.url());
    }
};

} // namespace std
