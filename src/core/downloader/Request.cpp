/**
 * Request.cpp
 *
 * Request validation, retry bookkeeping and record conversion.
 */

#include "Request.hpp"
#include "../../utils/UrlUtils.hpp"

namespace courier::core::downloader {

Request::Request(const std::string& url,
                 const QueryParameters& queryParameters,
                 Headers headers,
                 RequestBody body,
                 int retries)
    : m_url(utils::UrlUtils::withQueryParameters(url, queryParameters))
    , m_headers(std::move(headers))
    , m_body(std::move(body))
    , m_retries(retries)
    , m_retriesRemaining(retries) {
    if (retries < 0 || retries > kMaxRetries) {
        throw ValidationError("Number of retries must be in range 0 through 10, got "
                              + std::to_string(retries));
    }
}

Request Request::withRetryConsumed() const {
    if (m_retriesRemaining <= 0) {
        throw std::logic_error("No retries remaining for " + m_url);
    }
    Request copy = *this;
    --copy.m_retriesRemaining;
    return copy;
}

Request Request::withRetriesRemaining(int remaining) const {
    if (remaining < 0 || remaining > m_retries) {
        throw ValidationError("retriesRemaining must be in range 0 through "
                              + std::to_string(m_retries) + ", got " + std::to_string(remaining));
    }
    Request copy = *this;
    copy.m_retriesRemaining = remaining;
    return copy;
}

json Request::bodyToJson(const RequestBody& body) {
    if (const auto* text = std::get_if<std::string>(&body)) {
        return *text;
    }
    if (const auto* bytes = std::get_if<Bytes>(&body)) {
        return json(*bytes);
    }
    return nullptr;
}

RequestBody Request::bodyFromJson(const json& j) {
    if (j.is_null()) {
        return std::monostate{};
    }
    if (j.is_string()) {
        return j.get<std::string>();
    }
    if (j.is_array()) {
        Bytes bytes;
        bytes.reserve(j.size());
        for (const auto& element : j) {
            if (!element.is_number_integer() || element.get<int>() < 0 || element.get<int>() > 255) {
                throw ValidationError("Field post must be a string or a byte array");
            }
            bytes.push_back(static_cast<uint8_t>(element.get<int>()));
        }
        return bytes;
    }
    throw ValidationError("Field post must be a string or a byte array");
}

json Request::toJson() const {
    return {
        {"url", m_url},
        {"headers", m_headers},
        {"post", bodyToJson(m_body)},
        {"retries", m_retries},
        {"retriesRemaining", m_retriesRemaining}
    };
}

Request Request::fromJson(const json& j) {
    try {
        Request request(j.at("url").get<std::string>(),
                        {},
                        j.value("headers", Headers{}),
                        bodyFromJson(j.value("post", json())),
                        j.value("retries", 0));
        return request.withRetriesRemaining(j.value("retriesRemaining", request.retries()));
    } catch (const json::exception& e) {
        throw ValidationError(std::string("Malformed request record: ") + e.what());
    }
}

} // namespace courier::core::downloader
