// Courier - URL Utilities
// Percent-encoding and query composition on top of libcurl

#pragma once

#include <map>
#include <string>

namespace courier::utils {

/**
 * @brief URL encoding helpers
 */
class UrlUtils {
public:
    /**
     * Escape every byte outside the RFC 3986 unreserved set
     * (query keys/values, path segments).
     */
    static std::string urlEncode(const std::string& str);
    static std::string urlDecode(const std::string& str);

    /**
     * Percent-encode a complete URL. Reserved and unreserved characters and
     * existing %XX escapes pass through unchanged, so an already-encoded URL
     * is returned as is.
     */
    static std::string encodeFull(const std::string& url);

    /**
     * Append query parameters ("k=v" pairs joined by '&') to a raw url,
     * using '&' if the url already has a query and '?' otherwise, then
     * encode the result with encodeFull().
     */
    static std::string withQueryParameters(const std::string& url,
                                           const std::map<std::string, std::string>& params);

    static bool isReservedOrUnreserved(unsigned char c);
};

} // namespace courier::utils
