/**
 * UrlUtils.cpp
 *
 * URL encoding built on curl_easy_escape / curl_easy_unescape.
 */

#include "UrlUtils.hpp"

#include <curl/curl.h>

#include <cctype>
#include <cstring>
#include <memory>

namespace courier::utils {

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;

bool isHexDigit(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

std::string escapeRun(CURL* curl, const std::string& run) {
    char* output = curl_easy_escape(curl, run.c_str(), static_cast<int>(run.size()));
    if (!output) {
        return run;
    }
    std::string result(output);
    curl_free(output);
    return result;
}

} // namespace

std::string UrlUtils::urlEncode(const std::string& str) {
    CurlEasyPtr curl(curl_easy_init());
    if (!curl) return str;
    return escapeRun(curl.get(), str);
}

std::string UrlUtils::urlDecode(const std::string& str) {
    CurlEasyPtr curl(curl_easy_init());
    if (!curl) return str;
    int outLen = 0;
    char* output = curl_easy_unescape(curl.get(), str.c_str(), static_cast<int>(str.size()), &outLen);
    if (!output) return str;
    std::string result(output, static_cast<size_t>(outLen));
    curl_free(output);
    return result;
}

bool UrlUtils::isReservedOrUnreserved(unsigned char c) {
    if (std::isalnum(c)) return true;
    return c != '\0' && std::strchr("-._~:/?#[]@!$&'()*+,;=", c) != nullptr;
}

std::string UrlUtils::encodeFull(const std::string& url) {
    CurlEasyPtr curl(curl_easy_init());
    if (!curl) return url;

    std::string result;
    result.reserve(url.size());
    std::string pending;

    auto flush = [&] {
        if (!pending.empty()) {
            result += escapeRun(curl.get(), pending);
            pending.clear();
        }
    };

    for (size_t i = 0; i < url.size(); ++i) {
        char c = url[i];
        bool keep = isReservedOrUnreserved(static_cast<unsigned char>(c));
        if (c == '%' && i + 2 < url.size() && isHexDigit(url[i + 1]) && isHexDigit(url[i + 2])) {
            keep = true;
        }

        if (keep) {
            flush();
            result += c;
        } else {
            pending += c;
        }
    }
    flush();

    return result;
}

std::string UrlUtils::withQueryParameters(const std::string& url,
                                          const std::map<std::string, std::string>& params) {
    if (params.empty()) {
        return encodeFull(url);
    }

    std::string composed = url;
    composed += (url.find('?') != std::string::npos) ? '&' : '?';

    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) composed += '&';
        composed += key + "=" + value;
        first = false;
    }

    return encodeFull(composed);
}

} // namespace courier::utils
