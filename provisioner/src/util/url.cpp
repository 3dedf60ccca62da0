#include "url.hpp"
#include "errors/errors.hpp"

#include <algorithm>
#include <cctype>
#include <curl/curl.h>
#include <memory>

namespace util {

    namespace {
        struct UrlHandleDeleter {
            void operator()(CURLU *handle) const noexcept {
                curl_url_cleanup(handle);
            }
        };

        using UrlHandle = std::unique_ptr<CURLU, UrlHandleDeleter>;

        // Absent parts (no port, no path) are reported by curl as errors, those map to empty
        std::string getPart(const UrlHandle &handle, CURLUPart what) {
            char *part = nullptr;
            if(curl_url_get(handle.get(), what, &part, 0) != CURLUE_OK || part == nullptr) {
                return {};
            }
            std::string value{part};
            curl_free(part);
            return value;
        }

        // RFC 3986: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) ":"
        bool hasScheme(std::string_view rawUrl) {
            auto colon = rawUrl.find(':');
            if(colon == std::string_view::npos || colon == 0
               || std::isalpha(static_cast<unsigned char>(rawUrl[0])) == 0) {
                return false;
            }
            return std::all_of(rawUrl.begin(), rawUrl.begin() + colon, [](char c) {
                return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '+' || c == '-'
                       || c == '.';
            });
        }

        UrlParts parseReference(std::string_view rawUrl) {
            auto path = rawUrl.substr(0, rawUrl.find_first_of("?#"));
            auto firstSegment = path.substr(0, path.find('/'));
            if(firstSegment.find(':') != std::string_view::npos) {
                throw errors::InvalidUrlError(
                    "Unable to parse URL " + std::string{rawUrl}
                    + ": first path segment cannot contain a colon");
            }
            UrlParts parts;
            parts.path = std::string{path};
            return parts;
        }

        // curl reports "/" for an empty path
        bool hasPath(std::string_view rawUrl) {
            auto authority = rawUrl.find("//");
            if(authority == std::string_view::npos) {
                return true;
            }
            auto end = rawUrl.find_first_of("/?#", authority + 2);
            return end != std::string_view::npos && rawUrl[end] == '/';
        }
    } // namespace

    UrlParts parseUrl(std::string_view rawUrl) {
        if(!hasScheme(rawUrl)) {
            return parseReference(rawUrl);
        }
        UrlHandle handle{curl_url()};
        if(!handle) {
            throw errors::InvalidUrlError("Unable to allocate URL handle");
        }
        std::string url{rawUrl};
        auto rc = curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), CURLU_NON_SUPPORT_SCHEME);
        if(rc != CURLUE_OK) {
            throw errors::InvalidUrlError(
                "Unable to parse URL " + url + ": " + curl_url_strerror(rc));
        }
        UrlParts parts;
        parts.scheme = getPart(handle, CURLUPART_SCHEME);
        parts.host = getPart(handle, CURLUPART_HOST);
        auto port = getPart(handle, CURLUPART_PORT);
        if(!port.empty()) {
            parts.host += ":" + port;
        }
        if(hasPath(rawUrl)) {
            parts.path = getPart(handle, CURLUPART_PATH);
        }
        return parts;
    }

} // namespace util
