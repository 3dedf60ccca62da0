#pragma once
#include <string>
#include <string_view>

namespace util {

    /**
     * Components of a parsed URL. Host carries the port when one is given ("host:port").
     */
    struct UrlParts {
        std::string scheme;
        std::string host;
        std::string path;
    };

    /**
     * Parse a URL with libcurl's URL API. A reference without a scheme ("/seed/preseed.cfg")
     * yields only a path. The path is empty when nothing follows the authority. Throws
     * errors::InvalidUrlError on failure.
     */
    [[nodiscard]] UrlParts parseUrl(std::string_view rawUrl);

} // namespace util
