#pragma once
#include "file_fetcher.hpp"

namespace media {

    /**
     * libcurl downloader. Follows redirects and treats HTTP error statuses as failures. The
     * body is staged with util::CommitableFile.
     */
    class CurlDownloader : public FileDownloader {
    public:
        CurlDownloader();

        void download(const std::string &url, const std::filesystem::path &dest) override;
    };

} // namespace media
