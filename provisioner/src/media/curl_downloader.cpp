#include "curl_downloader.hpp"
#include "errors/errors.hpp"
#include "logging/logging.hpp"
#include "util/commitable_file.hpp"

#include <array>
#include <curl/curl.h>
#include <memory>
#include <mutex>

static const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("com.example.provisioner.media.CurlDownloader");

namespace media {

    namespace {
        struct CurlDeleter {
            void operator()(CURL *curl) const noexcept {
                curl_easy_cleanup(curl);
            }
        };

        using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

        // Returning less than requested makes curl abort with CURLE_WRITE_ERROR
        size_t writeBody(char *data, size_t size, size_t count, void *userData) noexcept {
            auto *file = static_cast<util::CommitableFile *>(userData);
            try {
                file->getStream().write(data, static_cast<std::streamsize>(size * count));
                return size * count;
            } catch(const std::ios_base::failure &) {
                return 0;
            }
        }

        std::once_flag curlInit;
    } // namespace

    CurlDownloader::CurlDownloader() {
        std::call_once(curlInit, []() {
            if(curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
                throw errors::FileFetchFailedError("Unable to initialize libcurl");
            }
        });
    }

    void CurlDownloader::download(const std::string &url, const std::filesystem::path &dest) {
        CurlHandle curl{curl_easy_init()};
        if(!curl) {
            LOG.atError("curl-init-error")
                .logAndThrow(errors::FileFetchFailedError("Unable to create curl handle"));
        }

        util::CommitableFile file{dest};
        try {
            file.begin(std::ios::out | std::ios::trunc | std::ios::binary);
        } catch(const std::ios_base::failure &e) {
            LOG.atError("file-open-error")
                .kv("dest", dest)
                .cause(e)
                .logAndThrow(errors::FileFetchFailedError(
                    "Unable to open " + file.getNewFile().generic_string()));
        }

        std::array<char, CURL_ERROR_SIZE> errorBuffer{};
        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errorBuffer.data());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeBody);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &file);

        auto rc = curl_easy_perform(curl.get());
        if(rc != CURLE_OK) {
            std::string reason =
                errorBuffer[0] != '\0' ? errorBuffer.data() : curl_easy_strerror(rc);
            file.abandon();
            LOG.atError("download-error")
                .kv("url", url)
                .kv("dest", dest)
                .kv("reason", reason)
                .logAndThrow(errors::FileFetchFailedError(
                    "Unable to fetch " + url + ": " + reason));
        }

        try {
            file.commit();
        } catch(const std::exception &e) {
            LOG.atError("download-commit-error")
                .kv("dest", dest)
                .cause(e)
                .logAndThrow(errors::FileFetchFailedError(
                    "Unable to store " + dest.generic_string() + ": " + e.what()));
        }
        LOG.atInfo("download-complete").kv("url", url).kv("dest", dest).log();
    }

} // namespace media
