#include "file_fetcher.hpp"
#include "errors/errors.hpp"
#include "logging/logging.hpp"

static const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("com.example.provisioner.media.FileFetcher");

namespace media {

    bool FileFetcher::validate(const model::BootEnv &env, const model::FileData &file) const {
        return std::filesystem::exists(destination(env, file));
    }

    bool FileFetcher::ensure(const model::BootEnv &env, const model::FileData &file) {
        if(validate(env, file)) {
            return false;
        }
        auto dest = destination(env, file);
        LOG.atInfo("file-fetch").kv("url", file.url).kv("dest", dest).log();

        std::error_code ec;
        std::filesystem::create_directories(dest.parent_path(), ec);
        if(ec) {
            LOG.atError("file-fetch-error")
                .kv("dest", dest)
                .kv("error", ec.message())
                .logAndThrow(errors::FileFetchFailedError(
                    "Unable to create " + dest.parent_path().generic_string() + ": "
                    + ec.message()));
        }
        _downloader.download(file.url, dest);

        if(!validate(env, file)) {
            LOG.atError("file-validate-error")
                .kv("url", file.url)
                .kv("dest", dest)
                .logAndThrow(errors::FileFetchFailedError(
                    "File " + file.name + " still not valid after fetching " + file.url));
        }
        return true;
    }

    size_t FileFetcher::ensureAll(const model::BootEnv &env) {
        size_t fetched = 0;
        for(const auto &file : env.os.files) {
            if(ensure(env, file)) {
                ++fetched;
            }
        }
        return fetched;
    }

} // namespace media
