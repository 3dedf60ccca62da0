#pragma once
#include "model/bootenv.hpp"
#include "render/path_resolver.hpp"

#include <filesystem>
#include <string>

namespace media {

    /**
     * Transfers a remote file to a local path. Implementations only make the destination
     * visible once the transfer is complete.
     */
    class FileDownloader {
    public:
        FileDownloader() = default;
        FileDownloader(const FileDownloader &) = delete;
        FileDownloader(FileDownloader &&) = delete;
        FileDownloader &operator=(const FileDownloader &) = delete;
        FileDownloader &operator=(FileDownloader &&) = delete;
        virtual ~FileDownloader() = default;

        /**
         * Throws errors::FileFetchFailedError.
         */
        virtual void download(const std::string &url, const std::filesystem::path &dest) = 0;
    };

    /**
     * Makes sure the auxiliary files of an OS are present in the install tree.
     */
    class FileFetcher {
        const render::PathResolver &_paths;
        FileDownloader &_downloader;

    public:
        FileFetcher(const render::PathResolver &paths, FileDownloader &downloader)
            : _paths(paths), _downloader(downloader) {
        }

        [[nodiscard]] std::filesystem::path destination(
            const model::BootEnv &env, const model::FileData &file) const {
            return _paths.diskPath(env, file.name);
        }

        /**
         * Existence check only; ValidationURL and ValidationMethod are not consulted yet.
         */
        [[nodiscard]] bool validate(const model::BootEnv &env, const model::FileData &file) const;

        /**
         * Download the file if it does not validate. Returns true if a download happened.
         */
        bool ensure(const model::BootEnv &env, const model::FileData &file);

        /**
         * ensure() every file of the environment's OS. Returns the number downloaded.
         */
        size_t ensureAll(const model::BootEnv &env);
    };

} // namespace media
