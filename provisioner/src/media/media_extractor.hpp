#pragma once
#include <filesystem>
#include <string>

namespace media {

    /**
     * Unpacks an installation ISO into the install tree. Implementations must create the
     * completion marker in the target directory on success.
     */
    class MediaExtractor {
    public:
        MediaExtractor() = default;
        MediaExtractor(const MediaExtractor &) = delete;
        MediaExtractor(MediaExtractor &&) = delete;
        MediaExtractor &operator=(const MediaExtractor &) = delete;
        MediaExtractor &operator=(MediaExtractor &&) = delete;
        virtual ~MediaExtractor() = default;

        /**
         * Throws errors::MediaExtractionError.
         */
        virtual void extract(
            const std::string &osName,
            const std::filesystem::path &isoPath,
            const std::filesystem::path &targetDir) = 0;
    };

    /**
     * Runs an external script as "<command> <os-name> <iso-path> <target-dir>".
     */
    class ScriptMediaExtractor : public MediaExtractor {
        std::filesystem::path _command;

    public:
        explicit ScriptMediaExtractor(std::filesystem::path command)
            : _command(std::move(command)) {
        }

        void extract(
            const std::string &osName,
            const std::filesystem::path &isoPath,
            const std::filesystem::path &targetDir) override;
    };

} // namespace media
