#pragma once
#include "model/bootenv.hpp"
#include "util/lookup_table.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace render {

    enum class Protocol { Disk, Tftp, Network };

    inline constexpr util::LookupTable<std::string_view, Protocol, 4> PROTOCOL_MAP{
        std::string_view{"disk"},
        Protocol::Disk,
        std::string_view{"tftp"},
        Protocol::Tftp,
        std::string_view{"network"},
        Protocol::Network,
        std::string_view{"http"},
        Protocol::Network};

    /**
     * Maps boot environment relative paths to where each consumer finds them: the local
     * filesystem, the TFTP server (relative to its root) or the HTTP server.
     */
    class PathResolver {
        static constexpr std::string_view DISCOVERY_OS{"discovery"};
        static constexpr std::string_view INSTALL_DIR{"install"};

        std::filesystem::path _fileRoot;
        std::string _provisionerUrl;

    public:
        PathResolver(std::filesystem::path fileRoot, std::string provisionerUrl)
            : _fileRoot(std::move(fileRoot)), _provisionerUrl(std::move(provisionerUrl)) {
        }

        [[nodiscard]] const std::filesystem::path &fileRoot() const noexcept {
            return _fileRoot;
        }

        [[nodiscard]] const std::string &provisionerUrl() const noexcept {
            return _provisionerUrl;
        }

        /**
         * "<os>/install", or just "<os>" for the discovery environment.
         */
        [[nodiscard]] static std::filesystem::path installSegment(const model::OsInfo &os);

        /**
         * Throws errors::UnknownProtocolError for a tag not in PROTOCOL_MAP.
         */
        [[nodiscard]] static Protocol protocolOf(std::string_view tag);

        [[nodiscard]] std::string pathFor(
            const model::BootEnv &env, Protocol protocol, std::string_view partial) const;

        [[nodiscard]] std::string pathFor(
            const model::BootEnv &env, std::string_view tag, std::string_view partial) const {
            return pathFor(env, protocolOf(tag), partial);
        }

        [[nodiscard]] std::filesystem::path diskPath(
            const model::BootEnv &env, std::string_view partial) const {
            return pathFor(env, Protocol::Disk, partial);
        }

        /**
         * All initrds of the environment through pathFor, separated by single spaces.
         */
        [[nodiscard]] std::string joinInitrds(const model::BootEnv &env, Protocol protocol) const;

        [[nodiscard]] std::string installUrl(const model::OsInfo &os) const;

        /**
         * Where ISO images are staged.
         */
        [[nodiscard]] std::filesystem::path isoPath(const model::OsInfo &os) const {
            return _fileRoot / "isos" / os.isoFile;
        }
    };

} // namespace render
