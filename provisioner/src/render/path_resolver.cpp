#include "path_resolver.hpp"
#include "errors/errors.hpp"

namespace render {

    namespace {
        std::string_view relative(std::string_view partial) {
            while(!partial.empty() && partial.front() == '/') {
                partial.remove_prefix(1);
            }
            return partial;
        }

        std::string_view withoutTrailingSlash(std::string_view url) {
            while(!url.empty() && url.back() == '/') {
                url.remove_suffix(1);
            }
            return url;
        }
    } // namespace

    std::filesystem::path PathResolver::installSegment(const model::OsInfo &os) {
        std::filesystem::path segment{os.name};
        if(os.name != DISCOVERY_OS) {
            segment /= INSTALL_DIR;
        }
        return segment;
    }

    Protocol PathResolver::protocolOf(std::string_view tag) {
        auto protocol = PROTOCOL_MAP.lookup(tag);
        if(!protocol.has_value()) {
            throw errors::UnknownProtocolError("Unknown protocol: " + std::string{tag});
        }
        return protocol.value();
    }

    std::string PathResolver::pathFor(
        const model::BootEnv &env, Protocol protocol, std::string_view partial) const {
        auto tail = (installSegment(env.os) / relative(partial)).lexically_normal();
        switch(protocol) {
            case Protocol::Disk:
                return (_fileRoot / tail).lexically_normal().string();
            case Protocol::Tftp:
                return tail.generic_string();
            case Protocol::Network:
                return std::string{withoutTrailingSlash(_provisionerUrl)} + "/"
                       + tail.generic_string();
        }
        throw errors::UnknownProtocolError("Unknown protocol");
    }

    std::string PathResolver::joinInitrds(const model::BootEnv &env, Protocol protocol) const {
        std::string result;
        for(const auto &initrd : env.initrds) {
            if(!result.empty()) {
                result += ' ';
            }
            result += pathFor(env, protocol, initrd);
        }
        return result;
    }

    std::string PathResolver::installUrl(const model::OsInfo &os) const {
        // always the install tree, including for discovery
        return std::string{withoutTrailingSlash(_provisionerUrl)} + "/" + os.name + "/"
               + std::string{INSTALL_DIR};
    }

} // namespace render
