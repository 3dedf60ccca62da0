#pragma once
#include "command_line.hpp"
#include "config/engine_config.hpp"
#include "lifecycle/bootenv_controller.hpp"
#include "media/curl_downloader.hpp"
#include "media/media_extractor.hpp"
#include "render/path_resolver.hpp"
#include "store/directory_store.hpp"

#include <filesystem>
#include <ostream>
#include <string>

namespace cli {

    /**
     * Wires the engine to the directory store, the extraction script and libcurl, and runs one
     * command line action against it.
     */
    class Application {
        config::EngineConfig _config;
        store::DirectoryStore _store;
        render::PathResolver _paths;
        media::ScriptMediaExtractor _extractor;
        media::CurlDownloader _downloader;
        lifecycle::BootEnvController _controller;

        [[nodiscard]] model::Machine requireMachine(const std::string &name) const;
        [[nodiscard]] model::BootEnv requireBootEnv(const std::string &name) const;

    public:
        explicit Application(config::EngineConfig config);

        void apply(const std::filesystem::path &definition, std::ostream &out);
        void remove(const std::string &name, std::ostream &out);
        void render(const std::string &machine, std::ostream &out);
        void clear(const std::string &machine, std::ostream &out);
        void list(std::ostream &out) const;

        /**
         * Run the action chosen on the command line. Errors propagate to the caller.
         */
        void run(const CommandLine &commandLine, std::ostream &out);
    };

} // namespace cli
