#include "engine_config.hpp"
#include "conv/yaml_conv.hpp"
#include "errors/errors.hpp"
#include "logging/logging.hpp"

static const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("com.example.provisioner.config.EngineConfig");

namespace config {

    namespace {
        // Paths are read as text so that an absent key keeps the default.
        void visitPath(conv::Archive &archive, std::string_view name, std::filesystem::path &path) {
            std::string text;
            archive(name, text);
            if(!text.empty()) {
                path = text;
            }
        }

        struct ProvisionerSection : public conv::Serializable {
            EngineConfig &config;

            explicit ProvisionerSection(EngineConfig &config) : config(config) {
            }

            void visit(conv::Archive &archive) override {
                archive.setIgnoreCase();
                visitPath(archive, "fileRoot", config.fileRoot);
                archive("provisionerUrl", config.provisionerUrl);
                archive("commandUrl", config.commandUrl);
                visitPath(archive, "storeRoot", config.storeRoot);
                visitPath(archive, "explodeIsoCommand", config.explodeIsoCommand);
            }
        };
    } // namespace

    logging::LogConfig LoggingConfig::toLogConfig() const {
        logging::LogConfig result;
        result.level = level;
        result.format = format;
        result.outputType = outputType;
        if(outputDirectory.has_value() && !outputDirectory->empty()) {
            result.outputDirectory = std::filesystem::path{*outputDirectory};
        }
        return result;
    }

    void EngineConfig::visit(conv::Archive &archive) {
        archive.setIgnoreCase();
        ProvisionerSection section{*this};
        archive("provisioner", section);
        archive("logging", logging);
    }

    EngineConfig loadConfig(const std::filesystem::path &path) {
        if(!std::filesystem::exists(path)) {
            LOG.atError("config-missing")
                .kv("path", path)
                .logAndThrow(errors::ConfigError("Configuration file does not exist: "
                                                 + path.generic_string()));
        }
        EngineConfig config;
        conv::YamlHelper::read(path, config);
        LOG.atDebug("config-loaded")
            .kv("path", path)
            .kv("fileRoot", config.fileRoot)
            .kv("provisionerUrl", config.provisionerUrl)
            .log();
        return config;
    }

} // namespace config
