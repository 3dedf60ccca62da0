#pragma once
#include "conv/archive.hpp"
#include "logging/log_manager.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace config {

    /**
     * The "logging" section. Values are kept as written so that LogManager decides what it
     * recognizes.
     */
    struct LoggingConfig : public conv::Serializable {
        std::optional<std::string> level;
        std::optional<std::string> format;
        std::optional<std::string> outputType;
        std::optional<std::string> outputDirectory;

        void visit(conv::Archive &archive) override {
            archive.setIgnoreCase();
            archive("level", level);
            archive("format", format);
            archive("outputType", outputType);
            archive("outputDirectory", outputDirectory);
        }

        [[nodiscard]] logging::LogConfig toLogConfig() const;
    };

    /**
     * Process-wide engine settings. Passed explicitly to every component that needs them.
     */
    struct EngineConfig : public conv::Serializable {
        static constexpr std::string_view DEFAULT_FILE_ROOT{"/tftpboot"};
        static constexpr std::string_view DEFAULT_STORE_ROOT{"/var/lib/provisioner"};
        static constexpr std::string_view DEFAULT_EXPLODE_ISO{"/explode_iso.sh"};

        std::filesystem::path fileRoot{DEFAULT_FILE_ROOT};
        std::string provisionerUrl;
        std::string commandUrl;
        std::filesystem::path storeRoot{DEFAULT_STORE_ROOT};
        std::filesystem::path explodeIsoCommand{DEFAULT_EXPLODE_ISO};
        LoggingConfig logging;

        void visit(conv::Archive &archive) override;
    };

    /**
     * Read configuration from a YAML file. Throws errors::ConfigError.
     */
    [[nodiscard]] EngineConfig loadConfig(const std::filesystem::path &path);

} // namespace config
