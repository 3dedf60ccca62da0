#pragma once
#include "logging.hpp"
#include "util/lookup_table.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace logging {

    /**
     * Requested logging changes, as read from configuration. Values are the configuration
     * spelling (e.g. "DEBUG", "json"); values that are not recognized leave the current setting.
     */
    struct LogConfig {
        std::optional<std::string> level;
        std::optional<std::string> format;
        std::optional<std::string> outputType;
        std::optional<std::filesystem::path> outputDirectory;
    };

    class LogManager {
        constexpr static std::string_view DEFAULT_LOG_BASE{"provisioner"};
        constexpr static std::string_view LOG_EXTENSION{".log"};

        mutable std::shared_mutex _mutex;
        std::mutex _writeMutex;
        std::atomic<Level> _level{Level::Info};
        Format _format{Format::Text};
        OutputType _outputType{OutputType::Console};
        std::filesystem::path _outputDirectory;
        std::ofstream _stream;

        LogManager() = default;

        std::ostream &stream();
        void changeOutput();
        void writeText(std::ostream &out, const LogEntry &entry) const;
        void writeJson(std::ostream &out, const LogEntry &entry) const;

    public:
        static constexpr util::LookupTable<std::string_view, Level, 6> LEVEL_MAP{
            std::string_view{"NONE"},
            Level::None,
            std::string_view{"TRACE"},
            Level::Trace,
            std::string_view{"DEBUG"},
            Level::Debug,
            std::string_view{"INFO"},
            Level::Info,
            std::string_view{"WARN"},
            Level::Warn,
            std::string_view{"ERROR"},
            Level::Error};

        static constexpr util::LookupTable<std::string_view, Format, 2> FORMAT_MAP{
            std::string_view{"TEXT"}, Format::Text, std::string_view{"JSON"}, Format::Json};

        static constexpr util::LookupTable<std::string_view, OutputType, 2> OUTPUT_TYPE_MAP{
            std::string_view{"CONSOLE"},
            OutputType::Console,
            std::string_view{"FILE"},
            OutputType::File};

        LogManager(const LogManager &) = delete;
        LogManager(LogManager &&) = delete;
        LogManager &operator=(const LogManager &) = delete;
        LogManager &operator=(LogManager &&) = delete;
        ~LogManager() = default;

        static LogManager &instance();

        [[nodiscard]] Level getLevel() const noexcept {
            return _level;
        }

        void setLevel(Level level) noexcept {
            _level = level;
        }

        [[nodiscard]] bool isEnabled(Level level) const noexcept {
            Level current = _level;
            return level != Level::None && current != Level::None && current <= level;
        }

        [[nodiscard]] Format getFormat() const {
            std::shared_lock guard{_mutex};
            return _format;
        }

        [[nodiscard]] OutputType getOutputType() const {
            std::shared_lock guard{_mutex};
            return _outputType;
        }

        [[nodiscard]] std::filesystem::path getLogPath() const;

        /**
         * Apply a configuration change. Returns true if the output destination changed.
         */
        bool reconfigure(const LogConfig &config);

        void logEvent(const LogEntry &entry);

        void syncOutput();
    };
} // namespace logging
