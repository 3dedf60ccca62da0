#pragma once

#include "errors/error_base.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

/**
 * Logging is structured: a log entry is not simply a string, it is an event name, a message,
 * key/value context and an optional cause. Disabled levels cost no more than a level check.
 * Logger names follow the dotted "com.example.provisioner.Component" convention.
 */
namespace logging {

    enum class Level { None, Trace, Debug, Info, Warn, Error };
    enum class Format { Text, Json };
    enum class OutputType { File, Console };

    struct LogEntry {
        Level level{Level::Info};
        std::string loggerName;
        std::string event;
        std::string message;
        std::vector<std::pair<std::string, std::string>> contexts;
        std::optional<std::pair<std::string, std::string>> cause; // kind, message
        std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
    };

    namespace detail {
        template<typename T>
        std::string toLogString(const T &value) {
            if constexpr(std::is_same_v<T, bool>) {
                return value ? "true" : "false";
            } else if constexpr(std::is_arithmetic_v<T>) {
                return std::to_string(value);
            } else if constexpr(std::is_same_v<T, std::filesystem::path>) {
                return value.generic_string();
            } else {
                return std::string{std::string_view{value}};
            }
        }

        void commit(const LogEntry &entry);
    } // namespace detail

    /**
     * Builder to build a single event. An event with no entry is a no-op (level disabled).
     */
    class Event {
        std::shared_ptr<LogEntry> _entry;

        void setCause(const errors::Error &err) {
            if(_entry) {
                _entry->cause.emplace(err.kind(), err.what());
                if(_entry->message.empty()) {
                    _entry->message = err.what();
                }
            }
        }

    public:
        Event() = default;

        explicit Event(std::shared_ptr<LogEntry> entry) noexcept : _entry(std::move(entry)) {
        }

        /**
         * Log a cause of error/event
         */
        Event &cause(const errors::Error &cause) {
            setCause(cause);
            return *this;
        }

        Event &cause(const std::exception &cause) {
            setCause(errors::Error::of(cause));
            return *this;
        }

        /**
         * Log an event type - this is expected to be a constant string
         */
        Event &event(std::string_view eventType) {
            if(_entry) {
                _entry->event = eventType;
            }
            return *this;
        }

        /**
         * Add context information to event
         */
        template<typename T>
        Event &kv(std::string_view key, const T &value) {
            if(_entry) {
                _entry->contexts.emplace_back(key, detail::toLogString(value));
            }
            return *this;
        }

        /**
         * Commit the log entry and throw the error, preserving its type
         */
        template<typename ErrorType>
        [[noreturn]] void logAndThrow(const ErrorType &err) {
            if constexpr(std::is_base_of_v<errors::Error, ErrorType>) {
                setCause(err);
            } else {
                setCause(errors::Error::of(err));
            }
            log();
            throw err;
        }

        void log() {
            if(_entry) {
                detail::commit(*_entry);
                _entry.reset();
            }
        }

        void log(std::string_view message) {
            if(_entry) {
                _entry->message = message;
            }
            log();
        }
    };

    /**
     * Event factory for logging to a given tag. The returned value may be stored statically and
     * is thread safe.
     */
    class Logger {
        std::string _loggerName;

        explicit Logger(std::string_view loggerName) : _loggerName(loggerName) {
        }

    public:
        static Logger of(std::string_view loggerName) {
            return Logger{loggerName};
        }

        [[nodiscard]] const std::string &getLoggerName() const noexcept {
            return _loggerName;
        }

        [[nodiscard]] bool isEnabled(Level level) const;

        /**
         * Builder for an enum log level. If not logging, the returned Event is a no-op.
         */
        [[nodiscard]] Event atLevel(Level level) const;

        [[nodiscard]] Event atTrace(std::string_view eventType = {}) const {
            return atLevel(Level::Trace).event(eventType);
        }

        [[nodiscard]] Event atDebug(std::string_view eventType = {}) const {
            return atLevel(Level::Debug).event(eventType);
        }

        [[nodiscard]] Event atInfo(std::string_view eventType = {}) const {
            return atLevel(Level::Info).event(eventType);
        }

        [[nodiscard]] Event atWarn(std::string_view eventType = {}) const {
            return atLevel(Level::Warn).event(eventType);
        }

        [[nodiscard]] Event atError(std::string_view eventType = {}) const {
            return atLevel(Level::Error).event(eventType);
        }
    };
} // namespace logging
