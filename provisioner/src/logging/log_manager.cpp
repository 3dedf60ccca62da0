#include "log_manager.hpp"
#include "util/string_util.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace logging {

    namespace detail {
        void commit(const LogEntry &entry) {
            LogManager::instance().logEvent(entry);
        }
    } // namespace detail

    bool Logger::isEnabled(Level level) const {
        return LogManager::instance().isEnabled(level);
    }

    Event Logger::atLevel(Level level) const {
        if(!isEnabled(level)) {
            return Event{};
        }
        auto entry = std::make_shared<LogEntry>();
        entry->level = level;
        entry->loggerName = _loggerName;
        return Event{entry};
    }

    LogManager &LogManager::instance() {
        static LogManager manager;
        return manager;
    }

    std::filesystem::path LogManager::getLogPath() const {
        std::shared_lock guard{_mutex};
        if(_outputType != OutputType::File || _outputDirectory.empty()) {
            return {};
        }
        std::string baseName{DEFAULT_LOG_BASE};
        baseName += LOG_EXTENSION;
        return _outputDirectory / baseName;
    }

    bool LogManager::reconfigure(const LogConfig &config) {
        std::unique_lock guard{_mutex};
        if(config.level.has_value()) {
            _level = LEVEL_MAP.lookup(util::upper(config.level.value())).value_or(_level.load());
        }
        auto format = _format;
        auto outputType = _outputType;
        auto outputDirectory = _outputDirectory;
        if(config.format.has_value()) {
            format = FORMAT_MAP.lookup(util::upper(config.format.value())).value_or(format);
        }
        if(config.outputType.has_value()) {
            outputType =
                OUTPUT_TYPE_MAP.lookup(util::upper(config.outputType.value())).value_or(outputType);
        }
        if(config.outputDirectory.has_value()) {
            outputDirectory = config.outputDirectory.value();
        }
        bool changed = outputType != _outputType || outputDirectory != _outputDirectory;
        _format = format;
        _outputType = outputType;
        _outputDirectory = outputDirectory;
        guard.unlock();
        if(changed) {
            changeOutput();
        }
        return changed;
    }

    void LogManager::changeOutput() {
        auto fullPath = getLogPath();
        std::unique_lock writeGuard{_writeMutex};
        if(_stream.is_open()) {
            _stream.close();
        }
        if(!fullPath.empty()) {
            std::filesystem::create_directories(fullPath.parent_path());
            _stream.exceptions(std::ios::failbit | std::ios::badbit);
            _stream.open(fullPath, std::ios_base::app | std::ios_base::out);
        }
    }

    std::ostream &LogManager::stream() {
        if(_stream.is_open()) {
            return _stream;
        } else {
            return std::cerr;
        }
    }

    void LogManager::syncOutput() {
        std::unique_lock writeGuard{_writeMutex};
        stream().flush();
    }

    void LogManager::logEvent(const LogEntry &entry) {
        auto format = getFormat();
        std::unique_lock writeGuard{_writeMutex};
        auto &out = stream();
        if(format == Format::Json) {
            writeJson(out, entry);
        } else {
            writeText(out, entry);
        }
        // intentionally not endl - data not flushed on every entry
        out << "\n";
        if(entry.level >= Level::Warn) {
            out.flush();
        }
    }

    void LogManager::writeJson(std::ostream &out, const LogEntry &entry) const {
        rapidjson::StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer{buffer};
        auto level = LEVEL_MAP.rlookup(entry.level).value_or("NONE");
        writer.StartObject();
        writer.Key("timestamp");
        writer.Int64(std::chrono::duration_cast<std::chrono::milliseconds>(
                         entry.timestamp.time_since_epoch())
                         .count());
        writer.Key("level");
        writer.String(level.data(), static_cast<rapidjson::SizeType>(level.size()));
        writer.Key("loggerName");
        writer.String(entry.loggerName.c_str());
        if(!entry.event.empty()) {
            writer.Key("event");
            writer.String(entry.event.c_str());
        }
        if(!entry.message.empty()) {
            writer.Key("message");
            writer.String(entry.message.c_str());
        }
        writer.Key("contexts");
        writer.StartObject();
        for(const auto &[key, value] : entry.contexts) {
            writer.Key(key.c_str());
            writer.String(value.c_str());
        }
        writer.EndObject();
        if(entry.cause.has_value()) {
            writer.Key("cause");
            writer.StartObject();
            writer.Key("kind");
            writer.String(entry.cause->first.c_str());
            writer.Key("message");
            writer.String(entry.cause->second.c_str());
            writer.EndObject();
        }
        writer.EndObject();
        out << buffer.GetString();
    }

    // Text layout:
    // <timestamp> [LEVEL] <loggerName>: <event>. <message>. {k=v, k=v}
    void LogManager::writeText(std::ostream &out, const LogEntry &entry) const {
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          entry.timestamp.time_since_epoch())
                          .count()
                      % 1000;
        std::time_t seconds = std::chrono::system_clock::to_time_t(entry.timestamp);
        std::tm utc{};
        gmtime_r(&seconds, &utc);
        auto level = LEVEL_MAP.rlookup(entry.level).value_or("NONE");
        out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
            << std::setfill('0') << millis << std::setfill(' ') << "Z [" << level << "] "
            << entry.loggerName << ":";
        if(!entry.event.empty()) {
            out << " " << entry.event << ".";
        }
        if(!entry.message.empty()) {
            out << " " << entry.message << ".";
        }
        if(!entry.contexts.empty()) {
            out << " {";
            bool first = true;
            for(const auto &[key, value] : entry.contexts) {
                if(!first) {
                    out << ", ";
                }
                out << key << "=" << value;
                first = false;
            }
            out << "}";
        }
        if(entry.cause.has_value()) {
            out << " Caused by " << entry.cause->first << ": " << entry.cause->second;
        }
    }

} // namespace logging
