#include "media_extractor.hpp"
#include "errors/errors.hpp"
#include "logging/logging.hpp"
#include "platform/process.hpp"

#include <system_error>

static const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("com.example.provisioner.media.ScriptMediaExtractor");

namespace media {

    void ScriptMediaExtractor::extract(
        const std::string &osName,
        const std::filesystem::path &isoPath,
        const std::filesystem::path &targetDir) {
        LOG.atInfo("extract-start")
            .kv("command", _command)
            .kv("os", osName)
            .kv("iso", isoPath)
            .kv("target", targetDir)
            .log();

        platform::ProcessResult result;
        try {
            result = platform::runProcess(_command, {osName, isoPath.string(), targetDir.string()});
        } catch(const std::system_error &e) {
            LOG.atError("extract-start-error")
                .kv("command", _command)
                .cause(e)
                .logAndThrow(errors::MediaExtractionError(
                    "Unable to run " + _command.generic_string() + ": " + e.what()));
        }

        if(result.exitCode != 0) {
            LOG.atError("extract-failed")
                .kv("command", _command)
                .kv("exitCode", result.exitCode)
                .kv("output", result.output)
                .logAndThrow(errors::MediaExtractionError(
                    "Explode ISO: script failed for " + osName + " (exit "
                    + std::to_string(result.exitCode) + ")\n" + result.output));
        }
        LOG.atInfo("extract-complete").kv("os", osName).kv("output", result.output).log();
    }

} // namespace media
