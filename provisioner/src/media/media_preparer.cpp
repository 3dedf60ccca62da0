#include "media_preparer.hpp"
#include "errors/errors.hpp"
#include "logging/logging.hpp"
#include "util/digest.hpp"
#include "util/string_util.hpp"

static const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("com.example.provisioner.media.MediaPreparer");

namespace media {

    std::filesystem::path MediaPreparer::canaryPath(const model::BootEnv &env) const {
        return _paths.diskPath(env, "." + env.os.name + ".rebar_canary");
    }

    PrepareOutcome MediaPreparer::prepare(const model::BootEnv &env) {
        if(!env.isInstall()) {
            return PrepareOutcome::NotInstallEnvironment;
        }
        if(env.os.isoFile.empty()) {
            LOG.atDebug("no-iso").kv("bootenv", env.name).log();
            return PrepareOutcome::NoIsoConfigured;
        }
        auto canary = canaryPath(env);
        if(std::filesystem::exists(canary)) {
            LOG.atDebug("already-extracted").kv("bootenv", env.name).kv("canary", canary).log();
            return PrepareOutcome::AlreadyExtracted;
        }
        auto isoPath = _paths.isoPath(env.os);
        if(!std::filesystem::exists(isoPath)) {
            LOG.atInfo("iso-not-staged")
                .kv("bootenv", env.name)
                .kv("iso", isoPath)
                .log("ISO not present, skipping extraction");
            return PrepareOutcome::IsoNotStaged;
        }

        if(!env.os.isoSha256.empty()) {
            std::string actual;
            try {
                actual = util::Sha256::ofFile(isoPath);
            } catch(const std::runtime_error &e) {
                LOG.atError("iso-read-error")
                    .kv("iso", isoPath)
                    .cause(e)
                    .logAndThrow(errors::MediaExtractionError(
                        "Unable to checksum " + isoPath.generic_string() + ": " + e.what()));
            }
            auto expected = util::lower(env.os.isoSha256);
            if(actual != expected) {
                LOG.atError("iso-checksum-mismatch")
                    .kv("iso", isoPath)
                    .kv("actual", actual)
                    .kv("expected", expected)
                    .logAndThrow(errors::ChecksumMismatchError(
                        "Iso checksum bad. Re-download image: " + isoPath.generic_string()
                        + ": actual: " + actual + " expected: " + expected));
            }
        }

        _extractor.extract(env.os.name, isoPath, canary.parent_path());
        LOG.atInfo("iso-extracted").kv("bootenv", env.name).kv("iso", isoPath).log();
        return PrepareOutcome::Extracted;
    }

} // namespace media
