#pragma once
#include "media_extractor.hpp"
#include "model/bootenv.hpp"
#include "render/path_resolver.hpp"
#include "util/lookup_table.hpp"

#include <filesystem>
#include <string_view>

namespace media {

    enum class PrepareOutcome {
        NotInstallEnvironment,
        NoIsoConfigured,
        AlreadyExtracted,
        IsoNotStaged,
        Extracted
    };

    inline constexpr util::LookupTable<PrepareOutcome, std::string_view, 5> OUTCOME_NAMES{
        PrepareOutcome::NotInstallEnvironment,
        std::string_view{"not-install-environment"},
        PrepareOutcome::NoIsoConfigured,
        std::string_view{"no-iso-configured"},
        PrepareOutcome::AlreadyExtracted,
        std::string_view{"already-extracted"},
        PrepareOutcome::IsoNotStaged,
        std::string_view{"iso-not-staged"},
        PrepareOutcome::Extracted,
        std::string_view{"extracted"}};

    /**
     * Extracts an install environment's ISO once. Completion is recorded by a canary file
     * that the extractor leaves in the install tree.
     */
    class MediaPreparer {
        const render::PathResolver &_paths;
        MediaExtractor &_extractor;

    public:
        MediaPreparer(const render::PathResolver &paths, MediaExtractor &extractor)
            : _paths(paths), _extractor(extractor) {
        }

        [[nodiscard]] std::filesystem::path canaryPath(const model::BootEnv &env) const;

        /**
         * Throws errors::ChecksumMismatchError or errors::MediaExtractionError.
         */
        PrepareOutcome prepare(const model::BootEnv &env);
    };

} // namespace media
