#pragma once
#include "error_base.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace errors {

    class TemplateCompileError : public Error {
    public:
        explicit TemplateCompileError(
            const std::string &what = "Unable to compile template") noexcept
            : Error("TemplateCompileError", what) {
        }
    };

    class TemplateEvaluationError : public Error {
    public:
        explicit TemplateEvaluationError(
            const std::string &what = "Unable to evaluate template") noexcept
            : Error("TemplateEvaluationError", what) {
        }
    };

    class MissingRequiredParamsError : public Error {
        std::string _bootEnv;
        std::string _machine;
        std::vector<std::string> _missing;

        static std::string describe(
            const std::string &bootEnv,
            const std::string &machine,
            const std::vector<std::string> &missing);

    public:
        MissingRequiredParamsError(
            std::string bootEnv, std::string machine, std::vector<std::string> missing)
            : Error("MissingRequiredParamsError", describe(bootEnv, machine, missing)),
              _bootEnv(std::move(bootEnv)), _machine(std::move(machine)),
              _missing(std::move(missing)) {
        }

        [[nodiscard]] const std::string &bootEnv() const noexcept {
            return _bootEnv;
        }

        [[nodiscard]] const std::string &machine() const noexcept {
            return _machine;
        }

        [[nodiscard]] const std::vector<std::string> &missing() const noexcept {
            return _missing;
        }
    };

    class ChecksumMismatchError : public Error {
    public:
        explicit ChecksumMismatchError(const std::string &what = "Checksum mismatch") noexcept
            : Error("ChecksumMismatchError", what) {
        }
    };

    class MediaExtractionError : public Error {
    public:
        explicit MediaExtractionError(
            const std::string &what = "Unable to extract install media") noexcept
            : Error("MediaExtractionError", what) {
        }
    };

    class FileFetchFailedError : public Error {
    public:
        explicit FileFetchFailedError(const std::string &what = "Unable to fetch file") noexcept
            : Error("FileFetchFailedError", what) {
        }
    };

    class IllegalTemplateError : public Error {
    public:
        explicit IllegalTemplateError(const std::string &what = "Illegal template") noexcept
            : Error("IllegalTemplateError", what) {
        }
    };

    class IncompleteBootSupportError : public Error {
    public:
        explicit IncompleteBootSupportError(
            const std::string &what = "Missing elilo or pxelinux template") noexcept
            : Error("IncompleteBootSupportError", what) {
        }
    };

    class MissingKernelError : public Error {
    public:
        explicit MissingKernelError(const std::string &what = "Missing kernel") noexcept
            : Error("MissingKernelError", what) {
        }
    };

    class MissingInitrdError : public Error {
    public:
        explicit MissingInitrdError(const std::string &what = "Missing initrd") noexcept
            : Error("MissingInitrdError", what) {
        }
    };

    class ImmutableIdentityError : public Error {
    public:
        explicit ImmutableIdentityError(
            const std::string &what = "Cannot change name of bootenv") noexcept
            : Error("ImmutableIdentityError", what) {
        }
    };

    class EnvironmentInUseError : public Error {
    public:
        explicit EnvironmentInUseError(const std::string &what = "Bootenv in use") noexcept
            : Error("EnvironmentInUseError", what) {
        }
    };

    class UnsupportedSegmentError : public Error {
    public:
        explicit UnsupportedSegmentError(const std::string &what = "Unsupported URL part") noexcept
            : Error("UnsupportedSegmentError", what) {
        }
    };

    class MissingParameterError : public Error {
    public:
        explicit MissingParameterError(
            const std::string &what = "No such machine parameter") noexcept
            : Error("MissingParameterError", what) {
        }
    };

    class InvalidUrlError : public Error {
    public:
        explicit InvalidUrlError(const std::string &what = "Unable to parse URL") noexcept
            : Error("InvalidUrlError", what) {
        }
    };

    class ArtifactWriteError : public Error {
    public:
        explicit ArtifactWriteError(const std::string &what = "Unable to write artifact") noexcept
            : Error("ArtifactWriteError", what) {
        }
    };

    class JsonParseError : public Error {
    public:
        explicit JsonParseError(const std::string &what = "Unable to parse JSON") noexcept
            : Error("JsonParseError", what) {
        }
    };

    class ConfigError : public Error {
    public:
        explicit ConfigError(const std::string &what = "Unable to read configuration") noexcept
            : Error("ConfigError", what) {
        }
    };

    class RecordNotFoundError : public Error {
    public:
        explicit RecordNotFoundError(const std::string &what = "Record not found") noexcept
            : Error("RecordNotFoundError", what) {
        }
    };

    class CommandLineArgumentError : public Error {
    public:
        explicit CommandLineArgumentError(const std::string &what) noexcept
            : Error("CommandLineArgumentError", what) {
        }
    };

    /**
     * A protocol tag that no resolver knows about. Indicates a caller bug rather than bad data,
     * so it is not an errors::Error.
     */
    class UnknownProtocolError : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };

} // namespace errors
