#pragma once
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

namespace errors {

    using namespace std::literals;

    /**
     * Common logic for errors raised by the provisioner. Such errors are described by the tuple
     * {Kind,Message} where Kind is a non-empty name of the error class, and Message is a
     * non-empty string.
     */
    class Error : public std::runtime_error {
        inline static const auto DEFAULT_ERROR_TEXT = "Unspecified Error"s; // NOLINT(*-err58-cpp)
        static constexpr std::string_view DEFAULT_ERROR_KIND{"UnspecifiedError"};
        static constexpr std::string_view RUNTIME_ERROR_KIND{"std::runtime_error"};
        static constexpr std::string_view LOGICAL_ERROR_KIND{"std::logic_error"};
        static constexpr std::string_view STD_ERROR_KIND{"std::exception"};

        std::string _kind;

    public:
        Error(const Error &) = default;
        Error(Error &&) noexcept = default;
        Error &operator=(const Error &) = default;
        Error &operator=(Error &&) noexcept = default;
        ~Error() noexcept override = default;

        explicit Error(std::string_view kind, const std::string &what = DEFAULT_ERROR_TEXT) noexcept
            : std::runtime_error(what), _kind(kind) {
        }

        /**
         * Kind of error, typically the name of the most derived error class.
         */
        [[nodiscard]] const std::string &kind() const noexcept {
            return _kind;
        }

        /**
         * Convert error to Wrapped error preserving some information about the underlying
         * error if possible.
         *
         * @param error Exception pointer
         * @return Wrapped error
         */
        [[nodiscard]] static Error of(const std::exception_ptr &error) noexcept;

        /**
         * Convert a caught exception to the common error form.
         */
        [[nodiscard]] static Error of(const std::exception &error) noexcept;

        [[nodiscard]] static Error unspecified() noexcept {
            return Error(DEFAULT_ERROR_KIND);
        }
    };

} // namespace errors
