#include "error_base.hpp"

namespace errors {

    Error Error::of(const std::exception_ptr &error) noexcept {
        try {
            if(error) {
                std::rethrow_exception(error);
            } else {
                return unspecified();
            }
        } catch(const std::exception &err) {
            return of(err);
        } catch(...) {
            return unspecified();
        }
    }

    Error Error::of(const std::exception &error) noexcept {
        if(const auto *err = dynamic_cast<const Error *>(&error); err != nullptr) {
            return *err;
        }
        if(dynamic_cast<const std::runtime_error *>(&error) != nullptr) {
            return Error(RUNTIME_ERROR_KIND, error.what());
        }
        if(dynamic_cast<const std::logic_error *>(&error) != nullptr) {
            return Error(LOGICAL_ERROR_KIND, error.what());
        }
        return Error(STD_ERROR_KIND, error.what());
    }

} // namespace errors
