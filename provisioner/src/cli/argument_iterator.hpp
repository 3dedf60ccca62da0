#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace cli {
    struct ArgumentIterator {
        const std::vector<std::string> &args;
        std::vector<std::string>::const_iterator &iter;

        // Throws std::out_of_range when there is no following argument
        ArgumentIterator &operator++() {
            ++iter;
            if(iter == args.end()) {
                --iter;
                throw std::out_of_range("No remaining arguments");
            }
            return *this;
        }

        const std::string &operator*() const noexcept {
            return *iter;
        }
    };

} // namespace cli
