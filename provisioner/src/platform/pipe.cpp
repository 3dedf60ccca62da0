#include "pipe.hpp"

#include <array>
#include <cerrno>
#include <fcntl.h>
#include <system_error>
#include <unistd.h>

namespace platform {
    std::pair<FileDescriptor, FileDescriptor> Pipe::MakePipe() {
        std::array<int, 2> fds{};
        if(pipe2(fds.data(), O_CLOEXEC) == -1) {
            throw std::system_error(errno, std::generic_category());
        }
        return std::make_pair(FileDescriptor{fds[0]}, FileDescriptor{fds[1]});
    }
} // namespace platform
