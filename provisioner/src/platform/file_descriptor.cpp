#include "file_descriptor.hpp"

#include <array>
#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <system_error>
#include <unistd.h>

namespace platform {

    FileDescriptor FileDescriptor::open(const std::filesystem::path &path, int flags) {
        FileDescriptor fd{::open(path.c_str(), flags | O_CLOEXEC)};
        if(!fd) {
            throw std::system_error(errno, std::generic_category(), path.generic_string());
        }
        return fd;
    }

    void FileDescriptor::reset(int newFd) noexcept {
        if(int old = std::exchange(_fd, newFd); old != -1) {
            if(::close(old) == -1) {
                perror("close");
            }
        }
    }

    void FileDescriptor::duplicate(int fd) const {
        if(dup2(_fd, fd) == -1) {
            throw std::system_error(errno, std::generic_category());
        }
    }

    std::string FileDescriptor::readAll() const {
        if(!*this) {
            return {};
        }

        std::string output;
        static constexpr size_t defaultBufferSize = 0xFFF;
        std::array<char, defaultBufferSize> buffer{};

        for(;;) {
            ssize_t bytesRead = read(buffer.data(), buffer.size());
            if(bytesRead == -1) {
                if(errno == EINTR) {
                    continue;
                }
                throw std::system_error(errno, std::generic_category());
            }
            if(bytesRead == 0) {
                break;
            }
            output.append(buffer.data(), static_cast<size_t>(bytesRead));
        }

        return output;
    }

    void FileDescriptor::sync() const {
        if(::fsync(_fd) == -1) {
            throw std::system_error(errno, std::generic_category());
        }
    }

    ssize_t FileDescriptor::read(char *buffer, size_t size) const noexcept {
        return ::read(_fd, buffer, size);
    }

    void syncFile(const std::filesystem::path &path) {
        FileDescriptor::open(path, O_RDONLY).sync();
    }

} // namespace platform
