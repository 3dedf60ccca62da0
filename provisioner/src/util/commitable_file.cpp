#include "commitable_file.hpp"

#include <system_error>

namespace util {
    CommitableFile::CommitableFile(const std::filesystem::path &path)
        : _new(getNewFile(path)), _target(path) {
    }

    std::filesystem::path CommitableFile::getNewFile(const std::filesystem::path &path) {
        std::filesystem::path newPath{path};
        return newPath.replace_extension(path.extension().generic_string() + "+");
    }

    CommitableFile &CommitableFile::begin(std::ios_base::openmode mode) {
        if(!_stream.is_open()) {
            std::error_code ec;
            std::filesystem::remove(_new, ec);
            _stream.exceptions(std::ios::failbit | std::ios::badbit);
            _stream.open(_new, mode);
            _begun = true;
        }
        return *this;
    }

    CommitableFile &CommitableFile::commit() {
        if(!_begun) {
            return *this;
        }
        if(_stream.is_open()) {
            _stream.flush();
            _stream.close();
        }
        std::filesystem::rename(_new, _target);
        _begun = false;
        return *this;
    }

    CommitableFile &CommitableFile::abandon() noexcept {
        _stream.exceptions(std::ios::goodbit);
        if(_stream.is_open()) {
            _stream.close();
        }
        if(_begun) {
            std::error_code ec;
            std::filesystem::remove(_new, ec);
            _begun = false;
        }
        return *this;
    }

    CommitableFile::~CommitableFile() noexcept {
        abandon();
    }

} // namespace util
