#pragma once
#include <filesystem>
#include <fstream>

namespace util {
    /**
     * Writes a file as a side file ("name+") and moves it over the target on commit(). A file
     * that is never committed is removed on destruction, so readers of the target never observe
     * a partial write.
     */
    class CommitableFile {
        std::filesystem::path _new;
        std::filesystem::path _target;
        std::ofstream _stream;
        bool _begun{false};

    public:
        CommitableFile(const CommitableFile &) = delete;
        CommitableFile(CommitableFile &&) = delete;
        CommitableFile &operator=(const CommitableFile &) = delete;
        CommitableFile &operator=(CommitableFile &&) = delete;
        explicit CommitableFile(const std::filesystem::path &path);
        ~CommitableFile() noexcept;

        std::ofstream &getStream() {
            return _stream;
        }

        CommitableFile &begin(
            std::ios_base::openmode mode = std::ios_base::trunc | std::ios_base::out);
        CommitableFile &commit();
        CommitableFile &abandon() noexcept;

        static std::filesystem::path getNewFile(const std::filesystem::path &path);

        [[nodiscard]] const std::filesystem::path &getTargetFile() const noexcept {
            return _target;
        }

        [[nodiscard]] const std::filesystem::path &getNewFile() const noexcept {
            return _new;
        }

        [[nodiscard]] bool is_open() const {
            return _stream.is_open();
        }

        template<typename T>
        CommitableFile &operator<<(const T &v) {
            _stream << v;
            return *this;
        }
    };
} // namespace util
