#include "process.hpp"
#include "pipe.hpp"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <sys/wait.h>
#include <system_error>
#include <tuple>
#include <unistd.h>

namespace platform {

    namespace {
        constexpr int EXEC_FAILED = 127;
    } // namespace

    ProcessResult runProcess(
        const std::filesystem::path &command, const std::vector<std::string> &args) {

        // Note: all memory allocation for the child process must be performed before forking
        std::string commandText = command.string();
        std::vector<std::string> argStorage;
        argStorage.reserve(args.size() + 1);
        argStorage.push_back(commandText);
        argStorage.insert(argStorage.end(), args.begin(), args.end());
        std::vector<char *> argv;
        argv.reserve(argStorage.size() + 1);
        for(auto &arg : argStorage) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        Pipe outPipe{};

        auto pid = fork();
        switch(pid) {
            // parent, on error
            case -1:
                throw std::system_error(errno, std::generic_category(), "fork");

            // child, runs process
            case 0: {
                // At this point, child should only call async-signal-safe functions
                FileDescriptor{STDIN_FILENO}.close();
                outPipe.input().duplicate(STDOUT_FILENO);
                outPipe.input().duplicate(STDERR_FILENO);
                outPipe.output().close();
                outPipe.input().close();

                std::ignore = execv(commandText.c_str(), argv.data());
                // only reachable if exec fails
                perror("execv");
                _exit(EXEC_FAILED);
            }

            // parent process, PID is child process
            default: {
                outPipe.input().close();
                ProcessResult result;
                result.output = outPipe.output().readAll();

                int status = 0;
                while(waitpid(pid, &status, 0) == -1) {
                    if(errno != EINTR) {
                        throw std::system_error(errno, std::generic_category(), "waitpid");
                    }
                }
                if(WIFEXITED(status)) {
                    result.exitCode = WEXITSTATUS(status);
                } else if(WIFSIGNALED(status)) {
                    result.exitCode = 128 + WTERMSIG(status);
                }
                return result;
            }
        }
    }

} // namespace platform
