#include "io/process.hpp"

#include <array>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sessionizer::io {
namespace {

std::string buildDisplayCommand(const std::string &command, const std::vector<std::string> &args) {
    std::ostringstream cmd;
    cmd << shellQuote(command);
    for (const auto &arg : args) {
        cmd << ' ' << shellQuote(arg);
    }
    return cmd.str();
}

bool validateWorkingDirectory(const std::filesystem::path &cwd, const sessionizer::Context &ctx) {
    if (cwd.empty()) {
        return true;
    }

    std::error_code ec;
    if (!std::filesystem::exists(cwd, ec) || !std::filesystem::is_directory(cwd, ec)) {
        ctx.error("Working directory does not exist: ", cwd.string());
        return false;
    }
    return true;
}

std::vector<char *> makeArgv(std::vector<std::string> &storage) {
    std::vector<char *> argv;
    argv.reserve(storage.size() + 1);
    for (auto &item : storage) {
        argv.push_back(const_cast<char *>(item.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

std::vector<std::string> makeArgvStorage(const std::string &command, const std::vector<std::string> &args) {
    std::vector<std::string> storage;
    storage.reserve(args.size() + 1);
    storage.push_back(command);
    storage.insert(storage.end(), args.begin(), args.end());
    return storage;
}

void closeFd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

int waitForChild(pid_t pid, const sessionizer::Context &ctx) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) {
            continue;
        }
        ctx.error("Failed to wait for process: ", std::strerror(errno));
        return -1;
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        ctx.warn("Process terminated by signal: ", WTERMSIG(status));
        return 128 + WTERMSIG(status);
    }
    ctx.error("Process ended abnormally");
    return -1;
}

// Writes input and drains output together so neither side can block the other.
void pumpPipes(int &inFd, int &outFd, const std::string &input, std::string &output, const sessionizer::Context &ctx) {
    std::size_t written = 0;
    if (input.empty()) {
        closeFd(inFd);
    } else {
        fcntl(inFd, F_SETFL, fcntl(inFd, F_GETFL) | O_NONBLOCK);
    }

    std::array<char, 4096> buffer{};
    while (outFd >= 0) {
        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        fds[count++] = pollfd{outFd, POLLIN, 0};
        if (inFd >= 0) {
            fds[count++] = pollfd{inFd, POLLOUT, 0};
        }

        if (poll(fds.data(), count, -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            ctx.error("Failed to poll child pipes: ", std::strerror(errno));
            break;
        }

        if (inFd >= 0 && fds[1].revents != 0) {
            if (fds[1].revents & POLLOUT) {
                const ssize_t n = write(inFd, input.data() + written, input.size() - written);
                if (n > 0) {
                    written += static_cast<std::size_t>(n);
                } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                    // EPIPE: the child stopped reading; what it got is all it wants.
                    ctx.debug("Stopped writing child input: ", std::strerror(errno));
                    closeFd(inFd);
                }
            } else {
                closeFd(inFd);
            }
            if (inFd >= 0 && written == input.size()) {
                closeFd(inFd);
            }
        }

        if (fds[0].revents != 0) {
            const ssize_t n = read(outFd, buffer.data(), buffer.size());
            if (n > 0) {
                output.append(buffer.data(), static_cast<std::size_t>(n));
            } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                closeFd(outFd);
            }
        }
    }

    closeFd(inFd);
    closeFd(outFd);
}

} // namespace

std::string shellQuote(const std::string &value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('\'');
    for (char ch : value) {
        if (ch == '\'') {
            out += "'\\''";
        } else {
            out.push_back(ch);
        }
    }
    out.push_back('\'');
    return out;
}

ProcessResult runCommand(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const sessionizer::Context &ctx,
    bool dryRun
) {
    ProcessResult result;
    result.commandLine = buildDisplayCommand(command, args);

    if (!cwd.empty()) {
        ctx.debug("cwd: ", cwd.string());
    }
    ctx.debug(result.commandLine);

    if (dryRun) {
        result.code = 0;
        return result;
    }

    if (!validateWorkingDirectory(cwd, ctx)) {
        result.code = -1;
        return result;
    }

    std::vector<std::string> storage = makeArgvStorage(command, args);
    std::vector<char *> argv = makeArgv(storage);

    const pid_t pid = fork();
    if (pid < 0) {
        result.code = -1;
        ctx.error("Failed to fork process: ", std::strerror(errno));
        return result;
    }

    if (pid == 0) {
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            _exit(kExecFailedCode);
        }
        execvp(command.c_str(), argv.data());
        _exit(kExecFailedCode);
    }

    result.processId = static_cast<long long>(pid);
    result.code = waitForChild(pid, ctx);
    return result;
}

CaptureResult runCommandCapture(
    const std::string &command,
    const std::vector<std::string> &args,
    const CaptureOptions &options,
    const sessionizer::Context &ctx,
    bool dryRun
) {
    CaptureResult result;
    result.commandLine = buildDisplayCommand(command, args);
    ctx.debug(result.commandLine);

    if (dryRun) {
        result.code = 0;
        return result;
    }

    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    if (pipe(inPipe) != 0) {
        ctx.error("Failed to create pipe: ", std::strerror(errno));
        return result;
    }
    if (pipe(outPipe) != 0) {
        ctx.error("Failed to create pipe: ", std::strerror(errno));
        closeFd(inPipe[0]);
        closeFd(inPipe[1]);
        return result;
    }

    std::vector<std::string> storage = makeArgvStorage(command, args);
    std::vector<char *> argv = makeArgv(storage);

    const pid_t pid = fork();
    if (pid < 0) {
        ctx.error("Failed to fork process: ", std::strerror(errno));
        closeFd(inPipe[0]);
        closeFd(inPipe[1]);
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        return result;
    }

    if (pid == 0) {
        dup2(inPipe[0], STDIN_FILENO);
        dup2(outPipe[1], STDOUT_FILENO);
        if (options.discardStderr) {
            const int devNull = open("/dev/null", O_WRONLY);
            if (devNull >= 0) {
                dup2(devNull, STDERR_FILENO);
                close(devNull);
            }
        }
        close(inPipe[0]);
        close(inPipe[1]);
        close(outPipe[0]);
        close(outPipe[1]);
        execvp(command.c_str(), argv.data());
        _exit(kExecFailedCode);
    }

    result.processId = static_cast<long long>(pid);
    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    pumpPipes(inPipe[1], outPipe[0], options.input, result.output, ctx);
    result.code = waitForChild(pid, ctx);
    return result;
}

} // namespace sessionizer::io
