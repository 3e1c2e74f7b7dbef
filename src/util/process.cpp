#include <reclint/process.hpp>
#include <reclint/log.hpp>

#include <cerrno>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace reclint {

static void close_pair(int fds[2]) {
    close(fds[0]);
    close(fds[1]);
}

static bool read_into(int fd, std::string& out) {
    char buf[4096];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            return true;
        }
        if (n < 0 && errno == EINTR) continue;
        return false;   // EOF or error
    }
}

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir) {
    if (args.empty()) {
        return ReclintError{ReclintError::InvalidArg, "run_command: empty args"};
    }

    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    // Close-on-exec everywhere: workers spawn concurrently and must not
    // leak each other's pipe ends. exec_pipe reports execvp failure.
    int stdout_pipe[2];
    int stderr_pipe[2];
    int exec_pipe[2];
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0) {
        return ReclintError{ReclintError::IO, std::string("pipe() failed: ") + strerror(errno)};
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        int saved = errno;
        close_pair(stdout_pipe);
        return ReclintError{ReclintError::IO, std::string("pipe() failed: ") + strerror(saved)};
    }
    if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
        int saved = errno;
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return ReclintError{ReclintError::IO, std::string("pipe() failed: ") + strerror(saved)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_pipe);
        return ReclintError{ReclintError::Process,
            std::string("fork() failed: ") + strerror(saved)};
    }

    if (pid == 0) {
        // Child: dup2 clears close-on-exec on the standard descriptors.
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);

        int err = 0;
        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            err = errno;
        } else {
            execvp(argv[0], const_cast<char* const*>(argv.data()));
            err = errno;
        }
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    close(exec_pipe[1]);

    std::string out_buf, err_buf;
    struct pollfd fds[2] = {
        {stdout_pipe[0], POLLIN, 0},
        {stderr_pipe[0], POLLIN, 0},
    };
    int open_fds = 2;
    while (open_fds > 0) {
        int rc = poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (auto& p : fds) {
            if (p.fd < 0 || p.revents == 0) continue;
            std::string& sink = (p.fd == stdout_pipe[0]) ? out_buf : err_buf;
            if (!read_into(p.fd, sink)) {
                p.fd = -1;
                --open_fds;
            }
        }
    }
    close(stdout_pipe[0]);
    close(stderr_pipe[0]);

    int child_errno = 0;
    ssize_t got;
    do {
        got = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (got < 0 && errno == EINTR);
    close(exec_pipe[0]);

    int status = 0;
    pid_t w;
    do {
        w = waitpid(pid, &status, 0);
    } while (w < 0 && errno == EINTR);
    if (w < 0) {
        return ReclintError{ReclintError::Process,
            std::string("waitpid failed: ") + strerror(errno)};
    }

    if (got == static_cast<ssize_t>(sizeof(child_errno))) {
        return ReclintError{ReclintError::Process,
            "cannot run '" + args[0] + "': " + strerror(child_errno),
            "check that the command exists and is executable"};
    }

    int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    log::trace("'%s' exited with %d", args[0].c_str(), exit_code);
    return Result<CommandResult>::ok(
        CommandResult{exit_code, std::move(out_buf), std::move(err_buf)});
}

std::vector<std::string> expand_command(const std::string& exec, const std::string& file) {
    std::string cmd = exec;
    const std::string placeholder = "{file}";
    size_t pos = 0;
    while ((pos = cmd.find(placeholder, pos)) != std::string::npos) {
        cmd.replace(pos, placeholder.size(), file);
        pos += file.size();
    }

    std::vector<std::string> parts;
    std::istringstream ss(cmd);
    std::string part;
    while (ss >> part) parts.push_back(part);
    return parts;
}

} // namespace reclint
