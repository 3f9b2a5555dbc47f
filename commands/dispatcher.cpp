#include "commands/dispatcher.hpp"
#include "commands/commands_helpers.hpp"
#include "error_manager.hpp"
#include "faults.hpp"
#include "logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------
static CommandResult failure(const std::string& code, const std::string& msg) {
    return {msg, false, code};
}

static std::string joinArgv(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out += ' ';
        out += '[' + a + ']';
    }
    return out;
}

// ------------------------------------------------------------
// DetachedLauncher
// ------------------------------------------------------------
CommandResult DetachedLauncher::launch(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return failure("ERR_DISPATCH_PARSE", "empty command");
    }

    // Everything the children need is prepared before fork()
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return failure("ERR_DISPATCH_FAILED", std::string("pipe2: ") + std::strerror(errno));
    }

    pid_t child = ::fork();
    if (child < 0) {
        int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        return failure("ERR_DISPATCH_FAILED", std::string("fork: ") + std::strerror(err));
    }

    if (child == 0) {
        // Intermediate child: new session, spawn, exit
        ::close(fds[0]);
        ::setsid();

        pid_t grandchild = ::fork();
        if (grandchild < 0) {
            int err = errno;
            (void)!::write(fds[1], &err, sizeof(err));
            ::_exit(1);
        }
        if (grandchild == 0) {
            sigset_t none;
            sigemptyset(&none);
            sigprocmask(SIG_SETMASK, &none, nullptr);

            ::execvp(cargv[0], cargv.data());
            int err = errno;
            (void)!::write(fds[1], &err, sizeof(err));
            ::_exit(127);
        }
        ::_exit(0);
    }

    ::close(fds[1]);

    int status = 0;
    while (::waitpid(child, &status, 0) < 0 && errno == EINTR) {}

    // EOF means the exec went through and closed the pipe
    int childErr = 0;
    ssize_t n;
    do {
        n = ::read(fds[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    ::close(fds[0]);

    if (n == static_cast<ssize_t>(sizeof(childErr))) {
        std::string code = (childErr == ENOENT) ? "ERR_COMMAND_NOT_FOUND" : "ERR_DISPATCH_FAILED";
        return failure(code, argv[0] + ": " + std::strerror(childErr));
    }

    return {"started " + argv[0], true, ""};
}

// ------------------------------------------------------------
// Dispatcher
// ------------------------------------------------------------
std::vector<CommandResult> Dispatcher::dispatch(const Wake::DispatchRequest& request) {
    std::vector<CommandResult> results;

    if (request.commands.empty()) {
        LOG_INFO("Dispatch", "No commands configured label=" + request.label);
        return results;
    }

    for (const auto& cmd : request.commands) {
        if (trim(cmd).empty()) {
            LOG_DEBUG("Dispatch", "Skipping blank command label=" + request.label);
            continue;
        }

        CommandResult result;
        try {
            std::vector<std::string> argv = splitCommandLine(cmd);
            LOG_INFO("Dispatch", "Launching label=" + request.label + " argv=" + joinArgv(argv));
            result = launcher_.launch(argv);
        } catch (const DispatchFault& e) {
            result = failure(e.code(), e.what());
        }

        if (!result.success) {
            ErrorManager::report(result.errorCode,
                                 "label=" + request.label + " command=\"" + cmd + "\" " + result.message,
                                 LogLevel::Warn);
        }
        results.push_back(std::move(result));
    }

    return results;
}
