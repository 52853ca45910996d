//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "engine/config.hpp"
#include "engine/engine.hpp"
#include "setup_logging.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <fcntl.h>
#include <iostream>
#include <signal.h>  // NOLINT
#include <sstream>
#include <string>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace
{

const auto* const s_init_complete = "init_complete";
const auto* const s_pid_file_path = "/var/run/usbad.pid";

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile sig_atomic_t g_running = 1;

extern "C" void signalHandler(const int sig)
{
    if ((sig == SIGTERM) || (sig == SIGINT))
    {
        g_running = 0;
    }
}

void setupSignalHandlers()
{
    struct sigaction sigbreak
    {};
    sigbreak.sa_handler = &signalHandler;
    ::sigaction(SIGINT, &sigbreak, nullptr);
    ::sigaction(SIGTERM, &sigbreak, nullptr);

    // A client may vanish while we are writing to its socket.
    struct sigaction sigignore
    {};
    sigignore.sa_handler = SIG_IGN;
    ::sigaction(SIGPIPE, &sigignore, nullptr);
}

[[noreturn]] void exitWithFailure(const int fd, const char* const msg)
{
    const char* const err_txt = std::strerror(errno);
    writeString(fd, msg);
    writeString(fd, err_txt);
    ::exit(EXIT_FAILURE);
}

[[noreturn]] void exitWithFailure(const char* const msg)
{
    const char* const err_txt = std::strerror(errno);
    std::cerr << msg << err_txt << "\n";
    ::exit(EXIT_FAILURE);
}

/// Closes everything inherited (except the standard i/o), and opens the "init status" pipe.
///
void closeInheritedFdsAndOpenStatusPipe(std::array<int, 2>& pipe_fds)
{
    rlimit rlimit_files{};
    if (::getrlimit(RLIMIT_NOFILE, &rlimit_files) != 0)
    {
        exitWithFailure("Failed to getrlimit(RLIMIT_NOFILE): ");
    }
    constexpr int first_fd_to_close = 3;
    for (int fd = first_fd_to_close; static_cast<rlim_t>(fd) <= rlimit_files.rlim_cur; ++fd)
    {
        (void) ::close(fd);
    }

    if (::pipe(pipe_fds.data()) == -1)
    {
        exitWithFailure("Failed to create pipe: ");
    }
}

/// @return `true` in the child process.
///
bool forkToBackground(std::array<int, 2>& pipe_fds)
{
    const pid_t pid = ::fork();
    if (pid < 0)
    {
        exitWithFailure("Failed to fork: ");
    }

    // The child only writes the status, and the original process only reads it.
    const bool is_child = pid == 0;
    auto&      unused   = pipe_fds[is_child ? 0 : 1];
    ::close(unused);
    unused = -1;

    return is_child;
}

/// New session, and the second fork - so that the daemon can never re-acquire a terminal.
///
void detachFromTerminal(int& pipe_write_fd)
{
    if (::setsid() < 0)
    {
        exitWithFailure(pipe_write_fd, "Failed to setsid: ");
    }

    const pid_t pid = ::fork();
    if (pid < 0)
    {
        exitWithFailure(pipe_write_fd, "Failed to fork: ");
    }
    if (pid > 0)
    {
        ::close(pipe_write_fd);
        pipe_write_fd = -1;
        ::exit(EXIT_SUCCESS);
    }
}

void resetProcessContext(const int pipe_write_fd)
{
    const int fd = ::open("/dev/null", O_RDWR);  // NOLINT *-vararg
    if (fd == -1)
    {
        exitWithFailure(pipe_write_fd, "Failed to open(/dev/null): ");
    }
    ::dup2(fd, STDIN_FILENO);
    ::dup2(fd, STDOUT_FILENO);
    ::dup2(fd, STDERR_FILENO);
    if (fd > STDERR_FILENO)
    {
        ::close(fd);
    }

    ::umask(0);

    if (::chdir("/") != 0)
    {
        exitWithFailure(pipe_write_fd, "Failed to chdir(/): ");
    }
}

/// Creates and locks the PID file - so that only one daemon owns the USB ports.
///
/// The file stays open (and locked) until the process exits.
///
void createPidFile(const int pipe_write_fd)
{
    const int fd = ::open(s_pid_file_path, O_RDWR | O_CREAT | O_CLOEXEC, 0644);  // NOLINT *-vararg
    if (fd == -1)
    {
        exitWithFailure(pipe_write_fd, "Failed to create PID file: ");
    }
    if (::lockf(fd, F_TLOCK, 0) == -1)
    {
        exitWithFailure(pipe_write_fd, "Failed to lock PID file (is another daemon running?): ");
    }
    if (::ftruncate(fd, 0) != 0)
    {
        exitWithFailure(pipe_write_fd, "Failed to ftruncate PID file: ");
    }

    constexpr std::size_t             max_pid_str_len = 32;
    std::array<char, max_pid_str_len> buf{};
    const auto len = ::snprintf(buf.data(), buf.size(), "%ld\n", static_cast<long>(::getpid()));  // NOLINT *-vararg
    if (::write(fd, buf.data(), len) != len)
    {
        exitWithFailure(pipe_write_fd, "Failed to write to PID file: ");
    }
}

/// Tells the original process that the daemon is up and running (by closing the status pipe).
///
void notifyInitComplete(int& pipe_write_fd)
{
    writeString(pipe_write_fd, s_init_complete);
    ::close(pipe_write_fd);
    pipe_write_fd = -1;
}

/// Waits in the original process for the init status of the daemon, and exits with it.
///
[[noreturn]] void exitOriginalProcess(int& pipe_read_fd)
{
    constexpr std::size_t      buf_size = 1024;
    std::array<char, buf_size> msg_from_child{};
    const auto                 res = ::read(pipe_read_fd, msg_from_child.data(), msg_from_child.size() - 1);
    if (res == -1)
    {
        exitWithFailure("Failed to read pipe: ");
    }
    msg_from_child[res] = '\0';  // NOLINT

    ::close(pipe_read_fd);
    pipe_read_fd = -1;

    if (::strcmp(msg_from_child.data(), s_init_complete) != 0)
    {
        std::cerr << "Daemon init failed: " << msg_from_child.data() << "\n";
        ::exit(EXIT_FAILURE);
    }
    ::exit(EXIT_SUCCESS);
}

/// Daemonizes the process as described in the `man 7 daemon` manual page.
///
/// @return Write end of the init status pipe (in the daemon process). The original process never returns.
///
int daemonize()
{
    std::array<int, 2> pipe_fds{{-1, -1}};

    closeInheritedFdsAndOpenStatusPipe(pipe_fds);
    setupSignalHandlers();
    if (!forkToBackground(pipe_fds))
    {
        exitOriginalProcess(pipe_fds[0]);
    }

    auto& pipe_write_fd = pipe_fds[1];
    detachFromTerminal(pipe_write_fd);
    resetProcessContext(pipe_write_fd);
    createPidFile(pipe_write_fd);

    // `notifyInitComplete` is called by the `main` when the engine is initialized.
    return pipe_write_fd;
}

usbad::daemon::engine::Config::Ptr loadConfig(const int          err_fd,
                                              const bool         is_daemonized,
                                              const int          argc,
                                              const char** const argv)
{
    static const std::string config_file_prefix = "CONFIG_FILE=";

    std::string cfg_file_path = is_daemonized ? "/etc/usbad/usbad.toml" : "./usbad.toml";
    for (int i = 1; i < argc; i++)
    {
        const std::string arg_str = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (0 == arg_str.compare(0, config_file_prefix.size(), config_file_prefix))
        {
            cfg_file_path = arg_str.substr(config_file_prefix.size());
        }
    }

    try
    {
        return usbad::daemon::engine::Config::make(cfg_file_path);

    } catch (const std::exception& ex)
    {
        std::stringstream ss;
        ss << "Failed to load configuration file (path='" << cfg_file_path << "').\n" << ex.what();
        writeString(err_fd, ss.str().c_str());
    }
    ::exit(EXIT_FAILURE);
}

}  // namespace

int main(const int argc, const char** const argv)
{
    bool should_daemonize = true;
    for (int i = 1; i < argc; ++i)
    {
        if (::strcmp(argv[i], "--dev") == 0)  // NOLINT
        {
            should_daemonize = false;
        }
    }

    // In dev mode failures go to the standard error output, otherwise to the original process.
    int status_fd = STDERR_FILENO;
    if (should_daemonize)
    {
        status_fd = daemonize();
    }
    else
    {
        setupSignalHandlers();
    }

    const auto config = loadConfig(status_fd, should_daemonize, argc, argv);
    setupLogging(status_fd, should_daemonize, argc, argv, config);

    spdlog::info("USBAD started (ver='{}.{}').", VERSION_MAJOR, VERSION_MINOR);
    int result = EXIT_SUCCESS;
    try
    {
        usbad::daemon::engine::Engine engine{config};
        if (const auto failure_str = engine.init())
        {
            spdlog::critical("Failed to init engine: {}", failure_str.value());

            writeString(status_fd, "Failed to init engine: ");
            writeString(status_fd, failure_str.value().c_str());
            ::exit(EXIT_FAILURE);
        }
        if (should_daemonize)
        {
            notifyInitComplete(status_fd);
        }

        engine.runWhile([] { return g_running == 1; });
        if (g_running == 0)
        {
            spdlog::debug("Received termination signal.");
        }

        engine.shutdown();

    } catch (const std::exception& ex)
    {
        spdlog::critical("Unhandled exception: {}", ex.what());
        result = EXIT_FAILURE;
    }
    spdlog::info("USBAD daemon terminated.");

    return result;
}
