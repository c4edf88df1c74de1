// POSIX implementation of subprocess management

#include "process.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace easymcp::process
{

// =============================================================================
// Platform-specific handle structures
// =============================================================================

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    int exit_code = -1;
};

// =============================================================================
// Helper functions
// =============================================================================

namespace
{

std::string get_errno_message()
{
    return std::strerror(errno);
}

// Pipes are close-on-exec so that a child forked concurrently by another
// thread never inherits them; dup2 clears the flag on the child's 0/1/2.
struct PipePair
{
    int fds[2] = {-1, -1};

    ~PipePair()
    {
        close_both();
    }

    void open(const char* what)
    {
        if (::pipe2(fds, O_CLOEXEC) != 0)
            throw ProcessError(std::string("Failed to create ") + what +
                               " pipe: " + get_errno_message());
    }

    int release(int end)
    {
        int fd = fds[end];
        fds[end] = -1;
        return fd;
    }

    void close_both()
    {
        for (int& fd : fds)
        {
            if (fd >= 0)
                ::close(fd);
            fd = -1;
        }
    }
};

int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

[[noreturn]] void child_fail(int error_fd)
{
    int err = errno;
    (void)::write(error_fd, &err, sizeof(err));
    _exit(127);
}

} // namespace

// =============================================================================
// ReadPipe implementation
// =============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    ssize_t bytes_read;
    do
    {
        bytes_read = ::read(handle_->fd, buffer, size);
    } while (bytes_read < 0 && errno == EINTR);

    if (bytes_read < 0)
    {
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return 0;
        throw ProcessError("Read failed: " + get_errno_message());
    }

    return static_cast<size_t>(bytes_read);
}

bool ReadPipe::has_data(int timeout_ms)
{
    if (!is_open())
        return false;

    struct pollfd pfd;
    pfd.fd = handle_->fd;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int result = ::poll(&pfd, 1, timeout_ms);
    if (result < 0)
    {
        if (errno == EINTR)
            return false;
        throw ProcessError("poll failed: " + get_errno_message());
    }

    // POLLHUP without POLLIN still means read() will report EOF
    return result > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0;
}

void ReadPipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// =============================================================================
// WritePipe implementation
// =============================================================================

WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}

WritePipe::~WritePipe()
{
    close();
}

size_t WritePipe::write(const std::string& data)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    size_t total_written = 0;
    while (total_written < data.size())
    {
        ssize_t bytes_written =
            ::write(handle_->fd, data.data() + total_written, data.size() - total_written);
        if (bytes_written < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                throw ProcessError("Broken pipe (process closed stdin)");
            throw ProcessError("Write failed: " + get_errno_message());
        }
        total_written += static_cast<size_t>(bytes_written);
    }

    return total_written;
}

void WritePipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool WritePipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// =============================================================================
// Process implementation
// =============================================================================

Process::Process()
    : handle_(std::make_unique<ProcessHandle>()), stdin_(std::make_unique<WritePipe>()),
      stdout_(std::make_unique<ReadPipe>()), stderr_(std::make_unique<ReadPipe>())
{
}

Process::~Process()
{
    stdin_->close();
    stdout_->close();
    stderr_->close();

    if (handle_->running)
    {
        kill();
        try
        {
            wait();
        }
        catch (const ProcessError&)
        {
            // Already reaped elsewhere; nothing left to release
        }
    }
}

void Process::spawn(const std::string& executable, const std::vector<std::string>& args)
{
    if (handle_->running)
        throw ProcessError("Process already running");

    PipePair in_pipe, out_pipe, err_pipe, error_pipe;
    in_pipe.open("stdin");
    out_pipe.open("stdout");
    err_pipe.open("stderr");
    // Error pipe for detecting exec failures; stays close-on-exec
    error_pipe.open("error");

    // Build argv before fork: no allocation in the child
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0)
        throw ProcessError("Failed to fork process: " + get_errno_message());

    if (pid == 0)
    {
        // Child process
        int error_fd = error_pipe.fds[1];
        ::setpgid(0, 0);

        // Restore default dispositions the server may have changed (SIGPIPE)
        ::signal(SIGPIPE, SIG_DFL);

        if (dup2(in_pipe.fds[0], STDIN_FILENO) < 0)
            child_fail(error_fd);
        if (dup2(out_pipe.fds[1], STDOUT_FILENO) < 0)
            child_fail(error_fd);
        if (dup2(err_pipe.fds[1], STDERR_FILENO) < 0)
            child_fail(error_fd);

        execvp(executable.c_str(), argv.data());
        child_fail(error_fd);
    }

    // Parent process
    ::close(error_pipe.release(1));
    int child_errno = 0;
    ssize_t error_bytes;
    do
    {
        error_bytes = ::read(error_pipe.fds[0], &child_errno, sizeof(child_errno));
    } while (error_bytes < 0 && errno == EINTR);

    if (error_bytes > 0)
    {
        waitpid(pid, nullptr, 0);
        throw ProcessError("Failed to execute '" + executable + "': " + std::strerror(child_errno));
    }

    // Also set from the parent so kill(-pid) works even if the child has not
    // reached its own setpgid yet
    ::setpgid(pid, pid);

    stdin_->handle_->fd = in_pipe.release(1);
    stdout_->handle_->fd = out_pipe.release(0);
    stderr_->handle_->fd = err_pipe.release(0);

    handle_->pid = pid;
    handle_->running = true;
    handle_->exit_code = -1;
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_->is_open())
        throw ProcessError("stdin pipe not available");
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_->is_open())
        throw ProcessError("stdout pipe not available");
    return *stdout_;
}

ReadPipe& Process::stderr_pipe()
{
    if (!stderr_->is_open())
        throw ProcessError("stderr pipe not available");
    return *stderr_;
}

bool Process::wait_for_output(int timeout_ms)
{
    struct pollfd pfds[2];
    nfds_t count = 0;
    for (ReadPipe* p : {stdout_.get(), stderr_.get()})
    {
        if (!p->is_open())
            continue;
        pfds[count].fd = p->handle_->fd;
        pfds[count].events = POLLIN;
        pfds[count].revents = 0;
        ++count;
    }
    if (count == 0)
        return false;

    int result = ::poll(pfds, count, timeout_ms);
    if (result < 0)
    {
        if (errno == EINTR)
            return false;
        throw ProcessError("poll failed: " + get_errno_message());
    }
    return result > 0;
}

std::optional<int> Process::try_wait()
{
    if (handle_->pid == 0 || !handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result = waitpid(handle_->pid, &status, WNOHANG);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }
    if (result == 0)
        return std::nullopt;

    throw ProcessError("waitpid failed: " + get_errno_message());
}

int Process::wait()
{
    if (handle_->pid == 0 || !handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }

    handle_->running = false;
    throw ProcessError("waitpid failed: " + get_errno_message());
}

void Process::kill()
{
    if (handle_->pid > 0 && handle_->running)
        ::kill(-handle_->pid, SIGKILL);
}

} // namespace easymcp::process
