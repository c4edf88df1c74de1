#include "easymcp/executors/command_executor.hpp"

#include "../internal/process.hpp"
#include "easymcp/exceptions.hpp"
#include "easymcp/logging.hpp"

#include <algorithm>
#include <csignal>
#include <mutex>
#include <thread>

namespace easymcp::executors
{

namespace
{

constexpr auto POLL_SLICE = std::chrono::milliseconds(50);

void ignore_sigpipe()
{
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

// Writes the rendered stdin on its own thread so a child that fills its
// stdout before draining stdin cannot deadlock the reader loop.
struct StdinFeeder
{
    process::Process& proc;
    std::thread thread;
    std::string error;

    explicit StdinFeeder(process::Process& p) : proc(p) {}

    void start(std::string data)
    {
        process::WritePipe& pipe = proc.stdin_pipe();
        thread = std::thread(
            [this, &pipe, data = std::move(data)]()
            {
                try
                {
                    pipe.write(data);
                }
                catch (const process::ProcessError& e)
                {
                    error = e.what();
                }
                pipe.close();
            });
    }

    void join()
    {
        if (thread.joinable())
            thread.join();
    }

    ~StdinFeeder()
    {
        if (thread.joinable())
        {
            // A writer still blocked on a live child only returns once the
            // child is gone
            proc.kill();
            thread.join();
        }
    }
};

void drain(process::ReadPipe& pipe, std::string& out)
{
    if (!pipe.is_open() || !pipe.has_data(0))
        return;
    char buffer[4096];
    size_t n = pipe.read(buffer, sizeof(buffer));
    if (n == 0)
        pipe.close();
    else
        out.append(buffer, n);
}

} // namespace

CommandExecutor::CommandExecutor(std::shared_ptr<const tools::ToolDefinition> tool,
                                 std::chrono::milliseconds timeout)
    : Executor(std::move(tool)), timeout_(timeout)
{
    const auto* meta = tool_->command();
    if (!meta)
        throw ConfigError("tool '" + tool_->name() + "' has no command metadata");
    if (meta->command.empty())
        throw ConfigError("tool '" + tool_->name() + "': command must not be empty");

    command_ = meta->command;
    for (size_t i = 0; i < meta->args.size(); ++i)
    {
        try
        {
            args_.push_back(templating::Template::compile(meta->args[i]));
        }
        catch (const ConfigError& e)
        {
            throw ConfigError("tool '" + tool_->name() + "', argument " + std::to_string(i) +
                              ": " + e.what());
        }
    }
    if (meta->stdin_template)
    {
        try
        {
            stdin_ = templating::Template::compile(*meta->stdin_template);
        }
        catch (const ConfigError& e)
        {
            throw ConfigError("tool '" + tool_->name() + "', stdin: " + e.what());
        }
    }

    ignore_sigpipe();
}

Json CommandExecutor::execute(const Json& input, const CancelToken& cancel) const
{
    validate_input(input);

    const Json context{{templating::INPUT_ROOT, input}};
    std::vector<std::string> argv;
    argv.reserve(args_.size());
    for (const auto& arg : args_)
        argv.push_back(arg.render(context));
    std::optional<std::string> stdin_data;
    if (stdin_)
        stdin_data = stdin_->render(context);

    logging::debug("spawning '" + command_ + "' with " + std::to_string(argv.size()) +
                       " argument(s) for tool '" + tool_->name() + "'",
                   "easymcp.command");

    process::Process proc;
    try
    {
        proc.spawn(command_, argv);
    }
    catch (const process::ProcessError& e)
    {
        throw ExecutorError("tool '" + tool_->name() + "': " + e.what());
    }

    StdinFeeder feeder(proc);
    if (stdin_data)
        feeder.start(std::move(*stdin_data));
    else
        proc.stdin_pipe().close();

    const auto deadline = std::chrono::steady_clock::now() + timeout_;

    auto check_limits = [&]()
    {
        if (cancel.cancelled())
        {
            proc.kill();
            proc.wait();
            throw ExecutorError("tool '" + tool_->name() + "': invocation cancelled");
        }
        if (std::chrono::steady_clock::now() >= deadline)
        {
            proc.kill();
            proc.wait();
            logging::warning("tool '" + tool_->name() + "' killed after " +
                                 std::to_string(timeout_.count()) + "ms",
                             "easymcp.command");
            throw ToolTimeoutError("tool '" + tool_->name() + "': command '" + command_ +
                                   "' timed out after " + std::to_string(timeout_.count()) +
                                   "ms");
        }
    };

    std::string out;
    std::string err;
    try
    {
        auto& out_pipe = proc.stdout_pipe();
        auto& err_pipe = proc.stderr_pipe();
        while (out_pipe.is_open() || err_pipe.is_open())
        {
            check_limits();
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            auto slice = std::max(std::chrono::milliseconds(1), std::min(remaining, POLL_SLICE));
            if (!proc.wait_for_output(static_cast<int>(slice.count())))
                continue;
            drain(out_pipe, out);
            drain(err_pipe, err);
        }
    }
    catch (const process::ProcessError& e)
    {
        throw ExecutorError("tool '" + tool_->name() + "': " + e.what());
    }

    // Output is closed; the child may still be running
    int exit_code;
    for (;;)
    {
        check_limits();
        if (auto code = proc.try_wait())
        {
            exit_code = *code;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    feeder.join();

    if (exit_code != 0)
    {
        ExecutorError e("tool '" + tool_->name() + "': command '" + command_ +
                        "' exited with code " + std::to_string(exit_code) +
                        (err.empty() ? std::string() : ": " + err));
        e.exit_code = exit_code;
        e.stderr_output = err;
        throw e;
    }
    if (!feeder.error.empty())
        logging::warning("tool '" + tool_->name() + "': stdin not fully written: " + feeder.error,
                         "easymcp.command");
    if (!err.empty())
        logging::debug("tool '" + tool_->name() + "' stderr: " + err, "easymcp.command");

    return finish_output(out);
}

} // namespace easymcp::executors
