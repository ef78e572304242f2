#include "warpsync/daemon/process_manager.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <asio/posix/stream_descriptor.hpp>
#include <asio/steady_timer.hpp>
#include <spdlog/spdlog.h>

#include "warpsync/crypto.hpp"
#include "warpsync/error_codes.hpp"

extern char **environ;

namespace warpsync::daemon
{

    namespace
    {

        constexpr auto kKillGrace = std::chrono::seconds{5};
        constexpr auto kShutdownGrace = std::chrono::seconds{2};
        constexpr std::size_t kReadBufferSize = 4096;

        struct StatusMapping
        {
            ProcessStatus status;
            std::string_view label;
        };

        constexpr std::array<StatusMapping, 7> kStatusMappings{{
            {ProcessStatus::Pending, "pending"},
            {ProcessStatus::Starting, "starting"},
            {ProcessStatus::Running, "running"},
            {ProcessStatus::Completed, "completed"},
            {ProcessStatus::Failed, "failed"},
            {ProcessStatus::Cancelled, "cancelled"},
            {ProcessStatus::Timeout, "timeout"},
        }};

        void close_fd(int &fd)
        {
            if (fd >= 0)
            {
                ::close(fd);
                fd = -1;
            }
        }

        struct Pipe
        {
            int read{-1};
            int write{-1};

            Pipe()
            {
                int fds[2];
                if (::pipe2(fds, O_CLOEXEC) != 0)
                {
                    throw TransferError(ErrorCode::SpawnFailed, std::string("pipe2 failed: ") + std::strerror(errno));
                }
                read = fds[0];
                write = fds[1];
            }

            ~Pipe()
            {
                close_fd(read);
                close_fd(write);
            }

            Pipe(const Pipe &) = delete;
            Pipe &operator=(const Pipe &) = delete;

            int release_read()
            {
                const int fd = read;
                read = -1;
                return fd;
            }
        };

        std::vector<char *> to_argv(std::vector<std::string> &words)
        {
            std::vector<char *> argv;
            argv.reserve(words.size() + 1);
            for (auto &word : words)
            {
                argv.push_back(word.data());
            }
            argv.push_back(nullptr);
            return argv;
        }

        std::string trim_line(std::string line)
        {
            while (!line.empty() && (line.back() == ' ' || line.back() == '\t'))
            {
                line.pop_back();
            }
            return line;
        }

        void push_capped(std::deque<std::string> &lines, std::string line, std::size_t cap)
        {
            lines.push_back(std::move(line));
            while (cap > 0 && lines.size() > cap)
            {
                lines.pop_front();
            }
        }

        std::string join_lines(const std::deque<std::string> &lines)
        {
            std::string result;
            for (const auto &line : lines)
            {
                if (!result.empty())
                {
                    result += '\n';
                }
                result += line;
            }
            return result;
        }

        TransferProgress to_transfer_progress(const ParsedProgress &parsed, TimePoint start_time)
        {
            return TransferProgress{
                .bytes_transferred = parsed.bytes_transferred,
                .total_bytes = parsed.total_bytes,
                .percentage = parsed.percentage,
                .speed = parsed.speed,
                .eta = parsed.eta,
                .start_time = start_time,
                .last_update = Clock::now(),
            };
        }

    } // namespace

    struct ProcessManager::Process
    {
        explicit Process(asio::io_context &io_context)
            : stdout_pipe(io_context), stderr_pipe(io_context), timeout_timer(io_context), reap_timer(io_context),
              kill_timer(io_context)
        {
        }

        std::string id;
        std::string transfer_id;
        std::string job_id;
        std::string file_id;
        ProcessStatus status{ProcessStatus::Pending};
        std::string command;
        TimePoint start_time{Clock::now()};
        std::optional<TimePoint> end_time;
        pid_t pid{-1};
        bool closed{false};

        asio::posix::stream_descriptor stdout_pipe;
        asio::posix::stream_descriptor stderr_pipe;
        std::array<char, kReadBufferSize> stdout_buffer{};
        std::array<char, kReadBufferSize> stderr_buffer{};
        std::string stdout_partial;
        std::string stderr_partial;
        int open_streams{0};

        asio::steady_timer timeout_timer;
        asio::steady_timer reap_timer;
        asio::steady_timer kill_timer;

        ProgressParser parser;
        std::optional<ParsedProgress> progress;
        std::optional<std::chrono::steady_clock::time_point> last_progress_event;
        std::deque<std::string> output;
        std::deque<std::string> errors;
        std::optional<ProcessResult> result;
        std::optional<std::filesystem::path> key_file;
    };

    std::string_view to_string(ProcessStatus status) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    bool is_terminal(ProcessStatus status) noexcept
    {
        return status == ProcessStatus::Completed || status == ProcessStatus::Failed ||
               status == ProcessStatus::Cancelled || status == ProcessStatus::Timeout;
    }

    void to_json(nlohmann::json &json, const ProcessStats &stats)
    {
        json = {
            {"total", stats.total},
            {"active", stats.active},
            {"completed", stats.completed},
            {"failed", stats.failed},
            {"cancelled", stats.cancelled},
            {"timeout", stats.timeout},
        };
    }

    ProcessManager::ProcessManager(asio::io_context &io_context, ProcessManagerConfig config, KeyStore &keys,
                                   EventSink *events)
        : io_context_(io_context), config_(std::move(config)), keys_(keys), events_(events),
          builder_(config_.rsync_binary)
    {
    }

    ProcessManager::~ProcessManager()
    {
        shutdown();
    }

    std::string ProcessManager::start(const ProcessRequest &request)
    {
        if (shutting_down_)
        {
            throw TransferError(ErrorCode::Busy, "Process manager is shutting down");
        }
        if (active_count() >= config_.max_concurrent_processes)
        {
            throw TransferError(ErrorCode::Busy, "Maximum concurrent transfers reached");
        }
        const auto validation = builder_.validate(request.command);
        if (!validation.valid())
        {
            throw TransferError(ErrorCode::ValidationFailed, "Invalid rsync configuration: " + validation.joined());
        }

        auto process = std::make_shared<Process>(io_context_);
        process->id = "rsync_" + crypto::random_token(6);
        process->transfer_id = request.transfer_id;
        process->job_id = request.job_id;
        process->file_id = request.file_id;
        processes_[process->id] = process;

        auto spec = request.command;
        try
        {
            if (!spec.ssh.private_key.empty())
            {
                process->key_file = keys_.write_key(spec.ssh.private_key);
                spec.key_file = process->key_file;
            }
            if (spec.remote_source())
            {
                const auto parent = std::filesystem::path(spec.destination).parent_path();
                if (!parent.empty())
                {
                    std::filesystem::create_directories(parent);
                }
            }
            const auto command = builder_.build(spec);
            process->command = command.redacted();
            process->status = ProcessStatus::Starting;
            emit_status(*process, ProcessStatus::Pending);
            spdlog::info("Starting rsync process {} for transfer {} (job {}): {}", process->id, process->transfer_id,
                         process->job_id, process->command);
            spawn(*process, command, spec.ssh);
        }
        catch (const TransferError &ex)
        {
            finish_without_process(*process, ex.what());
            throw;
        }
        catch (const std::filesystem::filesystem_error &ex)
        {
            finish_without_process(*process, ex.what());
            throw TransferError(ErrorCode::SpawnFailed, std::string("Failed to prepare destination: ") + ex.what());
        }

        process->status = ProcessStatus::Running;
        emit_status(*process, ProcessStatus::Starting);

        process->timeout_timer.expires_after(request.timeout.value_or(config_.default_timeout));
        std::weak_ptr<Process> weak = process;
        process->timeout_timer.async_wait([this, weak](const std::error_code &ec)
                                          {
                                              if (ec)
                                              {
                                                  return;
                                              }
                                              if (auto locked = weak.lock())
                                              {
                                                  on_timeout(locked);
                                              } });

        read_stream(process, true);
        read_stream(process, false);
        return process->id;
    }

    void ProcessManager::spawn(Process &process, const RsyncCommand &command, const SshCredentials &ssh)
    {
        Pipe out;
        Pipe err;
        Pipe exec_status;

        const bool use_password = ssh.uses_password() && !process.key_file;
        std::vector<std::string> words;
        std::vector<std::string> environment;
        if (use_password)
        {
            // The password reaches sshpass through its environment, never argv.
            words = {config_.shell, "-c",
                     "exec " + escape_shell_arg(config_.sshpass_binary) + " -e " + command.to_shell_command()};
            for (char **entry = environ; entry && *entry; ++entry)
            {
                if (std::strncmp(*entry, "SSHPASS=", 8) != 0)
                {
                    environment.emplace_back(*entry);
                }
            }
            environment.push_back("SSHPASS=" + ssh.password);
        }
        else
        {
            words.push_back(command.program);
            words.insert(words.end(), command.arguments.begin(), command.arguments.end());
        }
        auto argv = to_argv(words);
        auto envp = to_argv(environment);

        const pid_t pid = ::fork();
        if (pid < 0)
        {
            throw TransferError(ErrorCode::SpawnFailed, std::string("fork failed: ") + std::strerror(errno));
        }
        if (pid == 0)
        {
            ::setpgid(0, 0);
            const int devnull = ::open("/dev/null", O_RDONLY);
            if (devnull >= 0)
            {
                ::dup2(devnull, STDIN_FILENO);
                ::close(devnull);
            }
            ::dup2(out.write, STDOUT_FILENO);
            ::dup2(err.write, STDERR_FILENO);
            if (use_password)
            {
                ::execve(argv[0], argv.data(), envp.data());
            }
            else
            {
                ::execvp(argv[0], argv.data());
            }
            const int error = errno;
            [[maybe_unused]] const auto written = ::write(exec_status.write, &error, sizeof(error));
            ::_exit(127);
        }

        ::setpgid(pid, pid);
        close_fd(out.write);
        close_fd(err.write);
        close_fd(exec_status.write);

        int child_errno = 0;
        ssize_t count = 0;
        do
        {
            count = ::read(exec_status.read, &child_errno, sizeof(child_errno));
        } while (count < 0 && errno == EINTR);

        if (count == static_cast<ssize_t>(sizeof(child_errno)))
        {
            int ignored = 0;
            ::waitpid(pid, &ignored, 0);
            throw TransferError(ErrorCode::SpawnFailed,
                                "Failed to execute " + words.front() + ": " + std::strerror(child_errno));
        }

        process.pid = pid;
        process.stdout_pipe.assign(out.release_read());
        process.stderr_pipe.assign(err.release_read());
        process.open_streams = 2;
    }

    void ProcessManager::read_stream(const std::shared_ptr<Process> &process, bool is_stdout)
    {
        auto &pipe = is_stdout ? process->stdout_pipe : process->stderr_pipe;
        auto &buffer = is_stdout ? process->stdout_buffer : process->stderr_buffer;
        pipe.async_read_some(asio::buffer(buffer), [this, process, is_stdout](const std::error_code &ec,
                                                                              std::size_t bytes)
                             {
                                 auto &partial = is_stdout ? process->stdout_partial : process->stderr_partial;
                                 const auto &data = is_stdout ? process->stdout_buffer : process->stderr_buffer;
                                 for (std::size_t i = 0; i < bytes; ++i)
                                 {
                                     const char c = data[i];
                                     // --progress redraws its line with carriage returns.
                                     if (c == '\n' || c == '\r')
                                     {
                                         handle_line(*process, std::move(partial), is_stdout);
                                         partial.clear();
                                     }
                                     else
                                     {
                                         partial += c;
                                     }
                                 }
                                 if (ec)
                                 {
                                     if (!partial.empty())
                                     {
                                         handle_line(*process, std::move(partial), is_stdout);
                                         partial.clear();
                                     }
                                     on_stream_closed(process);
                                     return;
                                 }
                                 read_stream(process, is_stdout); });
    }

    void ProcessManager::handle_line(Process &process, std::string line, bool is_stdout)
    {
        line = trim_line(std::move(line));
        if (line.find_first_not_of(" \t") == std::string::npos)
        {
            return;
        }
        if (!is_stdout)
        {
            spdlog::warn("rsync {} stderr: {}", process.id, line);
            emit_log(process, "error", line);
            push_capped(process.errors, std::move(line), config_.max_output_lines);
            return;
        }

        if (auto parsed = process.parser.parse_line(line))
        {
            process.progress = *parsed;
            emit_progress(process);
        }
        emit_log(process, "debug", line);
        push_capped(process.output, std::move(line), config_.max_output_lines);
    }

    void ProcessManager::on_stream_closed(const std::shared_ptr<Process> &process)
    {
        if (process->closed || --process->open_streams > 0)
        {
            return;
        }
        schedule_reap(process);
    }

    void ProcessManager::schedule_reap(const std::shared_ptr<Process> &process)
    {
        if (process->closed || process->pid <= 0)
        {
            return;
        }
        int wait_status = 0;
        const pid_t result = ::waitpid(process->pid, &wait_status, WNOHANG);
        if (result == process->pid)
        {
            on_exit(*process, wait_status);
            return;
        }
        if (result < 0 && errno != EINTR)
        {
            spdlog::error("waitpid failed for rsync {}: {}", process->id, std::strerror(errno));
            on_exit(*process, -1);
            return;
        }
        process->reap_timer.expires_after(config_.reap_interval);
        process->reap_timer.async_wait([this, process](const std::error_code &ec)
                                       {
                                           if (!ec)
                                           {
                                               schedule_reap(process);
                                           } });
    }

    void ProcessManager::on_exit(Process &process, int wait_status)
    {
        process.closed = true;
        process.pid = -1;
        process.timeout_timer.cancel();
        process.reap_timer.cancel();
        process.kill_timer.cancel();
        std::error_code ignored;
        process.stdout_pipe.close(ignored);
        process.stderr_pipe.close(ignored);

        int exit_code = -1;
        if (wait_status >= 0 && WIFEXITED(wait_status))
        {
            exit_code = WEXITSTATUS(wait_status);
        }
        else if (wait_status >= 0 && WIFSIGNALED(wait_status))
        {
            exit_code = 128 + WTERMSIG(wait_status);
        }

        if (!process.end_time)
        {
            process.end_time = Clock::now();
        }
        const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(*process.end_time -
                                                                                    process.start_time);
        const auto old_status = process.status;
        ProcessResult result{.success = false, .exit_code = exit_code, .stats = std::nullopt, .duration = duration, .error = {}};

        if (process.status == ProcessStatus::Running || process.status == ProcessStatus::Starting)
        {
            if (exit_code == 0)
            {
                process.status = ProcessStatus::Completed;
                result.success = true;
                result.stats = ProgressParser::parse_stats({process.output.begin(), process.output.end()});
            }
            else
            {
                process.status = ProcessStatus::Failed;
                const auto stderr_text = join_lines(process.errors);
                result.error = "Rsync failed with exit code " + std::to_string(exit_code) + ": " +
                               (stderr_text.empty() ? std::string("Unknown error") : stderr_text);
            }
        }
        else if (process.status == ProcessStatus::Timeout)
        {
            result.error = "Transfer timeout";
        }
        else if (process.status == ProcessStatus::Cancelled)
        {
            result.error = "Transfer cancelled";
        }
        process.result = std::move(result);

        if (process.key_file)
        {
            keys_.remove(*process.key_file);
            process.key_file.reset();
        }

        spdlog::info("rsync {} for transfer {} exited with code {} after {} ms ({})", process.id, process.transfer_id,
                     exit_code, duration.count(), to_string(process.status));
        if (old_status != process.status)
        {
            emit_status(process, old_status, process.result->error);
        }
    }

    void ProcessManager::on_timeout(const std::shared_ptr<Process> &process)
    {
        if (process->closed || is_terminal(process->status))
        {
            return;
        }
        const auto old_status = process->status;
        process->status = ProcessStatus::Timeout;
        process->end_time = Clock::now();
        spdlog::warn("rsync {} for transfer {} timed out", process->id, process->transfer_id);
        terminate(process);
        emit_status(*process, old_status, "Transfer timeout");
    }

    void ProcessManager::terminate(const std::shared_ptr<Process> &process)
    {
        if (process->pid <= 0 || process->closed)
        {
            return;
        }
        if (::kill(-process->pid, SIGTERM) != 0)
        {
            ::kill(process->pid, SIGTERM);
        }
        std::weak_ptr<Process> weak = process;
        process->kill_timer.expires_after(kKillGrace);
        process->kill_timer.async_wait([weak](const std::error_code &ec)
                                       {
                                           auto locked = weak.lock();
                                           if (!ec && locked && !locked->closed && locked->pid > 0)
                                           {
                                               ::kill(-locked->pid, SIGKILL);
                                           } });
    }

    void ProcessManager::finish_without_process(Process &process, const std::string &error)
    {
        const auto old_status = process.status;
        process.status = ProcessStatus::Failed;
        process.closed = true;
        process.end_time = Clock::now();
        process.result = ProcessResult{
            .success = false,
            .exit_code = -1,
            .stats = std::nullopt,
            .duration = std::chrono::duration_cast<std::chrono::milliseconds>(*process.end_time - process.start_time),
            .error = error,
        };
        if (process.key_file)
        {
            keys_.remove(*process.key_file);
            process.key_file.reset();
        }
        spdlog::error("Failed to start rsync process {} for transfer {}: {}", process.id, process.transfer_id, error);
        emit_status(process, old_status, error);
    }

    bool ProcessManager::cancel(const std::string &process_id)
    {
        auto it = processes_.find(process_id);
        if (it == processes_.end())
        {
            return false;
        }
        auto &process = *it->second;
        if (process.closed || is_terminal(process.status))
        {
            return false;
        }
        const auto old_status = process.status;
        process.status = ProcessStatus::Cancelled;
        process.end_time = Clock::now();
        process.timeout_timer.cancel();
        terminate(it->second);
        spdlog::info("Cancelled rsync process {} for transfer {}", process.id, process.transfer_id);
        emit_status(process, old_status, "Transfer cancelled");
        return true;
    }

    std::optional<ProcessSnapshot> ProcessManager::get(const std::string &process_id) const
    {
        auto it = processes_.find(process_id);
        if (it == processes_.end())
        {
            return std::nullopt;
        }
        return snapshot(*it->second);
    }

    std::vector<ProcessSnapshot> ProcessManager::active() const
    {
        std::vector<ProcessSnapshot> result;
        for (const auto &[id, process] : processes_)
        {
            if (process->status == ProcessStatus::Starting || process->status == ProcessStatus::Running)
            {
                result.push_back(snapshot(*process));
            }
        }
        return result;
    }

    std::size_t ProcessManager::active_count() const
    {
        return static_cast<std::size_t>(std::count_if(processes_.begin(), processes_.end(), [](const auto &item)
                                                      { return !item.second->closed; }));
    }

    bool ProcessManager::has_capacity() const
    {
        return !shutting_down_ && active_count() < config_.max_concurrent_processes;
    }

    ProcessStats ProcessManager::stats() const
    {
        ProcessStats stats;
        stats.total = processes_.size();
        for (const auto &[id, process] : processes_)
        {
            switch (process->status)
            {
            case ProcessStatus::Pending:
                break;
            case ProcessStatus::Starting:
            case ProcessStatus::Running:
                ++stats.active;
                break;
            case ProcessStatus::Completed:
                ++stats.completed;
                break;
            case ProcessStatus::Failed:
                ++stats.failed;
                break;
            case ProcessStatus::Cancelled:
                ++stats.cancelled;
                break;
            case ProcessStatus::Timeout:
                ++stats.timeout;
                break;
            }
        }
        return stats;
    }

    std::size_t ProcessManager::cleanup(std::chrono::milliseconds older_than)
    {
        const auto cutoff = Clock::now() - older_than;
        std::size_t removed = 0;
        for (auto it = processes_.begin(); it != processes_.end();)
        {
            const auto &process = *it->second;
            if (process.closed && is_terminal(process.status) && process.end_time && *process.end_time < cutoff)
            {
                it = processes_.erase(it);
                ++removed;
            }
            else
            {
                ++it;
            }
        }
        if (removed > 0)
        {
            spdlog::debug("Removed {} finished rsync process record(s)", removed);
        }
        return removed;
    }

    void ProcessManager::shutdown()
    {
        if (shutting_down_)
        {
            return;
        }
        shutting_down_ = true;

        std::vector<std::shared_ptr<Process>> live;
        for (const auto &[id, process] : processes_)
        {
            if (!process->closed && process->pid > 0)
            {
                live.push_back(process);
            }
        }
        for (const auto &process : live)
        {
            if (!is_terminal(process->status))
            {
                const auto old_status = process->status;
                process->status = ProcessStatus::Cancelled;
                process->end_time = Clock::now();
                emit_status(*process, old_status, "Shutting down");
            }
            ::kill(-process->pid, SIGTERM);
        }

        const auto deadline = std::chrono::steady_clock::now() + kShutdownGrace;
        for (const auto &process : live)
        {
            int wait_status = 0;
            while (true)
            {
                const pid_t result = ::waitpid(process->pid, &wait_status, WNOHANG);
                if (result == process->pid || (result < 0 && errno != EINTR))
                {
                    break;
                }
                if (std::chrono::steady_clock::now() >= deadline)
                {
                    ::kill(-process->pid, SIGKILL);
                    while (::waitpid(process->pid, &wait_status, 0) < 0 && errno == EINTR)
                    {
                    }
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds{20});
            }
            on_exit(*process, wait_status);
        }

        if (!live.empty())
        {
            spdlog::info("Stopped {} rsync process(es)", live.size());
        }
        keys_.remove_all();
    }

    void ProcessManager::emit_status(const Process &process, ProcessStatus old_status, const std::string &message)
    {
        spdlog::debug("rsync {} (transfer {}, job {}) {} -> {}", process.id, process.transfer_id, process.job_id,
                      to_string(old_status), to_string(process.status));
        if (!events_)
        {
            return;
        }
        TransferEvent event{
            .type = EventType::Log,
            .transfer_id = process.transfer_id,
            .job_id = process.job_id,
            .file_id = process.file_id,
            .process_id = process.id,
            .old_status = std::nullopt,
            .new_status = std::nullopt,
            .progress = std::nullopt,
            .level = is_terminal(process.status) && process.status != ProcessStatus::Completed ? "warn" : "info",
            .message = "rsync " + std::string(to_string(old_status)) + " -> " + std::string(to_string(process.status)) +
                       (message.empty() ? std::string{} : ": " + message),
        };
        events_->publish(event);
    }

    void ProcessManager::emit_log(const Process &process, const std::string &level, const std::string &message)
    {
        if (!events_)
        {
            return;
        }
        TransferEvent event;
        event.type = EventType::Log;
        event.transfer_id = process.transfer_id;
        event.job_id = process.job_id;
        event.file_id = process.file_id;
        event.process_id = process.id;
        event.level = level;
        event.message = message;
        events_->publish(event);
    }

    void ProcessManager::emit_progress(Process &process)
    {
        if (!events_ || !process.progress)
        {
            return;
        }
        const auto now = std::chrono::steady_clock::now();
        const bool due = !process.last_progress_event || process.progress->percentage >= 100 ||
                         now - *process.last_progress_event >= config_.progress_update_interval;
        if (!due)
        {
            return;
        }
        process.last_progress_event = now;
        TransferEvent event;
        event.type = EventType::Progress;
        event.transfer_id = process.transfer_id;
        event.job_id = process.job_id;
        event.file_id = process.file_id;
        event.process_id = process.id;
        event.progress = to_transfer_progress(*process.progress, process.start_time);
        events_->publish(event);
    }

    ProcessSnapshot ProcessManager::snapshot(const Process &process) const
    {
        return ProcessSnapshot{
            .id = process.id,
            .transfer_id = process.transfer_id,
            .job_id = process.job_id,
            .file_id = process.file_id,
            .status = process.status,
            .command = process.command,
            .start_time = process.start_time,
            .end_time = process.end_time,
            .progress = process.progress,
            .output = {process.output.begin(), process.output.end()},
            .errors = {process.errors.begin(), process.errors.end()},
            .result = process.result,
            .closed = process.closed,
        };
    }

} // namespace warpsync::daemon
