#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <asio/io_context.hpp>

#include "warpsync/daemon/command_builder.hpp"
#include "warpsync/daemon/config.hpp"
#include "warpsync/daemon/events.hpp"
#include "warpsync/daemon/key_store.hpp"
#include "warpsync/daemon/progress_parser.hpp"
#include "warpsync/transfer_types.hpp"

namespace warpsync::daemon
{

    enum class ProcessStatus : std::uint8_t
    {
        Pending,
        Starting,
        Running,
        Completed,
        Failed,
        Cancelled,
        Timeout
    };

    std::string_view to_string(ProcessStatus status) noexcept;

    bool is_terminal(ProcessStatus status) noexcept;

    struct ProcessRequest
    {
        std::string transfer_id;
        std::string job_id;
        std::string file_id;
        CommandSpec command;
        std::optional<std::chrono::milliseconds> timeout;
    };

    struct ProcessResult
    {
        bool success{};
        int exit_code{};
        std::optional<TransferStats> stats;
        std::chrono::milliseconds duration{};
        std::string error;
    };

    // Point-in-time copy of a process record.
    struct ProcessSnapshot
    {
        std::string id;
        std::string transfer_id;
        std::string job_id;
        std::string file_id;
        ProcessStatus status{ProcessStatus::Pending};
        std::string command;
        TimePoint start_time{};
        std::optional<TimePoint> end_time;
        std::optional<ParsedProgress> progress;
        std::vector<std::string> output;
        std::vector<std::string> errors;
        std::optional<ProcessResult> result;
        // False until the OS process has been reaped.
        bool closed{};
    };

    struct ProcessStats
    {
        std::size_t total{};
        std::size_t active{};
        std::size_t completed{};
        std::size_t failed{};
        std::size_t cancelled{};
        std::size_t timeout{};
    };

    void to_json(nlohmann::json &json, const ProcessStats &stats);

    // Owns every copy-tool child process. All members run on the io_context
    // thread that was passed in.
    class ProcessManager
    {
    public:
        ProcessManager(asio::io_context &io_context, ProcessManagerConfig config, KeyStore &keys,
                       EventSink *events = nullptr);
        ~ProcessManager();

        ProcessManager(const ProcessManager &) = delete;
        ProcessManager &operator=(const ProcessManager &) = delete;

        // Throws TransferError: Busy at the process limit, ValidationFailed for
        // a bad command spec, SpawnFailed when the child cannot be executed.
        std::string start(const ProcessRequest &request);

        // True when a live process was signalled; false for unknown or
        // already finished processes.
        bool cancel(const std::string &process_id);

        std::optional<ProcessSnapshot> get(const std::string &process_id) const;

        std::vector<ProcessSnapshot> active() const;

        // Children not yet reaped, including cancelled ones still in their
        // kill grace period.
        std::size_t active_count() const;

        // False while shutting down or at the process limit.
        bool has_capacity() const;

        ProcessStats stats() const;

        // Drops closed terminal records whose end time is older than `older_than`.
        std::size_t cleanup(std::chrono::milliseconds older_than);

        // Same, with the configured record retention.
        std::size_t cleanup() { return cleanup(config_.retention); }

        // Terminates and reaps every child, then removes remaining key files.
        void shutdown();

        const CommandBuilder &builder() const noexcept { return builder_; }

    private:
        struct Process;

        void spawn(Process &process, const RsyncCommand &command, const SshCredentials &ssh);
        void read_stream(const std::shared_ptr<Process> &process, bool is_stdout);
        void handle_line(Process &process, std::string line, bool is_stdout);
        void on_stream_closed(const std::shared_ptr<Process> &process);
        void schedule_reap(const std::shared_ptr<Process> &process);
        void on_exit(Process &process, int wait_status);
        void on_timeout(const std::shared_ptr<Process> &process);
        void terminate(const std::shared_ptr<Process> &process);
        void finish_without_process(Process &process, const std::string &error);
        void emit_status(const Process &process, ProcessStatus old_status, const std::string &message = {});
        void emit_log(const Process &process, const std::string &level, const std::string &message);
        void emit_progress(Process &process);
        ProcessSnapshot snapshot(const Process &process) const;

        asio::io_context &io_context_;
        ProcessManagerConfig config_;
        KeyStore &keys_;
        EventSink *events_;
        CommandBuilder builder_;
        std::unordered_map<std::string, std::shared_ptr<Process>> processes_;
        bool shutting_down_{false};
    };

} // namespace warpsync::daemon
