#include <algorithm>
#include <cassert>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <sys/stat.h>

#include <asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include "test_support.hpp"
#include "warpsync/daemon/command_builder.hpp"
#include "warpsync/daemon/concurrency_controller.hpp"
#include "warpsync/daemon/config.hpp"
#include "warpsync/daemon/key_store.hpp"
#include "warpsync/daemon/process_manager.hpp"
#include "warpsync/daemon/progress_parser.hpp"
#include "warpsync/daemon/system_validator.hpp"
#include "warpsync/daemon/transfer_store.hpp"
#include "warpsync/error_codes.hpp"

using namespace warpsync;
using namespace warpsync::daemon;

namespace
{

    CommandSpec make_command_spec()
    {
        CommandSpec spec;
        spec.type = TransferType::Download;
        spec.source = "/srv/media/O'Brien's Files/report.pdf";
        spec.destination = "/data/incoming/report.pdf";
        spec.ssh.host = "files.example.com";
        spec.ssh.username = "mirror";
        spec.ssh.private_key = test::kTestKey;
        return spec;
    }

    bool contains(const std::vector<std::string> &words, const std::string &word)
    {
        return std::find(words.begin(), words.end(), word) != words.end();
    }

    void test_shell_escaping_roundtrip()
    {
        const std::vector<std::string> inputs{"O'Brien's Files", "path with (parens) & amps", "/a/b c/d",
                                              "$(touch /tmp/pwned)", "tab\tand;semicolon", ""};
        for (const auto &input : inputs)
        {
            const auto output = run_command("printf '%s' " + escape_shell_arg(input));
            assert(output);
            assert(output->exit_code == 0);
            assert(output->output == input);
        }

        assert(escape_shell_arg("/plain/path-1.txt") == "/plain/path-1.txt");
        assert(escape_shell_arg("a b") == "'a b'");
        assert(escape_shell_arg("O'Brien") == "'O'\\''Brien'");
        assert(escape_shell_arg("") == "''");
        assert(quote_remote_path("/plain") == "'/plain'");
        assert(quote_remote_path("/x/it's") == "'/x/it'\\''s'");
    }

    void test_path_validation()
    {
        assert(!validate_path("/srv/data/file.bin", true));
        assert(!validate_path("/srv/data/dir/", false));
        assert(validate_path("", false) == std::optional<std::string>("Path must be a non-empty string"));
        assert(validate_path("relative/file", true) ==
               std::optional<std::string>("Remote path must be absolute (start with /)"));
        assert(validate_path("relative/file", false) == std::optional<std::string>("Local path must be absolute"));
        assert(validate_path("/srv/../etc/passwd", true) ==
               std::optional<std::string>("Path cannot contain parent directory references (..)"));
        assert(validate_path(std::string("/srv/bad\nname"), false) ==
               std::optional<std::string>("Path contains invalid control characters"));
    }

    void test_command_validation()
    {
        CommandBuilder builder;
        auto spec = make_command_spec();
        assert(builder.validate(spec).valid());

        spec.ssh.host.clear();
        spec.ssh.port = 70000;
        spec.ssh.private_key.clear();
        spec.destination = "relative/out";
        spec.options.bandwidth_limit = -5;
        const auto result = builder.validate(spec);
        assert(!result.valid());
        assert(contains(result.errors, "SSH host is required"));
        assert(contains(result.errors, "SSH port must be between 1 and 65535"));
        assert(contains(result.errors, "SSH private key or password is required"));
        assert(contains(result.errors, "Invalid destination path: Local path must be absolute"));
        assert(contains(result.errors, "Bandwidth limit must be positive"));
        assert(result.joined().find("SSH host is required") != std::string::npos);

        auto hostile = make_command_spec();
        hostile.ssh.host = "files.example.com$(touch /tmp/warpsync_owned)";
        hostile.ssh.username = "mirror;id";
        const auto rejected = builder.validate(hostile);
        assert(contains(rejected.errors, "SSH host contains invalid characters"));
        assert(contains(rejected.errors, "SSH username contains invalid characters"));

        hostile = make_command_spec();
        hostile.ssh.host = "-oProxyCommand=sh";
        assert(contains(builder.validate(hostile).errors, "SSH host contains invalid characters"));

        auto literal = make_command_spec();
        literal.ssh.host = "[2001:db8::7]";
        literal.ssh.username = "backup.svc-01";
        assert(builder.validate(literal).valid());
    }

    std::vector<std::string> split_lines(const std::string &text)
    {
        std::vector<std::string> lines;
        std::string line;
        for (const char c : text)
        {
            if (c == '\n')
            {
                lines.push_back(line);
                line.clear();
            }
            else
            {
                line += c;
            }
        }
        return lines;
    }

    void test_shell_rendering_matches_argv()
    {
        test::TempDir temp("shell_argv");
        const auto echo_args = test::write_fake_rsync(temp.path(), "rsync", "printf '%s\\n' \"$@\"");
        const auto marker = temp.path() / "owned";
        CommandBuilder builder(echo_args.string());

        auto spec = make_command_spec();
        spec.ssh.private_key.clear();
        spec.ssh.password = "hunter2";
        spec.source = "/srv/O'Brien's Files/a b.txt";
        spec.options.exclude = {"cache dir", "$(id)"};

        // Rendering must stay inert even for values validation would refuse.
        spec.ssh.host = "files.example.com$(touch " + marker.string() + ")";
        spec.ssh.username = "mirror`touch " + marker.string() + "`";

        const auto command = builder.build(spec);
        const auto output = run_command(command.to_shell_command());
        assert(output);
        assert(output->exit_code == 0);
        assert(split_lines(output->output) == command.arguments);
        assert(!std::filesystem::exists(marker));

        const auto &remote = command.arguments[command.arguments.size() - 2];
        assert(remote == "mirror`touch " + marker.string() + "`@files.example.com$(touch " + marker.string() +
                             "):'/srv/O'\\''Brien'\\''s Files/a b.txt'");

        spec.ssh.host = "files.example.com";
        spec.ssh.username = "mirror";
        spec.type = TransferType::Upload;
        spec.source = "/data/outgoing/a b.txt";
        spec.destination = "/srv/inbox/it's here.txt";
        const auto upload = builder.build(spec);
        const auto upload_output = run_command(upload.to_shell_command());
        assert(upload_output && upload_output->exit_code == 0);
        const auto upload_lines = split_lines(upload_output->output);
        assert(upload_lines == upload.arguments);
        assert(upload_lines.back() == "mirror@files.example.com:'/srv/inbox/it'\\''s here.txt'");
    }

    void test_command_rendering()
    {
        CommandBuilder builder("/usr/bin/rsync");
        auto spec = make_command_spec();
        spec.ssh.port = 2222;
        spec.key_file = std::filesystem::path("/run/warpsync/keys/key_ab12");
        spec.options.exclude = {"*.tmp", "cache dir"};
        spec.options.bandwidth_limit = 500;

        const auto command = builder.build(spec);
        assert(command.program == "/usr/bin/rsync");
        assert(contains(command.arguments, "-a"));
        assert(contains(command.arguments, "--partial"));
        assert(contains(command.arguments, "--stats"));
        assert(!contains(command.arguments, "--delete"));
        assert(contains(command.arguments, "--exclude=cache dir"));
        assert(contains(command.shell_words, "--exclude='cache dir'"));
        assert(contains(command.arguments, "--bwlimit=500"));

        const auto &args = command.arguments;
        assert(args.size() >= 4);
        assert(args[args.size() - 2] == "mirror@files.example.com:'/srv/media/O'\\''Brien'\\''s Files/report.pdf'");
        assert(args.back() == "/data/incoming/report.pdf");

        const auto e_flag = std::find(args.begin(), args.end(), "-e");
        assert(e_flag != args.end());
        const auto &ssh_command = *(e_flag + 1);
        assert(ssh_command.rfind("ssh -o BatchMode=yes -o StrictHostKeyChecking=no", 0) == 0);
        assert(ssh_command.find("-p 2222") != std::string::npos);
        assert(ssh_command.find("-i /run/warpsync/keys/key_ab12") != std::string::npos);
        assert(ssh_command.find("ConnectTimeout=30") != std::string::npos);

        assert(command.to_shell_command().rfind("/usr/bin/rsync ", 0) == 0);
        const auto redacted = command.redacted();
        assert(redacted.find("key_ab12") == std::string::npos);
        assert(redacted.find("[PRIVATE_KEY_FILE]") != std::string::npos);

        spec.type = TransferType::Upload;
        spec.source = "/data/outgoing/a b.txt";
        spec.destination = "/srv/inbox/a b.txt";
        const auto upload = builder.build(spec);
        assert(upload.arguments[upload.arguments.size() - 2] == "/data/outgoing/a b.txt");
        assert(upload.arguments.back() == "mirror@files.example.com:'/srv/inbox/a b.txt'");
    }

    void test_directory_package_rendering()
    {
        TransferJob job;
        job.type = TransferType::DirectoryPackage;
        job.source = "/srv/projects/alpha";
        job.destination = "/data/projects/alpha";
        job.ssh.host = "files.example.com";
        job.ssh.username = "mirror";
        job.ssh.password = "hunter2";

        const auto spec = command_spec_for(job);
        assert(spec.options.recursive);
        assert(spec.options.dirs);
        assert(spec.options.mkpath);

        CommandBuilder builder;
        const auto command = builder.build(spec);
        assert(contains(command.arguments, "--recursive"));
        assert(contains(command.arguments, "--mkpath"));
        assert(command.arguments[command.arguments.size() - 2] == "mirror@files.example.com:'/srv/projects/alpha/'");
        assert(command.to_shell_command().find("hunter2") == std::string::npos);
        assert(command.ssh_words[2] == "PubkeyAuthentication=no");
    }

    void test_progress_parser()
    {
        ProgressParser parser;
        assert(!parser.parse_line("receiving incremental file list"));

        auto considered = parser.parse_line("receiving file list ... 12 files to consider");
        assert(considered);
        assert(considered->total_files == 12);

        auto itemized = parser.parse_line(">f+++++++++ photos/IMG_0001.jpg");
        assert(itemized);
        assert(itemized->filename == "photos/IMG_0001.jpg");

        auto progress = parser.parse_line("      1,234,567  78%   12.34MB/s    0:00:05 (xfr#3, to-chk=4/9)");
        assert(progress);
        assert(progress->bytes_transferred == 1234567);
        assert(progress->percentage == 78);
        assert(progress->speed == "12.34MB/s");
        assert(progress->eta == "0:00:05");
        assert(progress->total_files == 9);
        assert(progress->file_number == 5);
        assert(progress->filename == "photos/IMG_0001.jpg");
        assert(progress->total_bytes == 1234567ULL * 100 / 78);

        auto human = parser.parse_line("          1.50M  50%    3.00MB/s    0:00:01");
        assert(human);
        assert(human->bytes_transferred == 1572864);

        assert(!parser.parse_line("garbage %% line"));
        parser.reset();
        auto fresh = parser.parse_line("        100 100%    1.00kB/s    0:00:00");
        assert(fresh && fresh->filename.empty());

        assert(parse_size("1,024") == 1024);
        assert(parse_size("2K") == 2048);
        assert(parse_speed("12.00MB/s") == 12.0 * 1024 * 1024);
        assert(parse_speed("512.00kB/s") == 512.0 * 1024);
        assert(parse_speed("100 bytes/s") == 100.0);
        assert(!parse_speed("fast"));
    }

    void test_stats_parser()
    {
        const std::vector<std::string> output{
            "Number of files: 3 (reg: 2, dir: 1)",
            "Number of regular files transferred: 2",
            "Total file size: 2,000 bytes",
            "Total transferred file size: 1,000 bytes",
            "Literal data: 400 bytes",
            "Matched data: 600 bytes",
            "File list size: 120",
            "File list generation time: 0.001 seconds",
            "File list transfer time: 0.000 seconds",
            "sent 1,100 bytes  received 35 bytes  2,270.00 bytes/sec",
            "total size is 2,000  speedup is 1.76",
        };
        const auto stats = ProgressParser::parse_stats(output);
        assert(stats);
        assert(stats->total_files == 3);
        assert(stats->regular_files_transferred == 2);
        assert(stats->total_size == 2000);
        assert(stats->transferred_size == 1000);
        assert(stats->literal_data == 400);
        assert(stats->matched_data == 600);
        assert(stats->file_list_size == 120);
        assert(stats->bytes_sent == 1100);
        assert(stats->bytes_received == 35);
        assert(stats->transfer_rate == 2270.0);
        assert(std::abs(stats->compression_ratio - 60.0) < 1e-9);

        assert(!ProgressParser::parse_stats({"nothing useful here"}));
    }

    void test_config_overlay()
    {
        DaemonConfig config;
        assert(config.queue.max_concurrent_transfers == 3);
        assert(config.queue.max_queue_size == 1000);
        assert(config.retry.delay_for(1) == std::chrono::seconds{1});

        const auto json = nlohmann::json::parse(R"({
            "port": 9000,
            "state_directory": "/var/lib/warpsync",
            "queue": {"max_retries": 5, "process_interval_ms": 250, "priority_scheduling": false},
            "retry": {"base_delay_ms": 100, "max_delay_ms": 1000, "backoff_multiplier": 3.0},
            "concurrency": {"default_job_limit": 2, "job_limits": {"nightly": 1}}
        })");
        apply_config(json, config);
        assert(config.port == 9000);
        assert(config.transfers_directory() == std::filesystem::path("/var/lib/warpsync/transfers"));
        assert(config.queue.max_retries == 5);
        assert(config.queue.process_interval == std::chrono::milliseconds{250});
        assert(!config.queue.priority_scheduling);
        assert(config.concurrency.default_job_limit == 2);
        assert(config.concurrency.job_limits.at("nightly") == 1);

        assert(config.retry.delay_for(1) == std::chrono::milliseconds{100});
        assert(config.retry.delay_for(2) == std::chrono::milliseconds{300});
        assert(config.retry.delay_for(3) == std::chrono::milliseconds{900});
        assert(config.retry.delay_for(4) == std::chrono::milliseconds{1000});

        bool rejected = false;
        try
        {
            apply_config(nlohmann::json::parse(R"({"queue": {"max_concurent_transfers": 4}})"), config);
        }
        catch (const TransferError &ex)
        {
            rejected = ex.code() == ErrorCode::InvalidPayload;
        }
        assert(rejected);

        bool missing = false;
        try
        {
            load_config_file("/nonexistent/warpsync.json");
        }
        catch (const TransferError &ex)
        {
            missing = ex.code() == ErrorCode::NotFound;
        }
        assert(missing);
    }

    void test_retry_classification()
    {
        RetryPolicy policy;
        assert(policy.is_retryable("ssh: connect to host x port 22: Connection refused"));
        assert(policy.is_retryable("Rsync failed with exit code 255: network unreachable"));
        assert(policy.is_retryable("ssh: Could not resolve hostname x: Temporary failure in name resolution"));
        assert(policy.is_retryable("ssh_exchange_identification: Too many connections"));
        assert(!policy.is_retryable("ssh: connect to host h port 22: Network is unreachable"));
        assert(policy.is_retryable("CONNECTION TIMEOUT"));
        assert(!policy.is_retryable("Rsync failed with exit code 23: Permission denied"));
        assert(!policy.is_retryable("Transfer timeout"));
    }

    void test_concurrency_controller()
    {
        ConcurrencyConfig config;
        config.default_job_limit = 2;
        config.job_limits["solo"] = 1;
        ConcurrencyController controller(3, config);

        assert(controller.try_acquire("solo", "t1"));
        assert(controller.try_acquire("solo", "t1"));
        assert(!controller.try_acquire("solo", "t2"));
        assert(controller.active_for_job("solo") == 1);

        assert(controller.try_acquire("bulk", "t3"));
        assert(controller.try_acquire("bulk", "t4"));
        assert(!controller.try_acquire("other", "t5"));
        assert(controller.active_total() == 3);

        const auto snapshot = controller.snapshot();
        assert(snapshot.total_active_jobs == 2);
        assert(snapshot.total_active_transfers == 3);
        assert(snapshot.global_limit == 3);
        assert(snapshot.job_breakdown.size() == 2);

        assert(controller.release("solo", "t1"));
        assert(!controller.release("solo", "t1"));
        assert(controller.active_for_job("solo") == 0);
        assert(controller.try_acquire("solo", "t2"));
        assert(controller.holds("t2"));
        assert(controller.holders().at("t2") == "solo");

        controller.set_job_limit("bulk", 1);
        assert(controller.job_limit("bulk") == 1);
        assert(controller.job_limit("unknown") == 2);
    }

    void test_key_store()
    {
        test::TempDir temp("keys");
        const auto directory = temp.path() / "keys";
        std::filesystem::path written;
        {
            KeyStore store(directory);
            struct stat dir_info{};
            assert(::stat(directory.c_str(), &dir_info) == 0);
            assert((dir_info.st_mode & 0777) == 0700);

            written = store.write_key(test::kTestKey);
            assert(std::filesystem::exists(written));
            struct stat info{};
            assert(::stat(written.c_str(), &info) == 0);
            assert((info.st_mode & 0777) == 0600);
            assert(store.tracked_count() == 1);

            bool rejected = false;
            try
            {
                store.write_key("not a key");
            }
            catch (const TransferError &ex)
            {
                rejected = ex.code() == ErrorCode::ValidationFailed;
            }
            assert(rejected);

            const auto second = store.write_key(test::kTestKey);
            store.remove(second);
            assert(!std::filesystem::exists(second));
            assert(store.tracked_count() == 1);
        }
        assert(!std::filesystem::exists(written));
    }

    void test_transfer_store()
    {
        test::TempDir temp("store");
        JsonTransferStore store(temp.path() / "transfers");

        TransferJob job;
        job.id = "transfer_0a1b2c3d";
        job.job_id = "nightly";
        job.file_id = "file-1";
        job.source = "/srv/a";
        job.destination = "/data/a";
        job.ssh.host = "files.example.com";
        job.ssh.username = "mirror";
        job.ssh.private_key = test::kTestKey;
        job.status = TransferStatus::Transferring;
        job.created_at = from_unix_millis(to_unix_millis(Clock::now()));
        store.save(job);

        struct stat info{};
        assert(::stat((temp.path() / "transfers" / "transfer_0a1b2c3d.json").c_str(), &info) == 0);
        assert((info.st_mode & 0777) == 0600);

        const auto loaded = store.find(job.id);
        assert(loaded);
        assert(loaded->status == TransferStatus::Transferring);
        assert(loaded->ssh.private_key == job.ssh.private_key);
        assert(loaded->created_at == job.created_at);
        assert(store.find_by_job("nightly").size() == 1);
        assert(store.find_by_job("weekly").empty());

        {
            std::ofstream corrupt(temp.path() / "transfers" / "transfer_broken.json");
            corrupt << "{ not json";
        }
        assert(store.load_all().size() == 1);

        bool rejected = false;
        job.id = "../escape";
        try
        {
            store.save(job);
        }
        catch (const TransferError &ex)
        {
            rejected = ex.code() == ErrorCode::InvalidPayload;
        }
        assert(rejected);

        assert(store.remove("transfer_0a1b2c3d"));
        assert(!store.remove("transfer_0a1b2c3d"));
        assert(!store.find("transfer_0a1b2c3d"));
    }

    ProcessRequest make_request(const std::filesystem::path &root, const std::string &transfer_id)
    {
        const auto spec = test::make_spec(root, "job-p", transfer_id);
        TransferJob job;
        job.id = transfer_id;
        job.job_id = spec.job_id;
        job.file_id = spec.file_id;
        job.type = spec.type;
        job.source = spec.source;
        job.destination = spec.destination;
        job.ssh = spec.ssh;
        return ProcessRequest{
            .transfer_id = transfer_id,
            .job_id = spec.job_id,
            .file_id = spec.file_id,
            .command = command_spec_for(job),
            .timeout = std::nullopt,
        };
    }

    void test_process_manager_success()
    {
        test::TempDir temp("process_ok");
        asio::io_context io_context;
        KeyStore keys(temp.path() / "keys");
        test::RecordingSink sink;
        ProcessManagerConfig config;
        config.rsync_binary = test::write_fake_rsync(temp.path(), "rsync", test::successful_rsync_body()).string();
        config.progress_update_interval = std::chrono::milliseconds{0};
        ProcessManager manager(io_context, config, keys, &sink);

        const auto id = manager.start(make_request(temp.path(), "t-ok"));
        assert(manager.active_count() == 1);
        assert(keys.tracked_count() == 1);
        assert(std::filesystem::exists(temp.path() / "incoming"));

        const bool finished = test::run_until(io_context, [&]
                                              { return manager.get(id)->closed; });
        assert(finished);
        const auto snapshot = manager.get(id);
        assert(snapshot->status == ProcessStatus::Completed);
        assert(snapshot->result && snapshot->result->success);
        assert(snapshot->result->exit_code == 0);
        assert(snapshot->result->stats && snapshot->result->stats->regular_files_transferred == 1);
        assert(snapshot->progress && snapshot->progress->percentage == 100);
        assert(snapshot->progress->filename == "data.bin");
        assert(snapshot->command.find("[PRIVATE_KEY_FILE]") != std::string::npos);
        assert(keys.tracked_count() == 0);

        const auto events = sink.events();
        assert(std::any_of(events.begin(), events.end(), [](const TransferEvent &event)
                           { return event.type == EventType::Progress && event.transfer_id == "t-ok"; }));

        const auto stats = manager.stats();
        assert(stats.total == 1 && stats.completed == 1 && stats.active == 0);
        assert(!manager.cancel(id));
        assert(manager.cleanup(std::chrono::milliseconds{0}) == 1);
        assert(!manager.get(id));
    }

    void test_process_manager_failure_and_limits()
    {
        test::TempDir temp("process_fail");
        asio::io_context io_context;
        KeyStore keys(temp.path() / "keys");
        ProcessManagerConfig config;
        config.max_concurrent_processes = 1;
        config.rsync_binary =
            test::write_fake_rsync(temp.path(), "rsync",
                                   "sleep 0.1\necho 'rsync: change_dir \"/srv\" failed: Permission denied (13)' >&2\nexit 23")
                .string();
        ProcessManager manager(io_context, config, keys);

        const auto id = manager.start(make_request(temp.path(), "t-fail"));
        bool busy = false;
        try
        {
            manager.start(make_request(temp.path(), "t-second"));
        }
        catch (const TransferError &ex)
        {
            busy = ex.code() == ErrorCode::Busy && std::string(ex.what()) == "Maximum concurrent transfers reached";
        }
        assert(busy);

        auto invalid = make_request(temp.path(), "t-invalid");
        invalid.command.source = "relative";
        assert(test::run_until(io_context, [&]
                               { return manager.get(id)->closed; }));
        bool rejected = false;
        try
        {
            manager.start(invalid);
        }
        catch (const TransferError &ex)
        {
            rejected = ex.code() == ErrorCode::ValidationFailed;
        }
        assert(rejected);

        const auto snapshot = manager.get(id);
        assert(snapshot->status == ProcessStatus::Failed);
        assert(snapshot->result->exit_code == 23);
        assert(snapshot->result->error.rfind("Rsync failed with exit code 23: ", 0) == 0);
        assert(snapshot->result->error.find("Permission denied") != std::string::npos);
        assert(snapshot->errors.size() == 1);
    }

    void test_process_manager_cancel_and_timeout()
    {
        test::TempDir temp("process_cancel");
        asio::io_context io_context;
        KeyStore keys(temp.path() / "keys");
        ProcessManagerConfig config;
        config.rsync_binary = test::write_fake_rsync(temp.path(), "rsync", "sleep 30\nexit 0").string();
        ProcessManager manager(io_context, config, keys);

        const auto cancelled = manager.start(make_request(temp.path(), "t-cancel"));
        assert(manager.cancel(cancelled));
        assert(!manager.cancel(cancelled));
        assert(test::run_until(io_context, [&]
                               { return manager.get(cancelled)->closed; }));
        assert(manager.get(cancelled)->status == ProcessStatus::Cancelled);
        assert(manager.get(cancelled)->result->error == "Transfer cancelled");

        auto request = make_request(temp.path(), "t-timeout");
        request.timeout = std::chrono::milliseconds{100};
        const auto timed_out = manager.start(request);
        assert(test::run_until(io_context, [&]
                               { return manager.get(timed_out)->closed; }));
        assert(manager.get(timed_out)->status == ProcessStatus::Timeout);
        assert(manager.get(timed_out)->result->error == "Transfer timeout");
        assert(manager.stats().timeout == 1);
        assert(manager.stats().cancelled == 1);
    }

    void test_process_limit_counts_unreaped_children()
    {
        test::TempDir temp("process_grace");
        asio::io_context io_context;
        KeyStore keys(temp.path() / "keys");
        ProcessManagerConfig config;
        config.max_concurrent_processes = 1;
        config.reap_interval = std::chrono::milliseconds{10};
        config.rsync_binary = test::write_fake_rsync(temp.path(), "rsync", "sleep 30\nexit 0").string();
        ProcessManager manager(io_context, config, keys);

        const auto id = manager.start(make_request(temp.path(), "t-first"));
        assert(manager.cancel(id));
        assert(manager.get(id)->status == ProcessStatus::Cancelled);

        // Signalled but not reaped yet: the slot is still taken.
        assert(manager.active_count() == 1);
        assert(!manager.has_capacity());
        bool busy = false;
        try
        {
            manager.start(make_request(temp.path(), "t-second"));
        }
        catch (const TransferError &ex)
        {
            busy = ex.code() == ErrorCode::Busy;
        }
        assert(busy);

        assert(test::run_until(io_context, [&]
                               { return manager.get(id)->closed; }));
        assert(manager.active_count() == 0);
        assert(manager.has_capacity());
        const auto next = manager.start(make_request(temp.path(), "t-third"));
        assert(manager.cancel(next));
        assert(test::run_until(io_context, [&]
                               { return manager.get(next)->closed; }));
    }

    void test_process_manager_spawn_failure()
    {
        test::TempDir temp("process_spawn");
        asio::io_context io_context;
        KeyStore keys(temp.path() / "keys");
        ProcessManagerConfig config;
        config.rsync_binary = (temp.path() / "missing-rsync").string();
        ProcessManager manager(io_context, config, keys);

        bool failed = false;
        try
        {
            manager.start(make_request(temp.path(), "t-spawn"));
        }
        catch (const TransferError &ex)
        {
            failed = ex.code() == ErrorCode::SpawnFailed;
        }
        assert(failed);
        assert(manager.active_count() == 0);
        assert(keys.tracked_count() == 0);
    }

    void test_system_validator()
    {
        test::TempDir temp("validator");
        ProcessManagerConfig config;
        config.rsync_binary =
            test::write_fake_rsync(temp.path(), "rsync", "echo 'rsync  version 2.6.9  protocol version 29'").string();
        config.sshpass_binary = (temp.path() / "no-sshpass").string();
        const auto result = SystemValidator(config).validate(temp.path() / "state", true);

        assert(result.rsync_version == std::optional<std::string>("2.6.9"));
        assert(std::any_of(result.warnings.begin(), result.warnings.end(), [](const std::string &warning)
                           { return warning.find("outdated") != std::string::npos; }));
        assert(std::any_of(result.warnings.begin(), result.warnings.end(), [](const std::string &warning)
                           { return warning.find("sshpass") != std::string::npos; }));
        assert(std::filesystem::is_directory(temp.path() / "state"));
        assert(std::none_of(result.errors.begin(), result.errors.end(), [](const std::string &error)
                            { return error.find("state directory") != std::string::npos; }));
    }

} // namespace

void run_daemon_component_tests()
{
    test_shell_escaping_roundtrip();
    test_path_validation();
    test_command_validation();
    test_shell_rendering_matches_argv();
    test_command_rendering();
    test_directory_package_rendering();
    test_progress_parser();
    test_stats_parser();
    test_config_overlay();
    test_retry_classification();
    test_concurrency_controller();
    test_key_store();
    test_transfer_store();
    test_process_manager_success();
    test_process_manager_failure_and_limits();
    test_process_manager_cancel_and_timeout();
    test_process_limit_counts_unreaped_children();
    test_process_manager_spawn_failure();
    test_system_validator();
}
