#include "warpsync/daemon/events.hpp"

#include <array>
#include <exception>

#include <spdlog/spdlog.h>

#include "warpsync/error_codes.hpp"

namespace warpsync::daemon
{

    namespace
    {

        struct EventTypeMapping
        {
            EventType type;
            std::string_view label;
        };

        constexpr std::array<EventTypeMapping, 3> kEventTypeMappings{{
            {EventType::Progress, "progress"},
            {EventType::StatusChange, "status-change"},
            {EventType::Log, "log"},
        }};

    } // namespace

    std::string_view to_string(EventType type) noexcept
    {
        for (const auto &mapping : kEventTypeMappings)
        {
            if (mapping.type == type)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    void to_json(nlohmann::json &json, const TransferEvent &event)
    {
        json = {
            {"type", to_string(event.type)},
            {"transfer_id", event.transfer_id},
            {"job_id", event.job_id},
            {"file_id", event.file_id},
            {"timestamp", to_unix_millis(event.timestamp)},
        };
        if (!event.process_id.empty())
        {
            json["process_id"] = event.process_id;
        }
        if (event.old_status)
        {
            json["old_status"] = to_string(*event.old_status);
        }
        if (event.new_status)
        {
            json["new_status"] = to_string(*event.new_status);
        }
        if (event.progress)
        {
            json["progress"] = *event.progress;
        }
        if (!event.message.empty())
        {
            json["level"] = event.level;
            json["message"] = event.message;
        }
    }

    void EventBus::subscribe(std::shared_ptr<EventSink> sink)
    {
        std::lock_guard lock(mutex_);
        sinks_.push_back(std::move(sink));
    }

    void EventBus::publish(const TransferEvent &event)
    {
        std::vector<std::shared_ptr<EventSink>> sinks;
        {
            std::lock_guard lock(mutex_);
            sinks = sinks_;
        }
        for (const auto &sink : sinks)
        {
            try
            {
                sink->publish(event);
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Event subscriber failed for transfer {}: {}", event.transfer_id, ex.what());
            }
        }
    }

    std::size_t EventBus::subscriber_count() const
    {
        std::lock_guard lock(mutex_);
        return sinks_.size();
    }

    void LoggingEventSink::publish(const TransferEvent &event)
    {
        switch (event.type)
        {
        case EventType::StatusChange:
            spdlog::info("Transfer {} (job {}, process {}) {} -> {}{}", event.transfer_id, event.job_id,
                         event.process_id.empty() ? "-" : event.process_id,
                         event.old_status ? to_string(*event.old_status) : std::string_view{"-"},
                         event.new_status ? to_string(*event.new_status) : std::string_view{"-"},
                         event.message.empty() ? std::string{} : ": " + event.message);
            break;
        case EventType::Progress:
            if (event.progress)
            {
                spdlog::debug("Transfer {} progress {}% {} eta {} ({} / {} bytes)", event.transfer_id,
                              event.progress->percentage, event.progress->speed, event.progress->eta,
                              event.progress->bytes_transferred, event.progress->total_bytes);
            }
            break;
        case EventType::Log:
            if (event.level == "error")
            {
                spdlog::warn("[{}] {}", event.process_id, event.message);
            }
            else
            {
                spdlog::debug("[{}] {}", event.process_id, event.message);
            }
            break;
        }
    }

    JsonLinesEventSink::JsonLinesEventSink(const std::filesystem::path &path)
    {
        if (path.has_parent_path())
        {
            std::filesystem::create_directories(path.parent_path());
        }
        out_.open(path, std::ios::app);
        if (!out_.is_open())
        {
            throw TransferError(ErrorCode::InternalError, "Unable to open event file: " + path.string());
        }
    }

    void JsonLinesEventSink::publish(const TransferEvent &event)
    {
        const nlohmann::json json = event;
        std::lock_guard lock(mutex_);
        out_ << json.dump() << '\n';
        out_.flush();
    }

} // namespace warpsync::daemon
