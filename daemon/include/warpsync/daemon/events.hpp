#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "warpsync/transfer_types.hpp"

namespace warpsync::daemon
{

    enum class EventType : std::uint8_t
    {
        Progress,
        StatusChange,
        Log
    };

    std::string_view to_string(EventType type) noexcept;

    struct TransferEvent
    {
        EventType type{EventType::Log};
        std::string transfer_id;
        std::string job_id;
        std::string file_id;
        std::string process_id;
        std::optional<TransferStatus> old_status;
        std::optional<TransferStatus> new_status;
        std::optional<TransferProgress> progress;
        std::string level;
        std::string message;
        TimePoint timestamp{Clock::now()};
    };

    void to_json(nlohmann::json &json, const TransferEvent &event);

    class EventSink
    {
    public:
        virtual ~EventSink() = default;

        virtual void publish(const TransferEvent &event) = 0;
    };

    // Fans events out to every subscriber. A throwing subscriber is logged and
    // does not stop delivery to the others.
    class EventBus : public EventSink
    {
    public:
        void subscribe(std::shared_ptr<EventSink> sink);

        void publish(const TransferEvent &event) override;

        std::size_t subscriber_count() const;

    private:
        mutable std::mutex mutex_;
        std::vector<std::shared_ptr<EventSink>> sinks_;
    };

    class LoggingEventSink : public EventSink
    {
    public:
        void publish(const TransferEvent &event) override;
    };

    class JsonLinesEventSink : public EventSink
    {
    public:
        explicit JsonLinesEventSink(const std::filesystem::path &path);

        void publish(const TransferEvent &event) override;

    private:
        std::mutex mutex_;
        std::ofstream out_;
    };

} // namespace warpsync::daemon
