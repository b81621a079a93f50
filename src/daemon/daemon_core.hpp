#pragma once

#include "capture_acquirer.hpp"
#include "config.hpp"
#include "platform/capture_host.hpp"
#include "platform/scheduler.hpp"
#include "preferences.hpp"
#include "protocol.hpp"
#include "session.hpp"
#include "storage/chunk_store.hpp"
#include "storage/kv_store.hpp"
#include "storage/recording_library.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Message-driven façade over the recording session. Every request is
// answered exactly once through its Reply, possibly from a later loop turn.
class DaemonCore {
public:
    using Reply = std::function<void(nlohmann::json)>;

    DaemonCore(Config config, bool verbose, Scheduler& scheduler, CaptureHost& host);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // Opens the stores and restores any unfinished recording.
    bool init();

    void handle_command(const nlohmann::json& request, Reply reply);

    SessionState session_state() const;

    void shutdown();

private:
    void handle(const protocol::StartCapture& c, Reply reply);
    void handle(const protocol::StartRecordingWithStream& c, Reply reply);
    void handle(const protocol::StopCapture& c, Reply reply);
    void handle(const protocol::GetRecordingState& c, Reply reply);
    void handle(const protocol::GetRecordingData& c, Reply reply);
    void handle(const protocol::ClearRecording& c, Reply reply);
    void handle(const protocol::AddRecordingChunk& c, Reply reply);
    void handle(const protocol::ListSurfaces& c, Reply reply);
    void handle(const protocol::GetPreferences& c, Reply reply);
    void handle(const protocol::SetPreferences& c, Reply reply);
    void handle(const protocol::ListRecordings& c, Reply reply);
    void handle(const protocol::GetSavedRecording& c, Reply reply);
    void handle(const protocol::DeleteSavedRecording& c, Reply reply);
    void handle(const protocol::RenameRecording& c, Reply reply);
    void handle(const protocol::ClearRecordings& c, Reply reply);
    void handle(const protocol::GetStorageUsage& c, Reply reply);

    std::optional<int64_t> save_to_library(const StopResult& result);
    std::string db_path(const std::string& configured, const char* file) const;

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    Scheduler& scheduler_;
    CaptureHost& host_;

    KeyValueStore kv_;
    ChunkStore chunk_store_;
    PreferenceStore prefs_;
    CaptureAcquirer acquirer_;
    RecordingLibrary library_;

    // Created by init() once the chunk store is readable.
    std::unique_ptr<Session> session_;
};
