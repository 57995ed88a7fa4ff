#pragma once

#include <assetsync/cli/command.h>
#include <assetsync/cli/progress_indicator.h>
#include <assetsync/config/settings.h>
#include <assetsync/core/event_channel.h>
#include <assetsync/session/session.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace assetsync::cli {

/**
 * Main CLI application class
 *
 * Owns the CLI11 app, the global options, logging setup and the session shared by all
 * subcommands. A subcommand's parse callback only records itself as pending; run()
 * executes it after parsing so the state can be saved on every exit path.
 */
class AssetSyncCLI {
public:
    AssetSyncCLI();
    ~AssetSyncCLI();

    AssetSyncCLI(const AssetSyncCLI&) = delete;
    AssetSyncCLI& operator=(const AssetSyncCLI&) = delete;

    int run(int argc, char* argv[]);

    void registerCommand(std::unique_ptr<ICommand> command);
    void setPendingCommand(ICommand* cmd) { pendingCommand_ = cmd; }

    // Settings from the config file, loaded on first use
    config::DownloadSettings& settings();

    // Build the session on first use; commands may adjust settings() before calling this
    session::Session& session();
    bool hasSession() const { return session_ != nullptr; }

    // Save the state after the command returns, on success, failure or cancel alike.
    // Commands enable this only once the previous state has been loaded.
    void saveStateOnExit() { saveOnExit_ = true; }

    std::filesystem::path statePath() const;
    std::filesystem::path configPath() const;
    bool verbose() const { return verbose_; }

    // Safe to call from a signal-watching thread
    void requestCancel();

private:
    void configureLogging();
    void installSignalWatcher();
    void stopSignalWatcher();
    void onEvent(const ProgressEvent& ev);

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_ = nullptr;

    std::string configOverride_;
    std::string stateOverride_;
    std::string logFile_;
    bool verbose_ = false;
    bool saveOnExit_ = false;

    std::optional<config::DownloadSettings> settings_;
    ProgressIndicator progress_;
    std::unique_ptr<session::Session> session_;

    // Read by the signal watcher thread
    std::atomic<session::Session*> cancelTarget_{nullptr};
    std::atomic<bool> cancelRequested_{false};
    std::atomic<bool> watcherStop_{false};
    std::thread signalWatcher_;
};

} // namespace assetsync::cli
