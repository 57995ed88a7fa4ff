#include <assetsync/cli/assetsync_cli.h>
#include <assetsync/cli/command_registry.h>
#include <assetsync/config/config_helpers.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <signal.h>

#include <algorithm>
#include <cctype>
#include <csignal>
#include <cstring>
#include <cstdlib>
#include <iostream>

namespace assetsync::cli {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kLogFileMaxSize = 10 * 1024 * 1024;
constexpr std::size_t kLogFileCount = 5;
constexpr auto kSignalPollInterval = std::chrono::milliseconds(100);

volatile std::sig_atomic_t g_interrupted = 0;

std::optional<spdlog::level::level_enum> parseLevel(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "trace")
        return spdlog::level::trace;
    if (s == "debug")
        return spdlog::level::debug;
    if (s == "info")
        return spdlog::level::info;
    if (s == "warn" || s == "warning")
        return spdlog::level::warn;
    if (s == "error" || s == "err")
        return spdlog::level::err;
    if (s == "critical" || s == "crit")
        return spdlog::level::critical;
    if (s == "off" || s == "none")
        return spdlog::level::off;
    return std::nullopt;
}

} // namespace

AssetSyncCLI::AssetSyncCLI() {
    // Conservative default; finalized after parsing flags in run()
    spdlog::set_level(spdlog::level::warn);

    app_ = std::make_unique<CLI::App>("Bulk asset downloader with resume and verification",
                                      "assetsync");
    app_->set_version_flag("--version", "assetsync 1.0.0");
    app_->require_subcommand(1);

    app_->add_option("--config", configOverride_, "Path to config.toml");
    app_->add_option("--state", stateOverride_, "Path to the state file");
    app_->add_flag("-v,--verbose", verbose_, "Enable debug logging");
    app_->add_option("--log-file", logFile_, "Also write logs to a rotating file");

    CommandRegistry::registerAllCommands(this);
}

AssetSyncCLI::~AssetSyncCLI() {
    stopSignalWatcher();
}

void AssetSyncCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

fs::path AssetSyncCLI::configPath() const {
    return config::get_config_path(configOverride_);
}

fs::path AssetSyncCLI::statePath() const {
    if (!stateOverride_.empty())
        return config::expand_tilde(stateOverride_);
    return config::get_data_dir() / "download_state.json";
}

config::DownloadSettings& AssetSyncCLI::settings() {
    if (!settings_) {
        settings_ = config::loadSettings(configPath());
    }
    return *settings_;
}

session::Session& AssetSyncCLI::session() {
    if (!session_) {
        session_ = std::make_unique<session::Session>(
            settings(), statePath(), nullptr, [this](const ProgressEvent& ev) { onEvent(ev); });
        cancelTarget_ = session_.get();
        if (cancelRequested_)
            session_->cancel();
    }
    return *session_;
}

void AssetSyncCLI::requestCancel() {
    cancelRequested_ = true;
    if (auto* target = cancelTarget_.load()) {
        target->cancel();
    }
}

void AssetSyncCLI::onEvent(const ProgressEvent& ev) {
    switch (ev.kind) {
        case EventKind::Started:
            progress_.start(ev.message);
            break;
        case EventKind::CheckProgress:
            progress_.setMessage("checking existing files");
            progress_.update(ev.completed, ev.total);
            break;
        case EventKind::OverallProgress:
            progress_.setMessage("processing");
            progress_.update(ev.completed, ev.total);
            break;
        case EventKind::FileCompleted:
        case EventKind::VerifyResult:
            if (!ev.success) {
                progress_.stop();
                std::cerr << "[FAIL] " << ev.filename << ": " << ev.message << "\n";
                progress_.start("processing");
            }
            break;
        case EventKind::Statistics:
        case EventKind::Log:
            spdlog::debug("{}", ev.message);
            break;
        case EventKind::Cancelled:
            progress_.stop();
            std::cerr << "Cancelled, progress saved\n";
            break;
        case EventKind::Finished:
            progress_.stop();
            std::cout << ev.message << "\n";
            break;
        case EventKind::FileProgress:
            break;
    }
}

void AssetSyncCLI::configureLogging() {
    // Precedence: env ASSETSYNC_LOG_LEVEL > --verbose > config [log] level
    auto level = parseLevel(settings().log.level).value_or(spdlog::level::info);
    if (verbose_)
        level = spdlog::level::debug;
    if (const char* envLvl = std::getenv("ASSETSYNC_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLevel(envLvl)) {
            level = *lvl;
        }
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    std::string file = logFile_.empty() ? settings().log.file : logFile_;
    if (!file.empty()) {
        try {
            auto path = config::expand_tilde(file);
            if (path.has_parent_path()) {
                std::error_code ec;
                fs::create_directories(path.parent_path(), ec);
            }
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path.string(), kLogFileMaxSize, kLogFileCount));
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "Cannot open log file " << file << ": " << e.what() << "\n";
        }
    }

    auto logger = std::make_shared<spdlog::logger>("assetsync", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");
    spdlog::set_level(level);
}

void AssetSyncCLI::installSignalWatcher() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = [](int) { g_interrupted = 1; };
    sa.sa_flags = 0;
    if (sigaction(SIGINT, &sa, nullptr) == -1)
        spdlog::warn("Failed to install SIGINT handler");
    if (sigaction(SIGTERM, &sa, nullptr) == -1)
        spdlog::warn("Failed to install SIGTERM handler");

    // Cancellation takes locks, so it runs here rather than in the handler
    signalWatcher_ = std::thread([this] {
        while (!watcherStop_) {
            if (g_interrupted) {
                g_interrupted = 0;
                spdlog::warn("Interrupt received, stopping after in-flight work");
                requestCancel();
            }
            std::this_thread::sleep_for(kSignalPollInterval);
        }
    });
}

void AssetSyncCLI::stopSignalWatcher() {
    watcherStop_ = true;
    if (signalWatcher_.joinable())
        signalWatcher_.join();
}

int AssetSyncCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    }

    configureLogging();
    if (!pendingCommand_) {
        return 0;
    }

    installSignalWatcher();
    Result<void> result;
    try {
        result = pendingCommand_->execute();
    } catch (const std::exception& e) {
        result = Error{ErrorCode::InternalError, e.what()};
    }

    // Whatever happened, keep what was learned about the records
    if (session_ && saveOnExit_) {
        session_->events().flush();
        if (auto saved = session_->saveState(); !saved) {
            spdlog::error("Failed to save state: {}", saved.error().message);
            if (result)
                result = saved;
        }
    }
    stopSignalWatcher();

    if (!result) {
        std::cerr << "[FAIL] " << result.error().message << " ("
                  << errorToString(result.error().code) << ")\n";
        return result.error().code == ErrorCode::OperationCancelled ? 130 : 1;
    }
    return 0;
}

} // namespace assetsync::cli
