#include <assetsync/cli/assetsync_cli.h>
#include <assetsync/cli/command.h>
#include <assetsync/state/state_store.h>

#include <spdlog/spdlog.h>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace assetsync::cli {

class SyncCommand : public ICommand {
public:
    std::string getName() const override { return "sync"; }

    std::string getDescription() const override {
        return "Download every file in a manifest that is not already present";
    }

    void registerCommand(CLI::App& app, AssetSyncCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("sync", getDescription());
        cmd->add_option("-m,--manifest", manifest_, "JSON manifest mapping file names to hashes")
            ->required()
            ->check(CLI::ExistingFile);
        cmd->add_option("-o,--out", outDir_,
                        "Output directory (defaults to the one recorded in the state)");
        cmd->add_option("--base-url", baseUrl_, "Override [downloader] base_url");
        cmd->add_option("-c,--concurrency", concurrency_, "Maximum parallel transfers")
            ->check(CLI::Range(1, 1000));
        cmd->add_option("--retries", retries_, "Retries per file for transient errors")
            ->check(CLI::Range(0, 100));
        cmd->add_option("--timeout", timeoutSeconds_, "Base request timeout in seconds")
            ->check(CLI::PositiveNumber);
        cmd->add_option("--skip", skip_, "File name to mark skipped (repeatable)");
        cmd->add_flag("--no-resume", noResume_, "Always download from the first byte");
        cmd->add_flag("--no-verify", noVerify_, "Do not hash files after download");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto& settings = cli_->settings();
        if (baseUrl_)
            settings.baseUrl = *baseUrl_;
        if (concurrency_)
            settings.concurrentDownloads = *concurrency_;
        if (retries_)
            settings.maxRetries = *retries_;
        if (timeoutSeconds_)
            settings.timeout = std::chrono::seconds(*timeoutSeconds_);
        if (noResume_)
            settings.enableResume = false;
        if (noVerify_)
            settings.verifyIntegrity = false;

        auto& session = cli_->session();
        if (auto loaded = session.loadState(); !loaded) {
            return loaded.error();
        }
        cli_->saveStateOnExit();

        auto diff = session.loadManifest(manifest_);
        if (!diff) {
            return diff.error();
        }
        std::cout << "Manifest: " << diff.value().existing << " known, " << diff.value().added
                  << " new, " << diff.value().updated << " updated, " << diff.value().removed
                  << " removed\n";

        std::optional<std::filesystem::path> dir;
        if (!outDir_.empty())
            dir = std::filesystem::path(outDir_);
        else if (session.outputDir())
            dir = *session.outputDir();
        if (!dir) {
            return Error{ErrorCode::InvalidArgument,
                         "no output directory; pass --out on the first sync"};
        }
        if (auto ok = session.setOutputDir(*dir); !ok) {
            return ok.error();
        }

        if (!skip_.empty()) {
            auto n = session.skip(skip_, "skipped on request");
            std::cout << "Skipped " << n << " file(s)\n";
        }

        auto report = session.download();
        if (!report) {
            return report.error();
        }
        const auto& r = report.value();
        session.events().flush();

        std::cout << "Downloaded " << r.succeeded << ", already present " << r.alreadyPresent
                  << ", failed " << r.failed << ", verify failed " << r.verifyFailed
                  << ", skipped " << r.skipped << "\n";
        if (r.heldVerifyFailed > 0) {
            std::cout << r.heldVerifyFailed
                      << " file(s) failed verification earlier; run redownload-failed\n";
        }
        auto sizes = session.totalSize();
        std::cout << "On disk: " << state::StateStore::formatSize(sizes.downloaded) << " of "
                  << state::StateStore::formatSize(sizes.total) << "\n";

        if (r.wasCancelled) {
            return Error{ErrorCode::OperationCancelled, "sync interrupted"};
        }
        if (r.failed + r.verifyFailed > 0) {
            return Error{ErrorCode::NetworkError,
                         std::to_string(r.failed + r.verifyFailed) + " file(s) did not download"};
        }
        return {};
    }

private:
    AssetSyncCLI* cli_ = nullptr;
    std::string manifest_;
    std::string outDir_;
    std::optional<std::string> baseUrl_;
    std::optional<std::size_t> concurrency_;
    std::optional<int> retries_;
    std::optional<long> timeoutSeconds_;
    std::vector<std::string> skip_;
    bool noResume_ = false;
    bool noVerify_ = false;
};

std::unique_ptr<ICommand> createSyncCommand() {
    return std::make_unique<SyncCommand>();
}

} // namespace assetsync::cli
