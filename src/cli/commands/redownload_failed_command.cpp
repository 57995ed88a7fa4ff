#include <assetsync/cli/assetsync_cli.h>
#include <assetsync/cli/command.h>

#include <iostream>
#include <string>

namespace assetsync::cli {

class RedownloadFailedCommand : public ICommand {
public:
    std::string getName() const override { return "redownload-failed"; }

    std::string getDescription() const override {
        return "Delete files that failed verification and download them again";
    }

    void registerCommand(CLI::App& app, AssetSyncCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("redownload-failed", getDescription());
        cmd->add_option("-o,--out", outDir_,
                        "Directory holding the files (defaults to the recorded one)");
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto& session = cli_->session();
        if (auto loaded = session.loadState(); !loaded) {
            return loaded.error();
        }
        cli_->saveStateOnExit();

        if (!outDir_.empty()) {
            if (auto ok = session.setOutputDir(outDir_); !ok) {
                return ok.error();
            }
        }

        if (session.statistics().verifyFailed == 0) {
            std::cout << "No files are waiting for a redownload\n";
            return {};
        }

        auto report = session.redownloadVerifyFailed();
        if (!report) {
            return report.error();
        }
        const auto& r = report.value();
        session.events().flush();
        std::cout << "Redownloaded " << r.succeeded << ", failed " << r.failed
                  << ", verify failed again " << r.verifyFailed << "\n";

        if (r.wasCancelled) {
            return Error{ErrorCode::OperationCancelled, "redownload interrupted"};
        }
        if (r.failed + r.verifyFailed > 0) {
            return Error{ErrorCode::NetworkError,
                         std::to_string(r.failed + r.verifyFailed) + " file(s) still failing"};
        }
        return {};
    }

private:
    AssetSyncCLI* cli_ = nullptr;
    std::string outDir_;
};

std::unique_ptr<ICommand> createRedownloadFailedCommand() {
    return std::make_unique<RedownloadFailedCommand>();
}

} // namespace assetsync::cli
