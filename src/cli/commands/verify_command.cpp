#include <assetsync/cli/assetsync_cli.h>
#include <assetsync/cli/command.h>
#include <assetsync/state/state_store.h>

#include <iostream>
#include <string>

namespace assetsync::cli {

class VerifyCommand : public ICommand {
public:
    std::string getName() const override { return "verify"; }

    std::string getDescription() const override {
        return "Hash downloaded files and compare them with the manifest";
    }

    void registerCommand(CLI::App& app, AssetSyncCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("verify", getDescription());
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

        auto summary = session.verify();
        if (!summary) {
            return summary.error();
        }
        const auto& s = summary.value();
        session.events().flush();

        std::cout << "Verified " << s.processed << " of " << s.total << " file(s): " << s.matched
                  << " ok, " << s.mismatched << " mismatched, " << s.missing << " missing, "
                  << s.errors << " unreadable (" << s.cacheHits << " from cache, "
                  << state::StateStore::formatSize(s.bytesHashed) << " hashed)\n";

        if (s.cancelled) {
            return Error{ErrorCode::OperationCancelled, "verification interrupted"};
        }
        if (s.mismatched > 0) {
            return Error{ErrorCode::HashMismatch,
                         std::to_string(s.mismatched) +
                             " file(s) failed verification; run redownload-failed"};
        }
        return {};
    }

private:
    AssetSyncCLI* cli_ = nullptr;
    std::string outDir_;
};

std::unique_ptr<ICommand> createVerifyCommand() {
    return std::make_unique<VerifyCommand>();
}

} // namespace assetsync::cli
