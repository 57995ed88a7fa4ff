#include <assetsync/cli/assetsync_cli.h>
#include <assetsync/cli/command.h>

#include <iostream>
#include <string>

namespace assetsync::cli {

class ClearCommand : public ICommand {
public:
    std::string getName() const override { return "clear"; }

    std::string getDescription() const override {
        return "Forget all recorded state (downloaded files are left alone)";
    }

    void registerCommand(CLI::App& app, AssetSyncCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("clear", getDescription());
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto& session = cli_->session();
        if (auto cleared = session.clearState(); !cleared) {
            return cleared.error();
        }
        std::cout << "Cleared " << cli_->statePath().string() << "\n";
        return {};
    }

private:
    AssetSyncCLI* cli_ = nullptr;
};

std::unique_ptr<ICommand> createClearCommand() {
    return std::make_unique<ClearCommand>();
}

} // namespace assetsync::cli
