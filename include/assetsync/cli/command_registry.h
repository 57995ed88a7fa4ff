#pragma once

#include <assetsync/cli/command.h>

#include <memory>

namespace assetsync::cli {

class AssetSyncCLI;

std::unique_ptr<ICommand> createSyncCommand();
std::unique_ptr<ICommand> createVerifyCommand();
std::unique_ptr<ICommand> createRedownloadFailedCommand();
std::unique_ptr<ICommand> createStatusCommand();
std::unique_ptr<ICommand> createClearCommand();

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    static void registerAllCommands(AssetSyncCLI* cli);
};

} // namespace assetsync::cli
