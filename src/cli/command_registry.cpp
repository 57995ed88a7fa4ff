#include <assetsync/cli/assetsync_cli.h>
#include <assetsync/cli/command_registry.h>

namespace assetsync::cli {

void CommandRegistry::registerAllCommands(AssetSyncCLI* cli) {
    cli->registerCommand(createSyncCommand());
    cli->registerCommand(createVerifyCommand());
    cli->registerCommand(createRedownloadFailedCommand());
    cli->registerCommand(createStatusCommand());
    cli->registerCommand(createClearCommand());
}

} // namespace assetsync::cli
