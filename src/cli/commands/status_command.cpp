#include <assetsync/cli/assetsync_cli.h>
#include <assetsync/cli/command.h>
#include <assetsync/state/state_store.h>

#include <nlohmann/json.hpp>

#include <iomanip>
#include <iostream>
#include <string>

namespace assetsync::cli {

using json = nlohmann::json;

class StatusCommand : public ICommand {
public:
    std::string getName() const override { return "status"; }

    std::string getDescription() const override {
        return "Show download and verification statistics";
    }

    void registerCommand(CLI::App& app, AssetSyncCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("status", getDescription());
        cmd->add_option("--filter", filter_,
                        "List records with this status (pending, completed, failed, ...)")
            ->check(CLI::IsMember({"pending", "downloading", "completed", "failed", "cancelled",
                                   "skipped", "verify_failed"}));
        cmd->add_option("--search", search_, "List records whose name or hash contains text");
        cmd->add_option("--format", format_, "Output format: text, json")
            ->default_val("text")
            ->check(CLI::IsMember({"text", "json"}));
        cmd->add_option("--limit", limit_, "Maximum records to list")->default_val(50);
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto& session = cli_->session();
        if (auto loaded = session.loadState(); !loaded) {
            return loaded.error();
        }

        const auto counts = session.statistics();
        const auto sizes = session.totalSize();
        std::optional<DownloadStatus> status;
        if (!filter_.empty())
            status = downloadStatusFromTag(filter_);
        const bool listing = status.has_value() || !search_.empty();
        auto matches = listing ? state::StateStore::filterRecords(session.records(), status, search_)
                               : std::vector<const FileRecord*>{};

        if (format_ == "json") {
            json out;
            out["state_file"] = cli_->statePath().string();
            out["output_dir"] =
                session.outputDir() ? json(session.outputDir()->string()) : json(nullptr);
            out["counts"] = {{"total", counts.total},
                             {"pending", counts.pending},
                             {"downloading", counts.downloading},
                             {"completed", counts.completed},
                             {"failed", counts.failed},
                             {"cancelled", counts.cancelled},
                             {"skipped", counts.skipped},
                             {"verify_failed", counts.verifyFailed},
                             {"hash_verified", counts.hashVerified},
                             {"hash_mismatched", counts.hashMismatched}};
            out["bytes"] = {{"total", sizes.total}, {"downloaded", sizes.downloaded}};
            if (listing) {
                auto list = json::array();
                for (std::size_t i = 0; i < matches.size() && i < limit_; ++i) {
                    const auto* r = matches[i];
                    list.push_back(json{{"filename", r->filename},
                                        {"hash", r->contentHash},
                                        {"status", std::string(toTag(r->status))},
                                        {"hash_verify_status", std::string(toTag(r->hashVerifyStatus))},
                                        {"error", r->errorMessage.value_or("")}});
                }
                out["records"] = std::move(list);
                out["matched"] = matches.size();
            }
            std::cout << out.dump(2) << "\n";
            return {};
        }

        std::cout << "State:     " << cli_->statePath().string() << "\n";
        std::cout << "Output:    "
                  << (session.outputDir() ? session.outputDir()->string() : "(not set)") << "\n";
        std::cout << "Files:     " << counts.total << "\n";
        std::cout << "  completed      " << counts.completed << "\n";
        std::cout << "  pending        " << counts.pending << "\n";
        std::cout << "  failed         " << counts.failed << "\n";
        std::cout << "  cancelled      " << counts.cancelled << "\n";
        std::cout << "  skipped        " << counts.skipped << "\n";
        std::cout << "  verify failed  " << counts.verifyFailed << "\n";
        std::cout << "Verified:  " << counts.hashVerified << " ok, " << counts.hashMismatched
                  << " mismatched\n";
        std::cout << "Size:      " << state::StateStore::formatSize(sizes.downloaded) << " of "
                  << state::StateStore::formatSize(sizes.total) << "\n";

        if (listing) {
            std::cout << "\n" << matches.size() << " matching record(s)\n";
            for (std::size_t i = 0; i < matches.size() && i < limit_; ++i) {
                const auto* r = matches[i];
                std::cout << "  " << std::left << std::setw(14) << displayLabel(r->status) << " "
                          << r->filename << "  " << r->contentHash;
                if (r->errorMessage)
                    std::cout << "  (" << *r->errorMessage << ")";
                std::cout << "\n";
            }
            if (matches.size() > limit_)
                std::cout << "  ... " << (matches.size() - limit_) << " more\n";
        }
        return {};
    }

private:
    AssetSyncCLI* cli_ = nullptr;
    std::string filter_;
    std::string search_;
    std::string format_{"text"};
    std::size_t limit_ = 50;
};

std::unique_ptr<ICommand> createStatusCommand() {
    return std::make_unique<StatusCommand>();
}

} // namespace assetsync::cli
