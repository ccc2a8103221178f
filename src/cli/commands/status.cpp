#include "pipeline_helpers.hpp"
#include "../theme.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <managers/content_index.hpp>
#include <managers/dedup_store.hpp>
#include <managers/state_store.hpp>
#include <managers/upload_tracker.hpp>
#include <iostream>
#include <fmt/format.h>

namespace fs = std::filesystem;

static std::string mount_state(const Config& config, const std::string& volume) {
    if (volume.empty()) return theme::dim("<not set>");
    std::error_code ec;
    bool mounted = fs::is_directory(config.volume_path(volume), ec);
    return volume + " (" + (mounted ? theme::green("mounted") : theme::dim("not mounted")) + ")";
}

// Strict re-read of both stores. Returns the number of problems found.
static size_t validate_stores(const Config& config) {
    size_t problems = 0;

    std::cout << theme::section("Validation");
    auto hash_problems = LogContentIndex::validate(config.hash_db_path());
    for (const auto& p : hash_problems) {
        std::cout << theme::fail(fmt::format("StateCorruption: {}:{}: {}",
                                             config.hash_db_path().string(), p.line_number, p.reason));
    }
    if (hash_problems.empty()) std::cout << theme::ok("Hash database: no problems");
    problems += hash_problems.size();

    auto upload_problems = UploadStateStore::validate(config.upload_state_path());
    for (const auto& p : upload_problems) {
        std::cout << theme::fail(fmt::format("StateCorruption: {} record #{}: {}",
                                             config.upload_state_path().string(), p.index, p.reason));
    }
    if (upload_problems.empty()) std::cout << theme::ok("Upload state: no problems");
    problems += upload_problems.size();

    return problems;
}

static int do_status(BaseCLI& cli, const std::vector<std::string>& args) {
    auto parsed = parse_command_args(args, {}, {"--validate"});
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        return 1;
    }
    if (!cli.require_config()) return 1;

    const Config& config = cli.config.value();
    const auto& vols = config.volumes();

    std::cout << theme::section(fmt::format("shutterbox v{} - Status", APP_VERSION));

    const auto& server = config.server();
    std::cout << theme::kv("Server:", server.url.empty() ? theme::dim("<not set>") : server.url);
    std::cout << theme::kv("API key:", server.api_key.empty() ? theme::dim("<not set>")
                                                             : mask_secret(server.api_key));
    std::cout << theme::kv("Source card:", mount_state(config, vols.source));
    std::cout << theme::kv("Archive:", mount_state(config, vols.archive));
    std::cout << theme::kv("Mirror:", mount_state(config, vols.mirror));
    std::cout << "\n";

    DedupStore store = DedupStore::open(config.hash_db_path());
    std::error_code ec;
    uint64_t db_size = fs::exists(config.hash_db_path(), ec) ? fs::file_size(config.hash_db_path(), ec) : 0;
    std::cout << theme::kv("Backup database:", fmt::format("{} files ({})", store.count(), human_size(db_size)));

    UploadStateStore state(config.upload_state_path());
    std::cout << "\n";
    std::cout << theme::kv("Uploaded:", fmt::format("{} folder(s), {} files",
        state.count_by_status(UploadStatus::Uploaded), state.files_by_status(UploadStatus::Uploaded)));
    std::cout << theme::kv("Failed:", fmt::format("{} folder(s), {} files",
        state.count_by_status(UploadStatus::Failed), state.files_by_status(UploadStatus::Failed)));
    size_t interrupted = state.count_by_status(UploadStatus::InProgress);
    if (interrupted > 0) {
        std::cout << theme::kv("Interrupted:", theme::yellow(fmt::format("{} folder(s), {} files",
            interrupted, state.files_by_status(UploadStatus::InProgress))));
    }

    fs::path archive_root = config.archive_root(vols.archive);
    if (!vols.archive.empty() && fs::is_directory(archive_root, ec)) {
        UploadTracker tracker(state, archive_root);
        std::cout << theme::kv("Pending upload:", fmt::format("{} folder(s)", tracker.list_pending().size()));
    }
    std::cout << "\n";

    if (parsed.value.has("--validate")) {
        return validate_stores(config) > 0 ? 1 : 0;
    }
    return 0;
}

void register_status_commands(BaseCLI& cli) {
    cli.add_command("status", do_status, "Show volumes, database and upload counts");
}
