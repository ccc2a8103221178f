#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace fs = std::filesystem;

// ── Extension lists ───────────────────────────────────────────
// Accepts a YAML list (".arw", "jpg") or a comma-separated scalar (".arw,.jpg").
static std::vector<std::string> parse_extensions(const YAML::Node& node,
                                                 const std::string& fallback) {
    if (!node) return parse_extension_list(fallback);

    if (node.IsScalar()) {
        return parse_extension_list(node.as<std::string>(""));
    }

    std::vector<std::string> out;
    if (node.IsSequence()) {
        for (const auto& item : node) {
            for (const auto& ext : parse_extension_list(item.as<std::string>(""))) {
                out.push_back(ext);
            }
        }
    }
    return out;
}

static ServerConfig parse_server_config(const YAML::Node& node) {
    ServerConfig server;
    server.url = node["url"].as<std::string>("");
    server.api_key = node["api_key"].as<std::string>("");

    trim(server.url);
    if (!server.url.empty() &&
        server.url.rfind("http://", 0) != 0 && server.url.rfind("https://", 0) != 0) {
        server.url = "https://" + server.url;
    }
    return server;
}

static VolumeConfig parse_volume_config(const YAML::Node& node) {
    VolumeConfig v;
    v.mount_root = node["mount_root"].as<std::string>("/Volumes");
    v.source = node["source"].as<std::string>("");
    v.archive = node["archive"].as<std::string>("");
    v.mirror = node["mirror"].as<std::string>("");
    v.source_subdir = node["source_subdir"].as<std::string>("DCIM");
    v.archive_subdir = node["archive_subdir"].as<std::string>("full_dump");
    return v;
}

static IngestConfig parse_ingest_config(const YAML::Node& node) {
    IngestConfig ingest;
    ingest.include = parse_extensions(node["include"], DEFAULT_MEDIA_EXTENSIONS);
    ingest.exclude = parse_extensions(node["exclude"], "");
    ingest.hash_workers = node["hash_workers"].as<int>(0);
    if (ingest.hash_workers < 0) ingest.hash_workers = 0;
    return ingest;
}

static UploadConfig parse_upload_config(const YAML::Node& node) {
    UploadConfig upload;
    upload.client = node["client"].as<std::string>("immich-go");
    upload.include = parse_extensions(node["include"], DEFAULT_MEDIA_EXTENSIONS);
    upload.exclude = parse_extensions(node["exclude"], "");
    upload.pause_jobs = node["pause_jobs"].as<bool>(true);

    // Out-of-range or non-numeric values fall back to the default
    int tasks = DEFAULT_CONCURRENT_TASKS;
    if (node["concurrent_tasks"] && node["concurrent_tasks"].IsScalar()) {
        tasks = safe_stoi(node["concurrent_tasks"].as<std::string>(""), DEFAULT_CONCURRENT_TASKS);
    }
    if (tasks < 1 || tasks > MAX_CONCURRENT_TASKS) tasks = DEFAULT_CONCURRENT_TASKS;
    upload.concurrent_tasks = tasks;
    return upload;
}

static MirrorConfig parse_mirror_config(const YAML::Node& node) {
    MirrorConfig mirror;
    mirror.tool = node["tool"].as<std::string>("rsync");
    return mirror;
}

// ── Paths ─────────────────────────────────────────────────────

fs::path default_config_home() {
    return platform::home_dir() / ".shutterbox";
}

fs::path get_config_path(const fs::path& home) {
    return home / CONFIG_FILE_NAME;
}

bool config_exists(const fs::path& home) {
    return fs::exists(get_config_path(home));
}

fs::path Config::hash_db_path() const { return home_ / HASH_DB_FILE_NAME; }
fs::path Config::upload_state_path() const { return home_ / UPLOAD_STATE_NAME; }
fs::path Config::log_dir() const { return home_ / LOG_DIR_NAME; }

fs::path Config::volume_path(const std::string& volume) const {
    return fs::path(volumes_.mount_root) / volume;
}

fs::path Config::source_root(const std::string& volume) const {
    return volume_path(volume) / volumes_.source_subdir;
}

fs::path Config::archive_root(const std::string& volume) const {
    return volume_path(volume) / volumes_.archive_subdir;
}

Config Config::with_volumes(const std::string& source,
                            const std::string& archive,
                            const std::string& mirror) const {
    Config copy = *this;
    if (!source.empty()) copy.volumes_.source = source;
    if (!archive.empty()) copy.volumes_.archive = archive;
    if (!mirror.empty()) copy.volumes_.mirror = mirror;
    return copy;
}

std::vector<std::string> Config::validate_upload() const {
    std::vector<std::string> problems;
    if (server_.url.empty()) problems.push_back("server.url is not set");
    if (server_.api_key.empty()) problems.push_back("server.api_key is not set");
    return problems;
}

// ── Loading ───────────────────────────────────────────────────

Result<Config> Config::parse(const std::string& yaml_text, const fs::path& home) {
    try {
        YAML::Node root = YAML::Load(yaml_text);

        Config config;
        config.server_ = parse_server_config(root["server"] ? root["server"] : YAML::Node());
        config.volumes_ = parse_volume_config(root["volumes"] ? root["volumes"] : YAML::Node());
        config.ingest_ = parse_ingest_config(root["ingest"] ? root["ingest"] : YAML::Node());
        config.upload_ = parse_upload_config(root["upload"] ? root["upload"] : YAML::Node());
        config.mirror_ = parse_mirror_config(root["mirror"] ? root["mirror"] : YAML::Node());
        config.home_ = home;

        if (config.mirror_.tool != "rsync" && config.mirror_.tool != "builtin") {
            return Result<Config>::Err("mirror.tool must be 'rsync' or 'builtin', got '" +
                                       config.mirror_.tool + "'");
        }

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& home) {
    if (!config_exists(home)) {
        return Result<Config>::Err("No configuration found at " + get_config_path(home).string() +
                                   ". Run 'shutterbox init' first.");
    }

    std::ifstream in(get_config_path(home));
    if (!in) {
        return Result<Config>::Err("Cannot read " + get_config_path(home).string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return parse(text, home);
}

Result<void> create_default_config(const fs::path& home) {
    fs::path config_path = get_config_path(home);

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# shutterbox configuration
# SD card -> archive SSD -> photo server

server:
  url: ""                          # e.g. https://photos.example.com
  api_key: ""

volumes:
  mount_root: "/Volumes"
  source: ""                       # SD card volume name
  archive: ""                      # primary SSD volume name
  mirror: ""                       # mirror SSD (leave empty to skip)
  source_subdir: "DCIM"
  archive_subdir: "full_dump"

ingest:
  include: [.arw, .cr3, .cr2, .nef, .raf, .dng, .tif, .jpg, .jpeg, .heic, .mp4, .mov]
  exclude: []
  hash_workers: 0                  # 0 = one per CPU

upload:
  client: "immich-go"
  include: [.arw, .cr3, .cr2, .nef, .raf, .dng, .tif, .jpg, .jpeg, .heic, .mp4, .mov]
  exclude: []
  concurrent_tasks: 4              # 1-20
  pause_jobs: true

mirror:
  tool: "rsync"                    # rsync or builtin
)";

    try {
        fs::create_directories(config_path.parent_path());
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        fs::permissions(config_path, fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::replace);
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}
