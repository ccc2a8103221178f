#include "state_store.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <fstream>
#include <unordered_map>

const char* upload_status_name(UploadStatus status) {
    switch (status) {
        case UploadStatus::Pending:    return "pending";
        case UploadStatus::InProgress: return "in_progress";
        case UploadStatus::Uploaded:   return "uploaded";
        case UploadStatus::Failed:     return "failed";
    }
    return "pending";
}

std::optional<UploadStatus> parse_upload_status(const std::string& s) {
    if (s == "in_progress") return UploadStatus::InProgress;
    if (s == "uploaded") return UploadStatus::Uploaded;
    if (s == "failed") return UploadStatus::Failed;
    return std::nullopt;
}

namespace {

// Returns nullopt and sets reason if the node is not a usable record.
std::optional<UploadStateRecord> parse_record(const YAML::Node& n, std::string& reason) {
    if (!n.IsMap()) {
        reason = "record is not a map";
        return std::nullopt;
    }
    try {
        UploadStateRecord r;
        auto status = parse_upload_status(n["status"].as<std::string>(""));
        if (!status) {
            reason = fmt::format("unknown status '{}'", n["status"].as<std::string>(""));
            return std::nullopt;
        }
        r.status = *status;
        r.unit_key = n["unit_key"].as<std::string>("");
        if (r.unit_key.empty()) {
            reason = "missing unit_key";
            return std::nullopt;
        }
        r.timestamp = n["timestamp"].as<std::string>("");
        r.file_count = n["file_count"].as<int>(0);
        r.exit_code = n["exit_code"].as<std::string>("");
        return r;
    } catch (const YAML::Exception& e) {
        reason = e.what();
        return std::nullopt;
    }
}

} // namespace

UploadStateStore::UploadStateStore(const fs::path& state_path)
    : state_path_(state_path) {}

std::vector<UploadStateRecord> UploadStateStore::read_records(bool& parsed) const {
    parsed = true;
    std::vector<UploadStateRecord> records;

    std::error_code ec;
    if (!fs::exists(state_path_, ec)) {
        return records;
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(state_path_.string());
    } catch (const YAML::Exception& e) {
        log_error("{}: unreadable upload state ({}), treating every unit as pending",
                  state_path_.string(), e.what());
        parsed = false;
        return records;
    }

    if (!root["units"] || !root["units"].IsSequence()) {
        return records;
    }

    // Later records win, so a hand-edited duplicate still resolves to one per key
    std::unordered_map<std::string, size_t> position;
    size_t index = 0;
    for (const auto& n : root["units"]) {
        std::string reason;
        auto r = parse_record(n, reason);
        if (!r) {
            log_warn("{}: skipping upload record #{} ({})", state_path_.string(), index, reason);
        } else {
            auto it = position.find(r->unit_key);
            if (it != position.end()) {
                records[it->second] = *r;
            } else {
                position.emplace(r->unit_key, records.size());
                records.push_back(*r);
            }
        }
        index++;
    }
    return records;
}

std::vector<UploadStateRecord> UploadStateStore::load() const {
    bool parsed = true;
    return read_records(parsed);
}

std::optional<UploadStateRecord> UploadStateStore::get(const std::string& unit_key) const {
    for (auto& r : load()) {
        if (r.unit_key == unit_key) return r;
    }
    return std::nullopt;
}

void UploadStateStore::write_records(const std::vector<UploadStateRecord>& records) const {
    std::error_code dir_ec;
    fs::create_directories(state_path_.parent_path(), dir_ec);
    if (dir_ec) {
        throw PipelineError(ErrorKind::IO, fmt::format(
            "Cannot create {}: {}", state_path_.parent_path().string(), dir_ec.message()));
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "units" << YAML::Value << YAML::BeginSeq;
    for (const auto& r : records) {
        out << YAML::BeginMap;
        out << YAML::Key << "status" << YAML::Value << upload_status_name(r.status);
        out << YAML::Key << "unit_key" << YAML::Value << r.unit_key;
        out << YAML::Key << "timestamp" << YAML::Value << r.timestamp;
        out << YAML::Key << "file_count" << YAML::Value << r.file_count;
        out << YAML::Key << "exit_code" << YAML::Value << r.exit_code;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    fs::path tmp = state_path_.string() + ".tmp";
    {
        std::ofstream fout(tmp.string(), std::ios::trunc);
        if (!fout) {
            throw PipelineError(ErrorKind::IO, "Cannot write " + tmp.string());
        }
        fout << out.c_str() << "\n";
        fout.flush();
        if (!fout) {
            throw PipelineError(ErrorKind::IO, "Failed writing " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, state_path_, ec);
    if (ec) {
        throw PipelineError(ErrorKind::IO, fmt::format(
            "Cannot replace {}: {}", state_path_.string(), ec.message()));
    }
}

void UploadStateStore::upsert(const UploadStateRecord& record) {
    bool parsed = true;
    auto records = read_records(parsed);
    if (!parsed) {
        // Keep the unreadable document for inspection before overwriting it
        std::error_code ec;
        fs::copy_file(state_path_, fs::path(state_path_.string() + ".bak"),
                      fs::copy_options::overwrite_existing, ec);
        log_warn("backed up unreadable {} to .bak", state_path_.string());
    }

    records.erase(std::remove_if(records.begin(), records.end(),
        [&](const UploadStateRecord& r) { return r.unit_key == record.unit_key; }),
        records.end());
    if (record.status != UploadStatus::Pending) {
        records.push_back(record);
    }

    write_records(records);
    log_debug("upload state {} -> {}", record.unit_key, upload_status_name(record.status));
}

std::vector<UploadStateRecord> UploadStateStore::list_by_status(UploadStatus status) const {
    std::vector<UploadStateRecord> out;
    for (auto& r : load()) {
        if (r.status == status) out.push_back(std::move(r));
    }
    std::sort(out.begin(), out.end(), [](const UploadStateRecord& a, const UploadStateRecord& b) {
        return a.unit_key < b.unit_key;
    });
    return out;
}

size_t UploadStateStore::count_by_status(UploadStatus status) const {
    return list_by_status(status).size();
}

long UploadStateStore::files_by_status(UploadStatus status) const {
    long total = 0;
    for (const auto& r : list_by_status(status)) total += r.file_count;
    return total;
}

std::vector<StateProblem> UploadStateStore::validate(const fs::path& state_path) {
    std::vector<StateProblem> problems;
    if (!fs::exists(state_path)) return problems;

    YAML::Node root;
    try {
        root = YAML::LoadFile(state_path.string());
    } catch (const YAML::Exception& e) {
        problems.push_back({0, fmt::format("document is not valid YAML: {}", e.what())});
        return problems;
    }

    if (!root["units"]) return problems;
    if (!root["units"].IsSequence()) {
        problems.push_back({0, "'units' is not a sequence"});
        return problems;
    }

    std::unordered_map<std::string, size_t> seen;
    size_t index = 0;
    for (const auto& n : root["units"]) {
        std::string reason;
        auto r = parse_record(n, reason);
        if (!r) {
            problems.push_back({index, reason});
        } else {
            auto first = seen.emplace(r->unit_key, index);
            if (!first.second) {
                problems.push_back({index, fmt::format(
                    "{} already has a record at #{}", r->unit_key, first.first->second)});
            }
        }
        index++;
    }
    return problems;
}
