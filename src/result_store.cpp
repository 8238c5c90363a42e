#include "result_store.h"
#include "constants.h"
#include "errors.h"
#include "wire.h"

#include <atomic>
#include <fstream>
#include <iostream>
#include <sstream>
#include <cstdio>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

namespace droidrun {

bool is_valid_ticket(const std::string& ticket) {
    if (ticket.empty() || ticket.size() > MAX_TICKET_LENGTH) return false;
    for (char c : ticket) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}

// ----------------------------------------------------------------------------
// MemoryResultStore
// ----------------------------------------------------------------------------

void MemoryResultStore::write(const ResultRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[record.ticket] = record;
}

std::optional<ResultRecord> MemoryResultStore::read(const std::string& ticket) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(ticket);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

size_t MemoryResultStore::collect_garbage(std::chrono::system_clock::time_point cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = records_.begin(); it != records_.end();) {
        if (it->second.status != TaskStatus::RUNNING && it->second.written_at < cutoff) {
            it = records_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

bool MemoryResultStore::erase(const std::string& ticket) {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.erase(ticket) > 0;
}

// ----------------------------------------------------------------------------
// DiskResultStore
// ----------------------------------------------------------------------------

DiskResultStore::DiskResultStore(const std::string& root) : root_(root) {
    fs::create_directories(root_);
}

fs::path DiskResultStore::ticket_dir(const std::string& ticket) const {
    return root_ / ticket;
}

fs::path DiskResultStore::record_path(const std::string& ticket) const {
    return ticket_dir(ticket) / RESULT_OUT_DIR / RESULT_JSON_NAME;
}

void DiskResultStore::write(const ResultRecord& record) {
    if (!is_valid_ticket(record.ticket)) {
        throw TaskError(ErrorCode::BAD_REQUEST, "Invalid ticket: " + record.ticket);
    }

    fs::path target = record_path(record.ticket);
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw TaskError(ErrorCode::INTERNAL,
                        "Unable to create " + target.parent_path().string() + ": " + ec.message());
    }

    // Unique temp name per write; rename over the old record is atomic
    static std::atomic<unsigned long> counter{0};
    std::ostringstream tmp_name;
    tmp_name << RESULT_JSON_NAME << ".tmp." << getpid() << "." << ++counter;
    fs::path tmp = target.parent_path() / tmp_name.str();

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw TaskError(ErrorCode::INTERNAL, "Unable to open " + tmp.string());
        }
        out << write_json(record_to_storage_json(record));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            throw TaskError(ErrorCode::INTERNAL, "Unable to write " + tmp.string());
        }
    }

    if (std::rename(tmp.c_str(), target.c_str()) != 0) {
        fs::remove(tmp, ec);
        throw TaskError(ErrorCode::INTERNAL, "Unable to commit " + target.string());
    }
}

std::optional<ResultRecord> DiskResultStore::read(const std::string& ticket) const {
    if (!is_valid_ticket(ticket)) return std::nullopt;

    fs::path path = record_path(ticket);
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return std::nullopt;

    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    try {
        return record_from_storage_json(ticket, parse_json(text));
    } catch (const TaskError& e) {
        std::cerr << "[ResultStore] Malformed record for " << ticket << ": " << e.what() << std::endl;
        ResultRecord record;
        record.ticket = ticket;
        record.status = TaskStatus::ERROR;
        record.payload = "Test result malformed";
        std::error_code ec;
        auto mtime = fs::last_write_time(path, ec);
        record.written_at = ec ? std::chrono::system_clock::now()
            : std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                  mtime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
        return record;
    }
}

size_t DiskResultStore::collect_garbage(std::chrono::system_clock::time_point cutoff) {
    size_t removed = 0;
    std::error_code ec;
    if (!fs::exists(root_, ec)) return 0;

    std::vector<fs::path> dirs;
    for (const auto& entry : fs::directory_iterator(root_, ec)) {
        if (entry.is_directory(ec)) dirs.push_back(entry.path());
    }

    auto now = std::chrono::system_clock::now();
    for (const auto& dir : dirs) {
        std::string ticket = dir.filename().string();

        std::chrono::system_clock::time_point written_at;
        auto record = read(ticket);
        if (record) {
            if (record->status == TaskStatus::RUNNING) continue;
            written_at = record->written_at;
        } else {
            // Directory without a record (interrupted accept); age by mtime
            auto mtime = fs::last_write_time(dir, ec);
            if (ec) continue;
            written_at = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                mtime - fs::file_time_type::clock::now() + now);
        }

        if (written_at >= cutoff) continue;

        fs::remove_all(dir, ec);
        if (ec) {
            std::cerr << "[ResultStore] Unable to remove " << dir.string() << ": "
                      << ec.message() << std::endl;
            continue;
        }
        ++removed;
        auto age = std::chrono::duration_cast<std::chrono::seconds>(now - written_at).count();
        std::cout << "[ResultStore] Result directory " << dir.string()
                  << " too old (age: " << age << "s); removed" << std::endl;
    }
    return removed;
}

bool DiskResultStore::erase(const std::string& ticket) {
    if (!is_valid_ticket(ticket)) return false;
    std::error_code ec;
    return fs::remove_all(ticket_dir(ticket), ec) > 0;
}

void DiskResultStore::clear() {
    std::error_code ec;
    fs::remove_all(root_, ec);
    fs::create_directories(root_, ec);
    std::cout << "[ResultStore] Removed results directory " << root_.string() << std::endl;
}

} // namespace droidrun
