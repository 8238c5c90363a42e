#pragma once

#include <string>
#include <map>
#include <mutex>
#include <chrono>
#include <optional>
#include <filesystem>
#include "task.h"

namespace droidrun {

// Per-worker record of task outcomes keyed by ticket. Readers always see a
// whole record, never a mix of an old status and a new payload.
class ResultStore {
public:
    virtual ~ResultStore() = default;

    // Create or overwrite the record for record.ticket
    virtual void write(const ResultRecord& record) = 0;

    // nullopt when no record exists for the ticket
    virtual std::optional<ResultRecord> read(const std::string& ticket) const = 0;

    // Remove non-Running records written before cutoff; returns how many
    virtual size_t collect_garbage(std::chrono::system_clock::time_point cutoff) = 0;

    virtual bool erase(const std::string& ticket) = 0;
};

// Tickets are used as directory names; reject anything else
bool is_valid_ticket(const std::string& ticket);

class MemoryResultStore : public ResultStore {
public:
    void write(const ResultRecord& record) override;
    std::optional<ResultRecord> read(const std::string& ticket) const override;
    size_t collect_garbage(std::chrono::system_clock::time_point cutoff) override;
    bool erase(const std::string& ticket) override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, ResultRecord> records_;
};

// One directory per ticket: <root>/<ticket>/out/result.json.
// Writes go through a temp file and rename(2), so reads are never torn.
class DiskResultStore : public ResultStore {
public:
    explicit DiskResultStore(const std::string& root);

    void write(const ResultRecord& record) override;
    std::optional<ResultRecord> read(const std::string& ticket) const override;
    size_t collect_garbage(std::chrono::system_clock::time_point cutoff) override;
    bool erase(const std::string& ticket) override;

    std::filesystem::path ticket_dir(const std::string& ticket) const;
    std::filesystem::path record_path(const std::string& ticket) const;

    // Remove every result directory (worker --clean results)
    void clear();

private:
    std::filesystem::path root_;
};

} // namespace droidrun
