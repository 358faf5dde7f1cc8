#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "backend_pool.h"

enum class schedule_policy : uint8_t { round_robin = 0, least_connections = 1 };

const char* schedule_policy_name(schedule_policy p);
bool parse_schedule_policy(std::string_view name, schedule_policy& out);

// Selection over a pool snapshot. An empty result means no backend is
// available; both policies report it the same way.
class scheduler
{
public:
    virtual ~scheduler() = default;

    // `eligible` must be ordered by address (backend_pool::snapshot_eligible)
    virtual std::optional<std::string> pick(const std::vector<backend_endpoint>& eligible) = 0;

    virtual schedule_policy policy() const = 0;

    // Snapshot the pool and pick, skipping `exclude` when another choice exists
    std::optional<std::string> select(const backend_pool& pool, std::string_view exclude = {});
};

class round_robin_scheduler : public scheduler
{
public:
    std::optional<std::string> pick(const std::vector<backend_endpoint>& eligible) override;
    schedule_policy policy() const override { return schedule_policy::round_robin; }

private:
    // Only the cursor is shared between dispatching threads
    std::atomic<uint64_t> m_cursor{0};
};

class least_connections_scheduler : public scheduler
{
public:
    std::optional<std::string> pick(const std::vector<backend_endpoint>& eligible) override;
    schedule_policy policy() const override { return schedule_policy::least_connections; }
};

std::unique_ptr<scheduler> make_scheduler(schedule_policy p);
