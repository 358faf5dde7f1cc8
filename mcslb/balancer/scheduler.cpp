#include "scheduler.h"
#include "../shared/keyword_hash.h"

#include <algorithm>

const char* schedule_policy_name(schedule_policy p)
{
    switch (p)
    {
        case schedule_policy::round_robin:       return "round_robin";
        case schedule_policy::least_connections: return "least_connections";
        default:                                 return "?";
    }
}

bool parse_schedule_policy(std::string_view name, schedule_policy& out)
{
    switch (keyword_fold(name))
    {
        case keyword_hash("round_robin"):
        case keyword_hash("rr"):
            out = schedule_policy::round_robin;
            return true;
        case keyword_hash("least_connections"):
        case keyword_hash("least_conn"):
            out = schedule_policy::least_connections;
            return true;
        default:
            return false;
    }
}

std::optional<std::string> scheduler::select(const backend_pool& pool, std::string_view exclude)
{
    auto eligible = pool.snapshot_eligible();
    if (!exclude.empty() && eligible.size() > 1)
    {
        eligible.erase(std::remove_if(eligible.begin(), eligible.end(),
            [&](const backend_endpoint& b) { return b.address == exclude; }), eligible.end());
    }
    else if (!exclude.empty() && eligible.size() == 1 && eligible.front().address == exclude)
    {
        return std::nullopt;
    }
    return pick(eligible);
}

std::optional<std::string> round_robin_scheduler::pick(const std::vector<backend_endpoint>& eligible)
{
    if (eligible.empty())
        return std::nullopt;

    // A set that changes size mid-rotation shifts the modulus; the skew lasts
    // at most one rotation
    uint64_t slot = m_cursor.fetch_add(1, std::memory_order_relaxed);
    return eligible[slot % eligible.size()].address;
}

std::optional<std::string> least_connections_scheduler::pick(const std::vector<backend_endpoint>& eligible)
{
    if (eligible.empty())
        return std::nullopt;

    const backend_endpoint* best = &eligible.front();
    for (const auto& b : eligible)
    {
        if (b.active_connections < best->active_connections ||
            (b.active_connections == best->active_connections && b.address < best->address))
            best = &b;
    }
    return best->address;
}

std::unique_ptr<scheduler> make_scheduler(schedule_policy p)
{
    switch (p)
    {
        case schedule_policy::least_connections:
            return std::make_unique<least_connections_scheduler>();
        case schedule_policy::round_robin:
        default:
            return std::make_unique<round_robin_scheduler>();
    }
}
