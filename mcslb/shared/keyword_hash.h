#pragma once
#include <cstdint>
#include <string_view>

// Configuration keywords are matched by hash in switch statements. Case
// labels use keyword_hash on the canonical spelling; inputs go through
// keyword_fold so "Least-Connections" and "least_connections" collide.

constexpr uint32_t fnv_offset = 2166136261u;
constexpr uint32_t fnv_prime = 16777619u;

constexpr uint32_t keyword_hash(std::string_view sv)
{
    uint32_t hash = fnv_offset;
    for (char c : sv)
        hash = (hash ^ static_cast<uint8_t>(c)) * fnv_prime;
    return hash;
}

// Lowercase, '-' read as '_', surrounding blanks ignored
constexpr uint32_t keyword_fold(std::string_view sv)
{
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
        sv.remove_prefix(1);
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t'))
        sv.remove_suffix(1);

    uint32_t hash = fnv_offset;
    for (char c : sv)
    {
        if (c >= 'A' && c <= 'Z')
            c = static_cast<char>(c + 32);
        else if (c == '-')
            c = '_';
        hash = (hash ^ static_cast<uint8_t>(c)) * fnv_prime;
    }
    return hash;
}

static_assert(keyword_fold(" Round-Robin ") == keyword_hash("round_robin"));
