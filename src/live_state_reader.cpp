#include "live_state_reader.hpp"
#include <algorithm>

namespace routecompose {

namespace {

constexpr uint64_t kFnvOffsetBasis = 0xcbf29ce484222325ULL;
constexpr uint64_t kFnvPrime = 0x100000001b3ULL;

void fnvMix(uint64_t& hash, const std::string& data) {
    for (unsigned char c : data) {
        hash ^= c;
        hash *= kFnvPrime;
    }
}

} // namespace

LiveStateReader::LiveStateReader(NetworkBackend& backend)
    : backend_(backend) {
}

std::vector<LiveRouteEntry> LiveStateReader::read() {
    std::vector<LiveRouteEntry> entries = backend_.listRoutes();
    std::sort(entries.begin(), entries.end());
    return entries;
}

uint64_t LiveStateReader::fingerprint(std::vector<LiveRouteEntry> entries) {
    std::sort(entries.begin(), entries.end());

    uint64_t hash = kFnvOffsetBasis;
    for (const auto& entry : entries) {
        fnvMix(hash, entry.canonical());
        fnvMix(hash, "\n");
    }
    return hash;
}

} // namespace routecompose
