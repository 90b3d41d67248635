/**
 * @file live_state_reader.hpp
 * @brief Canonical reads of the OS route table
 * @author route-compose Development Team
 * @date 2026
 */

#pragma once

#include "network_backend.hpp"
#include <cstdint>
#include <vector>

namespace routecompose {

/**
 * @class LiveStateReader
 * @brief Reads the live route table and fingerprints it
 *
 * Every call goes to the backend; nothing is cached. Entries are returned
 * in canonical order so that two reads of an unchanged table compare equal
 * and fingerprint identically.
 */
class LiveStateReader {
public:
    explicit LiveStateReader(NetworkBackend& backend);

    /**
     * @brief Read the live table
     * @return Entries sorted by key, ifIndex and metric
     * @throws OSCommandError if the table cannot be read
     */
    std::vector<LiveRouteEntry> read();

    /**
     * @brief 64-bit FNV-1a fingerprint of a set of entries
     *
     * Order-independent: the entries are sorted before hashing. Only the
     * fields that take part in entry equality are hashed.
     */
    static uint64_t fingerprint(std::vector<LiveRouteEntry> entries);

private:
    NetworkBackend& backend_;
};

} // namespace routecompose
