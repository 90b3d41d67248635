/**
 * @file address_utils.hpp
 * @brief IPv4 address, prefix and domain-name helpers
 * @author route-compose Development Team
 * @date 2026
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace routecompose {

/**
 * @struct Ipv4Prefix
 * @brief A normalized IPv4 network: address with host bits cleared plus prefix length
 */
struct Ipv4Prefix {
    uint32_t network = 0;   ///< Network address in host byte order
    int prefix_length = 32; ///< Prefix length 0..32

    /// Dotted-quad form of the network address
    std::string address() const;

    /// CIDR form, e.g. "10.0.0.0/24"
    std::string toString() const;

    /// True for 0.0.0.0/0
    bool isDefault() const { return prefix_length == 0; }

    bool operator==(const Ipv4Prefix& other) const {
        return network == other.network && prefix_length == other.prefix_length;
    }
    bool operator!=(const Ipv4Prefix& other) const { return !(*this == other); }
};

/**
 * @class AddressUtils
 * @brief Static helpers for IPv4 literal parsing and prefix arithmetic
 *
 * Destinations in a profile may be a bare IPv4 address (treated as /32),
 * a CIDR block or a domain literal. These helpers classify and normalize
 * the first two; domain literals are only syntax-checked here and are
 * resolved by the InterfaceResolver at apply time.
 */
class AddressUtils {
public:
    /**
     * @brief Parse a strict dotted-quad IPv4 address
     * @param text Address such as "192.168.1.1"
     * @return Address in host byte order, or empty optional if malformed
     */
    static std::optional<uint32_t> parseAddress(const std::string& text);

    /// True if @p text is a strict dotted-quad IPv4 address
    static bool isValidAddress(const std::string& text);

    /// Format a host-byte-order address as dotted quad
    static std::string formatAddress(uint32_t address);

    /**
     * @brief Parse an address or CIDR block into a normalized prefix
     * @param text "a.b.c.d" (implies /32) or "a.b.c.d/len"
     * @return Prefix with host bits cleared
     * @throws std::invalid_argument if the address or prefix length is malformed
     */
    static Ipv4Prefix parseCIDR(const std::string& text);

    /// True if @p text parses with parseCIDR()
    static bool isAddressOrCIDR(const std::string& text);

    /**
     * @brief Check domain-name syntax (labels of [A-Za-z0-9-], alphabetic TLD)
     * @param text Candidate domain literal
     * @return true if the text looks like a resolvable host name
     */
    static bool isDomainName(const std::string& text);

    /// Convert a prefix length to dotted netmask ("255.255.255.0"); 0.0.0.0 if out of range
    static std::string prefixToMask(int prefix_length);

    /// Convert a dotted netmask to a prefix length; -1 if malformed or non-contiguous
    static int maskToPrefix(const std::string& mask);

    /**
     * @brief Check whether prefix @p outer contains prefix @p inner
     * @return true if @p outer is equally or less specific and covers @p inner's network
     */
    static bool subnetContains(const Ipv4Prefix& outer, const Ipv4Prefix& inner);

    /**
     * @brief A representative host address inside a prefix
     *
     * Host routes yield the host itself. Wider prefixes yield the first
     * usable host address, since the network address rarely answers.
     * Empty when that address falls in 0.0.0.0/8, which the kernel never
     * forwards (the default route and other prefixes starting at 0.0.0.0).
     */
    static std::string hostAddress(const Ipv4Prefix& prefix);

    /**
     * @brief Choose the address a reachability probe should target
     * @param prefix Route destination
     * @param gateway Route next hop, empty for on-link routes
     * @param fallback Configured target for prefixes without a usable host
     *        address; used only if the prefix contains it
     * @return hostAddress(), else @p fallback, else @p gateway (may be empty)
     */
    static std::string probeAddress(const Ipv4Prefix& prefix, const std::string& gateway,
                                    const std::string& fallback = "");

private:
    static uint32_t maskBits(int prefix_length);
};

} // namespace routecompose
