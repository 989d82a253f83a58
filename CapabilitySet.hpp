/**
 * @file CapabilitySet.hpp
 * @author ottojo
 * @date 6/14/21
 * Optional hardware features available with the installed driver. Supplied from outside (configuration or the
 * caller), never probed here.
 */

#ifndef SAFEVERBS_CAPABILITYSET_HPP
#define SAFEVERBS_CAPABILITYSET_HPP

#include <cstdint>
#include <set>
#include <string>
#include <nlohmann/json.hpp>

enum class Capability {
        ExtendedAtomics,
        DynamicallyConnected,
        /// Informational only: nothing in here requires it, callers may branch on has() to pick a provider path
        ProviderFastPath
};

/// Operand size of an extended (masked) atomic operation, in bytes
enum class AtomicWidth : std::uint8_t {
        Bytes8 = 8,
        Bytes16 = 16,
        Bytes32 = 32
};

const char *toString(Capability capability);

constexpr std::size_t byteCount(AtomicWidth width) {
    return static_cast<std::size_t>(width);
}

class CapabilitySet {
    public:
        CapabilitySet() = default;

        /// Adds extended atomics with the given operand width
        CapabilitySet &withExtendedAtomics(AtomicWidth width);

        CapabilitySet &withDynamicallyConnected();

        CapabilitySet &withProviderFastPath();

        [[nodiscard]] bool has(Capability capability) const;

        [[nodiscard]] bool supports(AtomicWidth width) const;

        [[nodiscard]] const std::set<AtomicWidth> &atomicWidths() const;

        /**
         * Terminates if the capability is missing. Called while constructing resources that depend on it.
         */
        void require(Capability capability) const;

        void require(AtomicWidth width) const;

        [[nodiscard]] std::string describe() const;

        bool operator==(const CapabilitySet &other) const = default;

    private:
        std::set<AtomicWidth> widths;
        bool dynamicallyConnected = false;
        bool providerFastPath = false;

        friend void to_json(nlohmann::json &j, const CapabilitySet &c);

        friend void from_json(const nlohmann::json &j, CapabilitySet &c);
};

void to_json(nlohmann::json &j, const CapabilitySet &c);

/// Widths are given as integers (8, 16, 32). Anything else throws nlohmann::json::other_error.
void from_json(const nlohmann::json &j, CapabilitySet &c);

#endif //SAFEVERBS_CAPABILITYSET_HPP
