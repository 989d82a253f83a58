/**
 * @file CapabilitySet.cpp
 * @author ottojo
 * @date 6/14/21
 */

#include "CapabilitySet.hpp"
#include "Contract.hpp"

#include <vector>
#include <fmt/format.h>
#include <fmt/ranges.h>

const char *toString(Capability capability) {
    switch (capability) {
        case Capability::ExtendedAtomics:
            return "extended atomics";
        case Capability::DynamicallyConnected:
            return "dynamically connected transport";
        case Capability::ProviderFastPath:
            return "provider fast path";
    }
    return "unknown capability";
}

CapabilitySet &CapabilitySet::withExtendedAtomics(AtomicWidth width) {
    widths.insert(width);
    return *this;
}

CapabilitySet &CapabilitySet::withDynamicallyConnected() {
    dynamicallyConnected = true;
    return *this;
}

CapabilitySet &CapabilitySet::withProviderFastPath() {
    providerFastPath = true;
    return *this;
}

bool CapabilitySet::has(Capability capability) const {
    switch (capability) {
        case Capability::ExtendedAtomics:
            return not widths.empty();
        case Capability::DynamicallyConnected:
            return dynamicallyConnected;
        case Capability::ProviderFastPath:
            return providerFastPath;
    }
    return false;
}

bool CapabilitySet::supports(AtomicWidth width) const {
    return widths.contains(width);
}

const std::set<AtomicWidth> &CapabilitySet::atomicWidths() const {
    return widths;
}

void CapabilitySet::require(Capability capability) const {
    expects(has(capability), "capability \"{}\" is not available (have: {})", toString(capability), describe());
}

void CapabilitySet::require(AtomicWidth width) const {
    expects(supports(width), "extended atomics of width {} bytes are not available (have: {})", byteCount(width),
            describe());
}

std::string CapabilitySet::describe() const {
    std::vector<std::string> parts;
    for (auto width: widths) {
        parts.push_back(fmt::format("atomics{}", byteCount(width)));
    }
    if (dynamicallyConnected) {
        parts.emplace_back("dc");
    }
    if (providerFastPath) {
        parts.emplace_back("fastpath");
    }
    if (parts.empty()) {
        return "none";
    }
    return fmt::format("{}", fmt::join(parts, ", "));
}

void to_json(nlohmann::json &j, const CapabilitySet &c) {
    std::vector<int> widths;
    for (auto width: c.widths) {
        widths.push_back(static_cast<int>(width));
    }
    j = nlohmann::json{{"extendedAtomics",  widths},
                       {"dynamicConnect",   c.dynamicallyConnected},
                       {"providerFastPath", c.providerFastPath}};
}

void from_json(const nlohmann::json &j, CapabilitySet &c) {
    c = CapabilitySet{};
    for (int width: j.value("extendedAtomics", std::vector<int>{})) {
        switch (width) {
            case 8:
                c.widths.insert(AtomicWidth::Bytes8);
                break;
            case 16:
                c.widths.insert(AtomicWidth::Bytes16);
                break;
            case 32:
                c.widths.insert(AtomicWidth::Bytes32);
                break;
            default:
                throw nlohmann::json::other_error::create(
                        501, fmt::format("unsupported extended atomic width {}", width), &j);
        }
    }
    c.dynamicallyConnected = j.value("dynamicConnect", false);
    c.providerFastPath = j.value("providerFastPath", false);
}
