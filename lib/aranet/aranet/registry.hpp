/**
 * ARANET Registry - GATT UUIDs used by the Aranet4 and the fields they carry
 *
 * Vendor UUIDs:
 *   - 0000FCE0-...: Advertised service, used as the scan filter
 *   - F0CD3001-...: Current readings (13-byte measurement payload)
 *
 * Device Information Service (0x180A) characteristics:
 *   - 0x2A29: Manufacturer Name   (NUL padded on the device)
 *   - 0x2A24: Model Number        (NUL padded on the device)
 *   - 0x2A25: Serial Number
 *   - 0x2A27: Hardware Revision
 *   - 0x2A26: Firmware Revision
 *   - 0x2A28: Software Revision
 */

#ifndef ARANET_REGISTRY_HPP_
#define ARANET_REGISTRY_HPP_

#include <array>
#include <string>

#include "core.hpp"

namespace aranet_registry {

using aranet_core::Identity;
using aranet_core::Uuid;

inline constexpr Uuid kAdvertisedService = Uuid::literal("0000fce0-0000-1000-8000-00805f9b34fb");
inline constexpr Uuid kCurrentReadings   = Uuid::literal("f0cd3001-95da-4f4b-9ac8-aa55d312af0c");

inline constexpr Uuid kManufacturerName  = Uuid::fromShort(0x2A29);
inline constexpr Uuid kModelNumber       = Uuid::fromShort(0x2A24);
inline constexpr Uuid kSerialNumber      = Uuid::fromShort(0x2A25);
inline constexpr Uuid kHardwareRevision  = Uuid::fromShort(0x2A27);
inline constexpr Uuid kFirmwareRevision  = Uuid::fromShort(0x2A26);
inline constexpr Uuid kSoftwareRevision  = Uuid::fromShort(0x2A28);

// One Identity string and the characteristic it is read from
struct IdentityField {
    Uuid uuid;
    const char* name;
    std::string Identity::* member;
    bool strip_nul;     // Device pads the value with trailing NUL bytes
};

// Table order is the order missing fields are reported in
inline constexpr std::array<IdentityField, 6> kIdentityFields{{
    {kManufacturerName, "manufacturer_name", &Identity::manufacturer_name, true},
    {kModelNumber,      "model_number",      &Identity::model_number,      true},
    {kSerialNumber,     "serial_number",     &Identity::serial_number,     false},
    {kHardwareRevision, "hardware_revision", &Identity::hardware_revision, false},
    {kFirmwareRevision, "firmware_revision", &Identity::firmware_revision, false},
    {kSoftwareRevision, "software_revision", &Identity::software_revision, false},
}};

inline constexpr size_t kIdentityFieldCount = kIdentityFields.size();

// Index into kIdentityFields, or kIdentityFieldCount when not an identity UUID
constexpr size_t identityFieldIndex(const Uuid& uuid) noexcept {
    for (size_t i = 0; i < kIdentityFields.size(); ++i) {
        if (kIdentityFields[i].uuid == uuid) return i;
    }
    return kIdentityFieldCount;
}

// Logical field name for any UUID this client knows, nullptr otherwise
constexpr const char* fieldName(const Uuid& uuid) noexcept {
    if (uuid == kCurrentReadings) return "current_readings";
    if (uuid == kAdvertisedService) return "advertised_service";
    const size_t index = identityFieldIndex(uuid);
    return index < kIdentityFieldCount ? kIdentityFields[index].name : nullptr;
}

static_assert(identityFieldIndex(kCurrentReadings) == kIdentityFieldCount,
              "current readings must not alias an identity field");

} // namespace aranet_registry

#endif // ARANET_REGISTRY_HPP_
