/**
 * ARANET Device - handle to a connected Aranet4
 *
 * Created by aranet<>::connect(). Owns the peripheral and the current
 * readings characteristic resolved at connect time; that characteristic is
 * never resolved again, only the connection under it is re-established.
 *
 * Not thread-safe: callers serialize operations on one handle.
 */

#ifndef ARANET_DEVICE_HPP_
#define ARANET_DEVICE_HPP_

#include <array>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>

#include "core.hpp"
#include "decoder.hpp"
#include "log.hpp"
#include "registry.hpp"
#include "transport.hpp"

namespace aranet_device {

using aranet_core::DeviceError;
using aranet_core::Identity;
using aranet_core::Measurement;
using aranet_core::Result;
using aranet_transport::Bytes;
using aranet_transport::Characteristic;
using aranet_transport::Peripheral;

namespace detail {

// Well-formed sequences per RFC 3629: no overlongs, surrogates or code points above U+10FFFF
inline bool isValidUtf8(const std::span<const uint8_t> data) {
    for (size_t i = 0; i < data.size(); ++i) {
        const uint8_t lead = data[i];
        size_t n;
        uint8_t lo = 0x80;      // allowed range of the first continuation byte
        uint8_t hi = 0xBF;
        if (lead < 0x80) {
            continue;
        } else if (lead >= 0xC2 && lead <= 0xDF) {
            n = 1;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            n = 2;
            if (lead == 0xE0) lo = 0xA0;        // overlong 3-byte form
            if (lead == 0xED) hi = 0x9F;        // UTF-16 surrogates
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            n = 3;
            if (lead == 0xF0) lo = 0x90;        // overlong 4-byte form
            if (lead == 0xF4) hi = 0x8F;        // beyond U+10FFFF
        } else {
            return false;
        }

        if (++i == data.size() || data[i] < lo || data[i] > hi) {
            return false;
        }
        for (size_t j = 1; j < n; ++j) {
            if (++i == data.size() || (data[i] & 0xC0) != 0x80) {
                return false;
            }
        }
    }
    return true;
}

inline void stripTrailingNul(std::string& text) {
    while (!text.empty() && text.back() == '\0') {
        text.pop_back();
    }
}

} // namespace detail

class Device {
    std::shared_ptr<Peripheral> peripheral_;
    std::shared_ptr<Characteristic> current_readings_;

public:
    Device(std::shared_ptr<Peripheral> peripheral, std::shared_ptr<Characteristic> current_readings)
        : peripheral_(std::move(peripheral)), current_readings_(std::move(current_readings)) {}

    // Exclusively owned by the caller
    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;
    Device(Device&&) noexcept = default;
    Device& operator=(Device&&) noexcept = default;

    std::string name() const {
        return peripheral_->localName().value_or("<unnamed>");
    }

    Result<bool, DeviceError> isConnected() const {
        auto connected = peripheral_->isConnected();
        if (!connected) {
            ARANET_LOG_ERROR("[device] is-connected query failed: %s\n", connected.error().describe().c_str());
            return DeviceError::transport(std::move(connected).error());
        }
        return connected.value();
    }

    /**
     * @brief Read and decode the current readings
     *
     * Re-checks connectivity first and reconnects a dropped link before
     * reading. Decode failures surface as DeviceError::Kind::kIO.
     */
    Result<Measurement, DeviceError> readMeasurement() {
        auto connected = isConnected();
        if (!connected) return std::move(connected).error();

        if (!connected.value()) {
            ARANET_LOG_INFO("[device] %s not connected, reconnecting\n", name().c_str());
            if (auto reconnected = reconnect(); !reconnected) {
                return std::move(reconnected).error();
            }
        }

        auto payload = current_readings_->read();
        if (!payload) {
            ARANET_LOG_ERROR("[device] current readings read failed: %s\n", payload.error().describe().c_str());
            return DeviceError::transport(std::move(payload).error());
        }

        auto decoded = aranet_decoder::decodeMeasurement(payload.value());
        if (!decoded) {
            ARANET_LOG_ERROR("[device] %s\n", decoded.error().describe().c_str());
            return DeviceError::io(decoded.error());
        }

        const Measurement& m = decoded.value();
        ARANET_LOG_DEBUG("[device] CO2=%u ppm T=%.2f C RH=%u%% P=%u hPa batt=%u%% status=%s\n",
                         static_cast<unsigned>(m.co2), static_cast<double>(m.temperature),
                         static_cast<unsigned>(m.humidity), static_cast<unsigned>(m.pressure),
                         static_cast<unsigned>(m.battery), aranet_core::toString(m.status));
        return std::move(decoded).value();
    }

    /**
     * @brief Read the six Device Information Service strings
     *
     * Walks every characteristic of the peripheral, not only the one resolved
     * at connect time. Fails rather than returning a partial record.
     */
    Result<Identity, DeviceError> readIdentity() {
        using aranet_registry::kIdentityFieldCount;
        using aranet_registry::kIdentityFields;

        std::array<std::optional<std::string>, kIdentityFieldCount> values;

        for (const auto& characteristic : peripheral_->characteristics()) {
            const size_t index = aranet_registry::identityFieldIndex(characteristic->uuid());
            if (index == kIdentityFieldCount) continue;

            const auto& field = kIdentityFields[index];
            auto raw = characteristic->read();
            if (!raw) {
                ARANET_LOG_ERROR("[device] read of %s failed: %s\n", field.name, raw.error().describe().c_str());
                return DeviceError::transport(std::move(raw).error());
            }

            const Bytes& bytes = raw.value();
            if (!detail::isValidUtf8(bytes)) {
                ARANET_LOG_ERROR("[device] %s is not valid UTF-8\n", field.name);
                return DeviceError::invalidAttribute(field.name);
            }

            std::string text(bytes.begin(), bytes.end());
            if (field.strip_nul) {
                detail::stripTrailingNul(text);
            }
            values[index] = std::move(text);
        }

        Identity identity;
        for (size_t i = 0; i < kIdentityFieldCount; ++i) {
            if (!values[i]) {
                ARANET_LOG_ERROR("[device] missing attribute %s\n", kIdentityFields[i].name);
                return DeviceError::missingAttribute(kIdentityFields[i].name);
            }
            identity.*(kIdentityFields[i].member) = std::move(*values[i]);
        }
        return identity;
    }

    // No-op when already connected
    Result<void, DeviceError> reconnect() {
        if (auto rc = peripheral_->connect(); !rc) {
            ARANET_LOG_ERROR("[device] reconnect failed: %s\n", rc.error().describe().c_str());
            return DeviceError::transport(std::move(rc).error());
        }
        return {};
    }

    // The handle stays valid; a later read or reconnect() restores the link
    Result<void, DeviceError> disconnect() {
        if (auto rc = peripheral_->disconnect(); !rc) {
            ARANET_LOG_ERROR("[device] disconnect failed: %s\n", rc.error().describe().c_str());
            return DeviceError::transport(std::move(rc).error());
        }
        ARANET_LOG_INFO("[device] %s disconnected\n", name().c_str());
        return {};
    }
};

} // namespace aranet_device

#endif // ARANET_DEVICE_HPP_
