/**
 * ARANET Decoder - current readings payload (F0CD3001-...)
 *
 * Payload layout (little-endian, 13 bytes):
 *   [0-1]   CO2 concentration, ppm
 *   [2-3]   Temperature, 1/20 °C
 *   [4-5]   Pressure, 1/10 hPa
 *   [6]     Relative humidity, %
 *   [7]     Battery, %
 *   [8]     Status (1=GREEN, 2=AMBER, 3=RED)
 *   [9-10]  Measurement interval, s
 *   [11-12] Seconds since the last on-device update
 *
 * This is the only place raw units are converted.
 */

#ifndef ARANET_DECODER_HPP_
#define ARANET_DECODER_HPP_

#include <cstddef>
#include <cstdint>
#include <span>

#include "core.hpp"

namespace aranet_decoder {

using aranet_core::DecodeError;
using aranet_core::Measurement;
using aranet_core::Result;

inline constexpr size_t kPayloadSize = 13;

namespace detail {

// Sequential little-endian reader; bounds are checked once by the caller
class Cursor {
    std::span<const uint8_t> data_;
    size_t pos_ = 0;

public:
    explicit constexpr Cursor(const std::span<const uint8_t> data) : data_(data) {}

    constexpr uint8_t u8() { return data_[pos_++]; }

    constexpr uint16_t u16le() {
        const uint16_t lo = data_[pos_];
        const uint16_t hi = data_[pos_ + 1];
        pos_ += 2;
        return static_cast<uint16_t>(lo | (hi << 8));
    }
};

} // namespace detail

/**
 * @brief Decode one current-readings payload
 * @return Measurement, or DecodeError for a short buffer or unknown status byte.
 *         Bytes past kPayloadSize are ignored.
 */
inline Result<Measurement, DecodeError> decodeMeasurement(const std::span<const uint8_t> payload) {
    if (payload.size() < kPayloadSize) {
        return DecodeError::shortBuffer(kPayloadSize, payload.size());
    }

    detail::Cursor in(payload);

    Measurement m;
    m.co2 = in.u16le();
    m.temperature = static_cast<float>(in.u16le()) / 20.0f;
    m.pressure = static_cast<uint16_t>(in.u16le() / 10);
    m.humidity = in.u8();
    m.battery = in.u8();

    const uint8_t raw_status = in.u8();
    const auto status = aranet_core::statusFromWire(raw_status);
    if (!status) {
        return DecodeError::invalidStatus(raw_status);
    }
    m.status = *status;

    m.interval = std::chrono::seconds(in.u16le());
    m.since_last_update = std::chrono::seconds(in.u16le());
    return m;
}

} // namespace aranet_decoder

#endif // ARANET_DECODER_HPP_
