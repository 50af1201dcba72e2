/**
 * ARANET Core - Pure C++ value types shared by every layer
 *
 * Nothing in this header touches a BLE stack: UUIDs, the tagged Result type,
 * the error taxonomy and the measurement/identity records.
 */

#ifndef ARANET_CORE_HPP_
#define ARANET_CORE_HPP_

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace aranet_core {

// ---------------------- UUID ----------------------

namespace detail {

constexpr int hex_value(const char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Not constexpr: reaching it during constant evaluation is a compile error
inline void invalid_uuid_literal() {}

} // namespace detail

/**
 * @brief 128-bit GATT UUID, stored in canonical (text) byte order
 */
struct Uuid {
    std::array<uint8_t, 16> bytes{};

    // Bluetooth SIG base UUID: 00000000-0000-1000-8000-00805f9b34fb
    static constexpr std::array<uint8_t, 16> sig_base{
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x10, 0x00,
        0x80, 0x00, 0x00, 0x80, 0x5f, 0x9b, 0x34, 0xfb
    };

    // Parses "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx" (either case)
    static constexpr std::optional<Uuid> parse(std::string_view text) {
        if (text.size() != 36) return std::nullopt;

        Uuid uuid;
        size_t out = 0;
        for (size_t i = 0; i < text.size();) {
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                if (text[i] != '-') return std::nullopt;
                ++i;
                continue;
            }
            const int hi = detail::hex_value(text[i]);
            const int lo = detail::hex_value(text[i + 1]);
            if (hi < 0 || lo < 0) return std::nullopt;
            uuid.bytes[out++] = static_cast<uint8_t>((hi << 4) | lo);
            i += 2;
        }
        return uuid;
    }

    // Compile-time literal; a malformed string fails to compile
    template<size_t N>
    static consteval Uuid literal(const char (&text)[N]) {
        const auto parsed = parse(std::string_view(text, N - 1));
        if (!parsed) detail::invalid_uuid_literal();
        return *parsed;
    }

    // Expands a 16-bit SIG-assigned UUID (e.g. 0x2A29) onto the base UUID
    static constexpr Uuid fromShort(const uint16_t short_uuid) {
        Uuid uuid{sig_base};
        uuid.bytes[2] = static_cast<uint8_t>(short_uuid >> 8);
        uuid.bytes[3] = static_cast<uint8_t>(short_uuid & 0xFF);
        return uuid;
    }

    std::string toString() const {
        static constexpr char digits[] = "0123456789abcdef";
        std::string out;
        out.reserve(36);
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
            out.push_back(digits[bytes[i] >> 4]);
            out.push_back(digits[bytes[i] & 0x0F]);
        }
        return out;
    }

    constexpr bool operator==(const Uuid&) const = default;
};

// ---------------------- Result ----------------------

/**
 * @brief Tagged success-or-error value returned by every fallible operation
 *
 * Converts implicitly from either alternative so call sites can simply
 * `return value;` or `return SomeError::make(...);`.
 */
template<typename T, typename E>
class [[nodiscard]] Result {
    static_assert(!std::is_same_v<T, E>, "Result value and error types must differ");

    std::variant<T, E> storage_;

public:
    Result(T value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(E error) : storage_(std::in_place_index<1>, std::move(error)) {}

    bool ok() const noexcept { return storage_.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    T& value() & { return std::get<0>(storage_); }
    const T& value() const & { return std::get<0>(storage_); }
    T&& value() && { return std::get<0>(std::move(storage_)); }

    const E& error() const & { return std::get<1>(storage_); }
    E&& error() && { return std::get<1>(std::move(storage_)); }
};

template<typename E>
class [[nodiscard]] Result<void, E> {
    std::optional<E> error_;

public:
    Result() = default;
    Result(E error) : error_(std::move(error)) {}

    bool ok() const noexcept { return !error_.has_value(); }
    explicit operator bool() const noexcept { return ok(); }

    const E& error() const & { return *error_; }
    E&& error() && { return std::move(*error_); }
};

// ---------------------- Errors ----------------------

// Failure reported by the platform BLE stack; code is stack-specific
struct TransportError {
    int code = 0;
    std::string message;

    std::string describe() const {
        return message + " (code " + std::to_string(code) + ")";
    }
};

// Malformed current-readings payload
struct DecodeError {
    enum class Kind : uint8_t {
        kShortBuffer,
        kInvalidStatus,
    };

    Kind kind;
    size_t expected = 0;   // kShortBuffer: required byte count
    size_t actual = 0;     // kShortBuffer: received byte count
    uint8_t raw = 0;       // kInvalidStatus: offending wire value

    static DecodeError shortBuffer(const size_t expected, const size_t actual) {
        return {Kind::kShortBuffer, expected, actual, 0};
    }

    static DecodeError invalidStatus(const uint8_t raw) {
        return {Kind::kInvalidStatus, 0, 0, raw};
    }

    std::string describe() const {
        switch (kind) {
            case Kind::kShortBuffer:
                return "payload too short: expected " + std::to_string(expected) +
                       " bytes, got " + std::to_string(actual);
            case Kind::kInvalidStatus:
                return "invalid status value " + std::to_string(raw);
        }
        return "decode error";
    }
};

/**
 * @brief Errors of the discovery/connect sequence
 *
 * All kinds are fatal to the connect attempt; the caller restarts discovery.
 */
struct ConnectionError {
    enum class Kind : uint8_t {
        kAdapterUnavailable,
        kSearchTimeout,
        kCharacteristicNotFound,
        kTransport,
    };

    Kind kind;
    std::string uuid;                       // kCharacteristicNotFound
    std::optional<TransportError> cause;    // kTransport

    static ConnectionError adapterUnavailable() { return {Kind::kAdapterUnavailable, {}, std::nullopt}; }
    static ConnectionError searchTimeout() { return {Kind::kSearchTimeout, {}, std::nullopt}; }

    static ConnectionError characteristicNotFound(std::string uuid) {
        return {Kind::kCharacteristicNotFound, std::move(uuid), std::nullopt};
    }

    static ConnectionError transport(TransportError cause) {
        return {Kind::kTransport, {}, std::move(cause)};
    }

    std::string describe() const {
        switch (kind) {
            case Kind::kAdapterUnavailable:
                return "failed to find a Bluetooth adapter";
            case Kind::kSearchTimeout:
                return "failed to find an Aranet4 device before timeout";
            case Kind::kCharacteristicNotFound:
                return "the characteristic " + uuid + " was not found";
            case Kind::kTransport:
                return "transport: " + (cause ? cause->describe() : std::string("unknown"));
        }
        return "connection error";
    }
};

/**
 * @brief Errors of a single operation on a connected device
 *
 * The device handle stays usable after any of these.
 */
struct DeviceError {
    enum class Kind : uint8_t {
        kMissingAttribute,
        kInvalidAttribute,
        kIO,
        kTransport,
    };

    Kind kind;
    std::string field;                      // kMissingAttribute, kInvalidAttribute
    std::optional<DecodeError> decode;      // kIO
    std::optional<TransportError> cause;    // kTransport

    static DeviceError missingAttribute(std::string field) {
        return {Kind::kMissingAttribute, std::move(field), std::nullopt, std::nullopt};
    }

    static DeviceError invalidAttribute(std::string field) {
        return {Kind::kInvalidAttribute, std::move(field), std::nullopt, std::nullopt};
    }

    static DeviceError io(DecodeError decode) {
        return {Kind::kIO, {}, decode, std::nullopt};
    }

    static DeviceError transport(TransportError cause) {
        return {Kind::kTransport, {}, std::nullopt, std::move(cause)};
    }

    std::string describe() const {
        switch (kind) {
            case Kind::kMissingAttribute:
                return "missing attribute " + field;
            case Kind::kInvalidAttribute:
                return "attribute " + field + " is not valid UTF-8";
            case Kind::kIO:
                return "io: " + (decode ? decode->describe() : std::string("unknown"));
            case Kind::kTransport:
                return "transport: " + (cause ? cause->describe() : std::string("unknown"));
        }
        return "device error";
    }
};

// ---------------------- Records ----------------------

// CO2 concentration status, as displayed by the device
enum class Status : uint8_t {
    kGreen = 1,
    kAmber = 2,
    kRed = 3,
};

constexpr std::optional<Status> statusFromWire(const uint8_t raw) noexcept {
    switch (raw) {
        case 1: return Status::kGreen;
        case 2: return Status::kAmber;
        case 3: return Status::kRed;
        default: return std::nullopt;
    }
}

constexpr const char* toString(const Status status) noexcept {
    switch (status) {
        case Status::kGreen: return "GREEN";
        case Status::kAmber: return "AMBER";
        case Status::kRed: return "RED";
    }
    return "UNKNOWN";
}

// One snapshot of the current-readings characteristic
struct Measurement {
    uint16_t co2 = 0;                       // ppm
    Status status = Status::kGreen;
    uint8_t battery = 0;                    // %
    uint8_t humidity = 0;                   // % relative humidity
    uint16_t pressure = 0;                  // hPa
    float temperature = 0.0f;               // °C
    std::chrono::seconds interval{0};
    std::chrono::seconds since_last_update{0};
};

// Device Information Service strings
struct Identity {
    std::string manufacturer_name;
    std::string model_number;
    std::string serial_number;
    std::string hardware_revision;
    std::string firmware_revision;
    std::string software_revision;
};

} // namespace aranet_core

#endif // ARANET_CORE_HPP_
