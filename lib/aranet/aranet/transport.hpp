/**
 * ARANET Transport - platform BLE capability required by the client
 *
 * The client never talks to a BLE stack directly. A binding (see nimble.hpp)
 * implements these interfaces; tests implement them in memory.
 *
 * Threading Model:
 *   Adapter::peripherals() is called from the discovery search thread while
 *   the caller's thread waits on the timeout. Every other call happens on
 *   the caller's thread, one at a time.
 */

#ifndef ARANET_TRANSPORT_HPP_
#define ARANET_TRANSPORT_HPP_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core.hpp"

namespace aranet_transport {

using aranet_core::Result;
using aranet_core::TransportError;
using aranet_core::Uuid;

using Bytes = std::vector<uint8_t>;

// A resolved GATT characteristic of a connected peripheral
class Characteristic {
public:
    virtual ~Characteristic() = default;

    virtual Uuid uuid() const = 0;
    virtual Result<Bytes, TransportError> read() = 0;
};

// A peripheral surfaced by a scan
class Peripheral {
public:
    virtual ~Peripheral() = default;

    // Advertised local name, if the peripheral advertised one
    virtual std::optional<std::string> localName() const = 0;

    // connect() is a no-op on an already connected peripheral and resolves
    // the characteristic list on first success
    virtual Result<void, TransportError> connect() = 0;
    virtual Result<void, TransportError> disconnect() = 0;
    virtual Result<bool, TransportError> isConnected() const = 0;

    virtual std::vector<std::shared_ptr<Characteristic>> characteristics() const = 0;
};

class Adapter {
public:
    virtual ~Adapter() = default;

    // Service filter is advisory; non-matching peripherals may still surface
    virtual Result<void, TransportError> startScan(const Uuid& service) = 0;

    // Ends the scan started by startScan(); a no-op when none is running
    virtual Result<void, TransportError> stopScan() = 0;

    // Peripherals seen so far by the running scan
    virtual Result<std::vector<std::shared_ptr<Peripheral>>, TransportError> peripherals() = 0;
};

class Platform {
public:
    virtual ~Platform() = default;

    virtual Result<std::vector<std::shared_ptr<Adapter>>, TransportError> adapters() = 0;
};

} // namespace aranet_transport

#endif // ARANET_TRANSPORT_HPP_
