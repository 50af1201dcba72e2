/**
 * ARANET - Aranet4 CO2 monitor client over BLE
 *
 * Finds an Aranet4 among nearby peripherals, connects to it and decodes its
 * GATT characteristics into typed records.
 *
 * Features:
 *   - Discovery with a bounded search
 *       Scans with the Aranet4 service as filter, polls the peripherals seen
 *       so far for the advertised name prefix, and gives up after a timeout.
 *
 *   - Self-healing measurement reads
 *       Every read re-checks connectivity and reconnects a dropped link.
 *
 *   - Strict decoding
 *       Short payloads, unknown status bytes, non-UTF-8 strings and missing
 *       identity fields are errors, never defaults.
 *
 *   - Stack independent
 *       Talks to BLE only through aranet_transport interfaces. A NimBLE
 *       binding ships in aranet/nimble.hpp.
 *
 * Usage:
 *   aranet_nimble::Platform platform("aranet-reader");
 *   auto device = aranetDefault::connect(platform);
 *   if (!device) { ... device.error().describe() ... }
 *   auto reading = device.value().readMeasurement();
 *
 * Configuration:
 *   Type-level: aranet<DiscoveryConfig<TimeoutMs, PollIntervalMs, NamePrefix>>
 *   Build flags (defaults for DiscoveryConfig<>):
 *     -DARANET_SEARCH_TIMEOUT_MS=10000
 *     -DARANET_POLL_INTERVAL_MS=1000
 *     -DARANET_NAME_PREFIX="\"Aranet4\""
 */

#ifndef ARANET_HPP_
#define ARANET_HPP_

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>

#include "aranet/log.hpp"
#include "aranet/platform.hpp"
#include "aranet/core.hpp"
#include "aranet/registry.hpp"
#include "aranet/decoder.hpp"
#include "aranet/transport.hpp"
#include "aranet/device.hpp"

#ifndef ARANET_SEARCH_TIMEOUT_MS
    #define ARANET_SEARCH_TIMEOUT_MS 10000
#endif

#ifndef ARANET_POLL_INTERVAL_MS
    #define ARANET_POLL_INTERVAL_MS 1000
#endif

#ifndef ARANET_NAME_PREFIX
    #define ARANET_NAME_PREFIX "Aranet4"
#endif

// ---------------------- Discovery Configuration ----------------------

inline constexpr char kDefaultNamePrefix[] = ARANET_NAME_PREFIX;

template<
    uint32_t TimeoutMs = ARANET_SEARCH_TIMEOUT_MS,
    uint32_t PollIntervalMs = ARANET_POLL_INTERVAL_MS,
    const char* NamePrefix = kDefaultNamePrefix
>
struct DiscoveryConfig {
    static_assert(TimeoutMs > 0, "Search timeout must be positive");
    static_assert(PollIntervalMs > 0, "Poll interval must be positive");

    using is_aranet_discovery_config_tag = void;

    static constexpr std::chrono::milliseconds timeout{TimeoutMs};
    static constexpr std::chrono::milliseconds poll_interval{PollIntervalMs};
    static constexpr const char* name_prefix = NamePrefix;
};

template<typename T>
concept DiscoveryConfigType = requires { typename T::is_aranet_discovery_config_tag; };

// ---------------------- ARANET Template Class ----------------------

template<DiscoveryConfigType Config = DiscoveryConfig<>>
struct aranet {
    // Re-export core types
    using Uuid = aranet_core::Uuid;
    using Status = aranet_core::Status;
    using Measurement = aranet_core::Measurement;
    using Identity = aranet_core::Identity;
    using ConnectionError = aranet_core::ConnectionError;
    using DeviceError = aranet_core::DeviceError;
    using TransportError = aranet_core::TransportError;
    template<typename T, typename E>
    using Result = aranet_core::Result<T, E>;

    using Device = aranet_device::Device;
    using config = Config;

    /**
     * @brief True if the peripheral advertises a name starting with the prefix
     *
     * Unnamed peripherals never match, whatever services they advertise.
     */
    static bool matchesName(const aranet_transport::Peripheral& peripheral) {
        const auto name = peripheral.localName();
        return name && name->starts_with(Config::name_prefix);
    }

    /**
     * @brief Find an Aranet4, connect to it and resolve its current readings
     *
     * Uses the first adapter the platform reports. The search polls the
     * adapter every Config::poll_interval and is abandoned after
     * Config::timeout. The scan is stopped once the search ends either way.
     */
    static Result<Device, ConnectionError> connect(aranet_transport::Platform& platform) {
        auto adapters = platform.adapters();
        if (!adapters) {
            ARANET_LOG_ERROR("[aranet] adapter enumeration failed: %s\n", adapters.error().describe().c_str());
            return ConnectionError::adapterUnavailable();
        }
        if (adapters.value().empty()) {
            ARANET_LOG_ERROR("[aranet] no Bluetooth adapter\n");
            return ConnectionError::adapterUnavailable();
        }
        std::shared_ptr<aranet_transport::Adapter> adapter = adapters.value().front();

        if (auto rc = adapter->startScan(aranet_registry::kAdvertisedService); !rc) {
            ARANET_LOG_ERROR("[aranet] scan start failed: %s\n", rc.error().describe().c_str());
            return ConnectionError::transport(std::move(rc).error());
        }

        ARANET_LOG_INFO("[aranet] scanning for \"%s\" (timeout %lld ms)\n",
                        Config::name_prefix, static_cast<long long>(Config::timeout.count()));

        auto found = aranet_sync::DeadlineRace<std::shared_ptr<aranet_transport::Peripheral>>::run(
            [adapter](const aranet_sync::CancelToken& token) { return findDevice(*adapter, token); },
            Config::timeout,
            "aranet_search");

        // The scan keeps reporting advertisers until stopped, match or not
        if (auto rc = adapter->stopScan(); !rc) {
            ARANET_LOG_WARN("[aranet] scan stop failed: %s\n", rc.error().describe().c_str());
        }

        if (!found) {
            ARANET_LOG_ERROR("[aranet] no device found within %lld ms\n",
                             static_cast<long long>(Config::timeout.count()));
            return ConnectionError::searchTimeout();
        }
        std::shared_ptr<aranet_transport::Peripheral> peripheral = std::move(*found);

        if (auto rc = peripheral->connect(); !rc) {
            ARANET_LOG_ERROR("[aranet] connect failed: %s\n", rc.error().describe().c_str());
            return ConnectionError::transport(std::move(rc).error());
        }

        const auto characteristics = peripheral->characteristics();
        const auto it = std::find_if(characteristics.begin(), characteristics.end(), [](const auto& c) {
            return c->uuid() == aranet_registry::kCurrentReadings;
        });
        if (it == characteristics.end()) {
            const std::string uuid = aranet_registry::kCurrentReadings.toString();
            ARANET_LOG_ERROR("[aranet] characteristic %s not found\n", uuid.c_str());
            return ConnectionError::characteristicNotFound(uuid);
        }

        Device device(std::move(peripheral), *it);
        ARANET_LOG_DONE("[aranet] connected to %s\n", device.name().c_str());
        return device;
    }

private:
    // Runs on the search thread until a match or cancellation
    static std::optional<std::shared_ptr<aranet_transport::Peripheral>> findDevice(
            aranet_transport::Adapter& adapter, const aranet_sync::CancelToken& token) {
        do {
            auto peripherals = adapter.peripherals();
            if (!peripherals) {
                ARANET_LOG_WARN("[aranet] peripheral query failed: %s\n", peripherals.error().describe().c_str());
                continue;
            }

            for (auto& peripheral : peripherals.value()) {
                if (token.cancelled()) return std::nullopt;
                if (matchesName(*peripheral)) {
                    return peripheral;
                }
            }
        } while (token.sleepFor(Config::poll_interval));

        return std::nullopt;
    }
};

// Convenience alias for the default discovery configuration
using aranetDefault = aranet<>;

#endif // ARANET_HPP_
