/**
 * ARANET NimBLE Integration - aranet_transport over the NimBLE-Arduino central role
 *
 * Include <NimBLEDevice.h> before this header.
 *
 * Mapping:
 *   - Platform:       NimBLEDevice::init() on first use, exposes one adapter
 *   - Adapter:        continuous NimBLEScan; results are collected from
 *                     onResult() into an address-keyed table that every
 *                     startScan() empties
 *   - Peripheral:     one NimBLEClient per peer, created on first connect
 *   - Characteristic: NimBLERemoteCharacteristic::readValue()
 *
 * Threading Model:
 *   onResult() runs on the NimBLE host task while the discovery thread polls
 *   peripherals(); the table and each advertised name are mutex-guarded.
 */

#ifndef ARANET_NIMBLE_HPP_
#define ARANET_NIMBLE_HPP_

#include <ctime>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core.hpp"
#include "log.hpp"
#include "transport.hpp"

// Detect if NimBLE is available
#ifdef NIMBLE_CPP_DEVICE_H_
    #define ARANET_NIMBLE_AVAILABLE
#else
    #error "aranet/nimble.hpp: include <NimBLEDevice.h> before this header"
#endif

namespace aranet_nimble {

using aranet_core::Result;
using aranet_core::TransportError;
using aranet_core::Uuid;
using aranet_transport::Bytes;

// Error code used when NimBLE fails without reporting one
inline constexpr int kUnknownError = -1;

inline TransportError makeError(const int rc) {
    if (rc == 0) {
        return {kUnknownError, "unknown NimBLE failure"};
    }
    return {rc, NimBLEUtils::returnCodeToString(rc)};
}

// NimBLE UUIDs may be 16/32/128-bit; ours are always 128-bit
inline Uuid toUuid(const NimBLEUUID& uuid) {
    NimBLEUUID full(uuid);
    full.to128();
    return Uuid::parse(full.toString()).value_or(Uuid{});
}

inline NimBLEUUID toNimble(const Uuid& uuid) {
    return NimBLEUUID(uuid.toString());
}

// ---------------------- Characteristic ----------------------

class Characteristic final : public aranet_transport::Characteristic {
    static constexpr time_t kNoTimestamp = static_cast<time_t>(-1);

    NimBLEClient* client_;
    NimBLERemoteCharacteristic* chr_;

public:
    Characteristic(NimBLEClient* client, NimBLERemoteCharacteristic* chr) : client_(client), chr_(chr) {}

    Uuid uuid() const override { return toUuid(chr_->getUUID()); }

    Result<Bytes, TransportError> read() override {
        if (!client_->isConnected()) {
            return TransportError{BLE_HS_ENOTCONN, "not connected"};
        }

        // readValue() writes the timestamp only when this read succeeded;
        // getLastError() may still hold the status of an earlier operation
        time_t stamp = kNoTimestamp;
        const NimBLEAttValue value = chr_->readValue(&stamp);
        if (stamp == kNoTimestamp) {
            const int rc = client_->getLastError();
            ARANET_LOG_ERROR("[nimble] read of %s failed: %d\n", chr_->getUUID().toString().c_str(), rc);
            return makeError(rc);
        }
        return Bytes(value.data(), value.data() + value.size());
    }
};

// ---------------------- Peripheral ----------------------

class Peripheral final : public aranet_transport::Peripheral {
    NimBLEAddress address_;
    mutable std::mutex name_mutex_;
    std::optional<std::string> name_;

    NimBLEClient* client_ = nullptr;
    std::vector<std::shared_ptr<aranet_transport::Characteristic>> characteristics_;

    void resolveCharacteristics() {
        characteristics_.clear();
        for (NimBLERemoteService* svc : client_->getServices(true)) {
            for (NimBLERemoteCharacteristic* chr : svc->getCharacteristics(true)) {
                characteristics_.push_back(std::make_shared<Characteristic>(client_, chr));
            }
        }
        ARANET_LOG_DEBUG("[nimble] %s: %u characteristics resolved\n",
                         address_.toString().c_str(), static_cast<unsigned>(characteristics_.size()));
    }

public:
    explicit Peripheral(const NimBLEAddress& address) : address_(address) {}

    ~Peripheral() override {
        if (client_) {
            NimBLEDevice::deleteClient(client_);
        }
    }

    Peripheral(const Peripheral&) = delete;
    Peripheral& operator=(const Peripheral&) = delete;

    // Called from the scan callback; a later scan response may carry the name
    void updateName(const NimBLEAdvertisedDevice& advertised) {
        if (!advertised.haveName()) return;
        std::lock_guard<std::mutex> lock(name_mutex_);
        name_ = advertised.getName();
    }

    std::optional<std::string> localName() const override {
        std::lock_guard<std::mutex> lock(name_mutex_);
        return name_;
    }

    Result<void, TransportError> connect() override {
        if (client_ && client_->isConnected()) {
            return {};
        }

        // Stop scanning before connecting - the controller cannot do both reliably
        NimBLEScan* scan = NimBLEDevice::getScan();
        if (scan->isScanning()) {
            scan->stop();
        }

        if (!client_) {
            client_ = NimBLEDevice::createClient(address_);
            if (!client_) {
                return TransportError{kUnknownError, "no free NimBLE client"};
            }
        }

        // Keep the attribute database across reconnects: resolved characteristics stay valid
        const bool first_connect = characteristics_.empty();
        if (!client_->connect(first_connect)) {
            return makeError(client_->getLastError());
        }

        if (first_connect) {
            resolveCharacteristics();
        }
        ARANET_LOG_INFO("[nimble] connected to %s\n", address_.toString().c_str());
        return {};
    }

    Result<void, TransportError> disconnect() override {
        if (!client_ || !client_->isConnected()) {
            return {};
        }
        if (!client_->disconnect()) {
            return makeError(client_->getLastError());
        }
        return {};
    }

    Result<bool, TransportError> isConnected() const override {
        return client_ != nullptr && client_->isConnected();
    }

    std::vector<std::shared_ptr<aranet_transport::Characteristic>> characteristics() const override {
        return characteristics_;
    }
};

// ---------------------- Adapter ----------------------

class Adapter final : public aranet_transport::Adapter, public NimBLEScanCallbacks {
    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Peripheral>> seen_;    // keyed by address, one scan's worth
    std::optional<NimBLEUUID> service_;

public:
    Result<void, TransportError> startScan(const Uuid& service) override {
        NimBLEScan* scan = NimBLEDevice::getScan();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            seen_.clear();
            service_ = toNimble(service);
        }

        scan->setScanCallbacks(this, false);
        scan->setActiveScan(true);  // Names usually arrive in the scan response
        scan->setMaxResults(0);     // Results live in seen_ only
        scan->clearResults();
        if (!scan->start(0, false)) {
            return TransportError{kUnknownError, "scan start failed"};
        }
        ARANET_LOG_DEBUG("[nimble] scanning, filter %s\n", service.toString().c_str());
        return {};
    }

    Result<void, TransportError> stopScan() override {
        NimBLEScan* scan = NimBLEDevice::getScan();
        if (scan->isScanning() && !scan->stop()) {
            return TransportError{kUnknownError, "scan stop failed"};
        }
        return {};
    }

    Result<std::vector<std::shared_ptr<aranet_transport::Peripheral>>, TransportError> peripherals() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::shared_ptr<aranet_transport::Peripheral>> out;
        out.reserve(seen_.size());
        for (const auto& [address, peripheral] : seen_) {
            out.push_back(peripheral);
        }
        return out;
    }

    void onResult(const NimBLEAdvertisedDevice* advertised) override {
        std::lock_guard<std::mutex> lock(mutex_);

        // NimBLE has no controller-side service filter; advertising the
        // service only affects the debug trace
        if (service_ && advertised->isAdvertisingService(*service_)) {
            ARANET_LOG_DEBUG("[nimble] %s advertises the Aranet4 service\n",
                             advertised->getAddress().toString().c_str());
        }

        const std::string key = advertised->getAddress().toString();
        auto& entry = seen_[key];
        if (!entry) {
            entry = std::make_shared<Peripheral>(advertised->getAddress());
        }
        entry->updateName(*advertised);
    }
};

// ---------------------- Platform ----------------------

class Platform final : public aranet_transport::Platform {
    std::string device_name_;
    std::shared_ptr<Adapter> adapter_;

public:
    explicit Platform(std::string device_name = "") : device_name_(std::move(device_name)) {}

    Result<std::vector<std::shared_ptr<aranet_transport::Adapter>>, TransportError> adapters() override {
        if (!NimBLEDevice::isInitialized() && !NimBLEDevice::init(device_name_)) {
            ARANET_LOG_ERROR("[nimble] NimBLEDevice::init failed\n");
            return TransportError{kUnknownError, "NimBLE init failed"};
        }
        if (!adapter_) {
            adapter_ = std::make_shared<Adapter>();
        }
        return std::vector<std::shared_ptr<aranet_transport::Adapter>>{adapter_};
    }
};

} // namespace aranet_nimble

#endif // ARANET_NIMBLE_HPP_
