#pragma once

/**
 * @file radio_receiver.hpp
 * @brief Receiving endpoint of an nrf_link: accepts pairings from any number
 *        of transmitters, tracks them and delivers their data.
 *
 * @details
 * Receive path:
 * @verbatim
 *  IRadioDriver::receive()  (listen task, receiveData() or receiveFrame())
 *          │  decodeFrame()
 *          ▼
 *     processFrame()  ──► DeviceRegistry (pair / touch)
 *          │           ──► sendAck()            (Pairing, Data)
 *          ▼
 *     registered FrameCallback (copy of the frame, no lock held)
 * @endverbatim
 *
 * Locking: the registry and the callback table each have their own mutex.
 * Neither is held while the radio is used or a callback runs, and they are
 * never taken together, so a callback may call back into the receiver.
 *
 * Frames the receiver acts on:
 *  - Pairing   payload { pairingKey(4, LE) | targetId(4, LE) }; only frames
 *              whose targetId equals this receiver are accepted and acked.
 *  - Heartbeat refreshes a paired sender.
 *  - Data      non-empty payload from a paired sender; refreshed and acked.
 * Ack frames and unknown types are ignored.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <vector>

#include "esp_err.h"

#include "device.hpp"
#include "device_registry.hpp"
#include "frame_codec.hpp"
#include "link_mutex.hpp"
#include "link_task.hpp"
#include "nrf_link_config.hpp"
#include "radio_driver.hpp"

class RadioReceiver {
public:
    using FrameCallback = std::function<void(const Frame& frame)>;

    /// @param id      This endpoint's identity.
    /// @param driver  Radio driver; ownership is taken.
    /// @param cfg     Addressing, timing and task configuration.
    RadioReceiver(DeviceId id,
                  std::unique_ptr<IRadioDriver> driver,
                  const LinkConfig& cfg = LinkConfig{});

    /// RAII destructor: stops the listen and cleanup tasks and waits for them.
    ~RadioReceiver();

    RadioReceiver(const RadioReceiver&)            = delete;
    RadioReceiver& operator=(const RadioReceiver&) = delete;

    // -----------------------------------------------------------------------
    // Lifecycle
    // -----------------------------------------------------------------------

    /// @return ESP_OK | ESP_ERR_INVALID_ARG | driver error
    esp_err_t init();

    /// @return ESP_OK | ESP_ERR_INVALID_ARG (channel > NRF_MAX_CHANNEL) | driver error
    esp_err_t setChannel(uint8_t channel);

    // -----------------------------------------------------------------------
    // Frame handling
    // -----------------------------------------------------------------------

    /// Install the callback for @p type, replacing any previous one.  An empty
    /// function removes it.
    void registerCallback(FrameType type, FrameCallback cb);

    /// Apply one decoded frame.  Safe to call from any task.
    void processFrame(const Frame& frame);

    /// Ack @p seq to @p to.  Payload is this receiver's identity (LE).
    /// @return ESP_OK | driver error
    esp_err_t sendAck(DeviceId to, uint32_t seq);

    /// One receive attempt.
    /// @return true if a valid frame was decoded into @p out.
    bool receiveFrame(uint32_t timeoutMs, Frame& out);

    // -----------------------------------------------------------------------
    // Listening
    // -----------------------------------------------------------------------

    /// Start the background receive loop.  Idempotent.
    /// @return ESP_OK | ESP_ERR_NO_MEM
    esp_err_t listen();

    /// Ask the receive loop to exit after its current receive.  Non-blocking.
    void stopListening();

    bool isListening() const;

    /// Listen (if not already) until a Pairing frame addressed to this
    /// receiver has been accepted, then restore the previous listening state.
    /// @return ESP_OK | ESP_ERR_TIMEOUT | ESP_ERR_NO_MEM
    esp_err_t startPairing();

    /// Poll the radio until a Data frame from a paired sender arrives.
    /// Every frame received meanwhile goes through processFrame().
    /// @param out  Receives a copy of the payload.
    /// @return ESP_OK | ESP_ERR_INVALID_STATE (nothing paired) | ESP_ERR_TIMEOUT
    esp_err_t receiveData(std::vector<uint8_t>& out);

    // -----------------------------------------------------------------------
    // Liveness
    // -----------------------------------------------------------------------

    /// Evict stale devices every deviceTimeoutMs / 2.  Idempotent.
    /// @return ESP_OK | ESP_ERR_NO_MEM
    esp_err_t startCleanupTask();

    /// Same task as startCleanupTask().
    esp_err_t startHeartbeatTask() { return startCleanupTask(); }

    void stopCleanupTask();

    /// One eviction pass.
    /// @return Number of devices removed.
    size_t cleanupDeadDevices();

    // -----------------------------------------------------------------------
    // State queries
    // -----------------------------------------------------------------------

    bool                  isPaired(DeviceId id) const { return _registry.isPaired(id); }
    std::vector<DeviceId> getPairedDeviceIds() const  { return _registry.listIdentities(); }
    std::vector<Device>   getPairedDevices() const    { return _registry.snapshot(); }

    /// Some paired identity, 0 when nothing is paired.
    DeviceId              getPairedDeviceId() const   { return _registry.firstIdentity(); }

    /// true if any paired device was heard from within deviceTimeoutMs.
    bool                  isPairedDeviceConnected() const;

    DeviceId              id() const                  { return _self.id; }
    uint8_t               channel() const             { return _self.channel; }
    const DeviceRegistry& registry() const            { return _registry; }
    DeviceRegistry&       registry()                  { return _registry; }

private:
    void handlePairing(const Frame& frame);
    bool handleHeartbeat(const Frame& frame);
    bool handleData(const Frame& frame);

    /// Copy the callback for @p type under the table lock, run it unlocked.
    void dispatch(FrameType type, const Frame& frame);

    LinkConfig                    _cfg;
    std::unique_ptr<IRadioDriver> _driver;
    Device                        _self;
    DeviceRegistry                _registry;

    mutable LinkMutex                  _callbackMutex;
    std::map<FrameType, FrameCallback> _callbacks;

    // Incremented for every accepted Pairing frame; startPairing() waits on it.
    std::atomic<uint32_t>         _pairingEvents{0};

    LinkTask                      _listenTask;
    LinkTask                      _cleanupTask;
};
