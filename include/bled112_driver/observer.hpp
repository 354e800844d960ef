#ifndef BLED112_DRIVER_OBSERVER_HPP
#define BLED112_DRIVER_OBSERVER_HPP

#include "types.hpp"
#include <cstdint>
#include <iostream>

namespace bgapi {

/**
 * @brief Receiver of decoded BGAPI events
 *
 * One instance is bound to a driver at construction. Every method has an
 * empty default body, so an implementation overrides only the events it
 * cares about.
 *
 * All callbacks run on the driver's reader thread, in stream order. A
 * callback that blocks stalls frame processing, including command replies.
 */
class Observer {
public:
    virtual ~Observer() = default;

    //=========================================================================
    // System (class 0)
    //=========================================================================

    /** @brief Module booted (also sent after system_reset) */
    virtual void onSystemBoot(const SystemInfo& /*info*/) {}
    virtual void onSystemDebug(const Bytes& /*data*/) {}
    /** @brief Endpoint receive buffer reached its watermark */
    virtual void onSystemEndpointWatermarkRx(uint8_t /*endpoint*/, uint8_t /*data*/) {}
    /** @brief Endpoint transmit buffer reached its watermark */
    virtual void onSystemEndpointWatermarkTx(uint8_t /*endpoint*/, uint8_t /*data*/) {}
    virtual void onSystemScriptFailure(uint16_t /*address*/, uint16_t /*reason*/) {}
    virtual void onSystemNoLicenseKey() {}

    //=========================================================================
    // Persistent store (class 1)
    //=========================================================================
    virtual void onFlashPsKey(uint16_t /*key*/, const Bytes& /*value*/) {}

    //=========================================================================
    // Local GATT attributes (class 2)
    //=========================================================================
    virtual void onAttributeValue(uint8_t /*connection*/, uint8_t /*reason*/, uint16_t /*handle*/,
                                  uint16_t /*offset*/, const Bytes& /*value*/) {}
    virtual void onAttributeUserReadRequest(uint8_t /*connection*/, uint16_t /*handle*/,
                                            uint16_t /*offset*/, uint8_t /*max_size*/) {}
    virtual void onAttributeStatus(uint16_t /*handle*/, uint8_t /*flags*/) {}

    //=========================================================================
    // Connection (class 3)
    //=========================================================================
    virtual void onConnectionStatus(const ConnectionStatus& /*status*/) {}
    virtual void onConnectionVersionIndication(const ConnectionVersionIndication& /*indication*/) {}
    virtual void onConnectionFeatureIndication(uint8_t /*connection*/, const Bytes& /*features*/) {}
    virtual void onConnectionRawRx(uint8_t /*connection*/, const Bytes& /*data*/) {}
    virtual void onConnectionDisconnected(uint8_t /*connection*/, uint16_t /*reason*/) {}

    //=========================================================================
    // Attribute client (class 4)
    //=========================================================================
    virtual void onAttclientIndicated(uint8_t /*connection*/, uint16_t /*attr_handle*/) {}
    virtual void onAttclientProcedureCompleted(uint8_t /*connection*/, uint16_t /*result*/,
                                               uint16_t /*chr_handle*/) {}
    /** @brief Service found by read_by_group_type */
    virtual void onAttclientGroupFound(uint8_t /*connection*/, uint16_t /*start*/, uint16_t /*end*/,
                                       const Bytes& /*uuid*/) {}
    virtual void onAttclientAttributeFound(uint8_t /*connection*/, uint16_t /*chrdecl*/,
                                           uint16_t /*value*/, uint8_t /*properties*/,
                                           const Bytes& /*uuid*/) {}
    virtual void onAttclientFindInformationFound(uint8_t /*connection*/, uint16_t /*chr_handle*/,
                                                 const Bytes& /*uuid*/) {}
    virtual void onAttclientAttributeValue(uint8_t /*connection*/, uint16_t /*att_handle*/,
                                           uint8_t /*type*/, const Bytes& /*value*/) {}
    virtual void onAttclientReadMultipleResponse(uint8_t /*connection*/, const Bytes& /*handles*/) {}

    //=========================================================================
    // Security manager (class 5)
    //=========================================================================
    virtual void onSmSmpData(uint8_t /*handle*/, uint8_t /*packet*/, const Bytes& /*data*/) {}
    virtual void onSmBondingFail(uint8_t /*handle*/, uint16_t /*result*/) {}
    virtual void onSmPasskeyDisplay(uint8_t /*handle*/, uint32_t /*passkey*/) {}
    virtual void onSmPasskeyRequest(uint8_t /*handle*/) {}
    virtual void onSmBondStatus(const SmBondStatus& /*status*/) {}

    //=========================================================================
    // GAP (class 6)
    //=========================================================================
    virtual void onGapScanResponse(const GapScanResponse& /*response*/) {}
    virtual void onGapModeChanged(uint8_t /*discover*/, uint8_t /*connect*/) {}

    //=========================================================================
    // Hardware (class 7)
    //=========================================================================
    virtual void onHardwareIoPortStatus(const IoPortStatus& /*status*/) {}
    virtual void onHardwareSoftTimer(uint8_t /*handle*/) {}
    virtual void onHardwareAdcResult(uint8_t /*input*/, int16_t /*value*/) {}
};

/**
 * @brief Observer that prints one line per event
 */
class LoggingObserver : public Observer {
public:
    explicit LoggingObserver(std::ostream& out = std::cout);

    void onSystemBoot(const SystemInfo& info) override;
    void onSystemDebug(const Bytes& data) override;
    void onSystemEndpointWatermarkRx(uint8_t endpoint, uint8_t data) override;
    void onSystemEndpointWatermarkTx(uint8_t endpoint, uint8_t data) override;
    void onSystemScriptFailure(uint16_t address, uint16_t reason) override;
    void onSystemNoLicenseKey() override;
    void onFlashPsKey(uint16_t key, const Bytes& value) override;
    void onAttributeValue(uint8_t connection, uint8_t reason, uint16_t handle,
                          uint16_t offset, const Bytes& value) override;
    void onAttributeUserReadRequest(uint8_t connection, uint16_t handle,
                                    uint16_t offset, uint8_t max_size) override;
    void onAttributeStatus(uint16_t handle, uint8_t flags) override;
    void onConnectionStatus(const ConnectionStatus& status) override;
    void onConnectionVersionIndication(const ConnectionVersionIndication& indication) override;
    void onConnectionFeatureIndication(uint8_t connection, const Bytes& features) override;
    void onConnectionRawRx(uint8_t connection, const Bytes& data) override;
    void onConnectionDisconnected(uint8_t connection, uint16_t reason) override;
    void onAttclientIndicated(uint8_t connection, uint16_t attr_handle) override;
    void onAttclientProcedureCompleted(uint8_t connection, uint16_t result,
                                       uint16_t chr_handle) override;
    void onAttclientGroupFound(uint8_t connection, uint16_t start, uint16_t end,
                               const Bytes& uuid) override;
    void onAttclientAttributeFound(uint8_t connection, uint16_t chrdecl, uint16_t value,
                                   uint8_t properties, const Bytes& uuid) override;
    void onAttclientFindInformationFound(uint8_t connection, uint16_t chr_handle,
                                         const Bytes& uuid) override;
    void onAttclientAttributeValue(uint8_t connection, uint16_t att_handle, uint8_t type,
                                   const Bytes& value) override;
    void onAttclientReadMultipleResponse(uint8_t connection, const Bytes& handles) override;
    void onSmSmpData(uint8_t handle, uint8_t packet, const Bytes& data) override;
    void onSmBondingFail(uint8_t handle, uint16_t result) override;
    void onSmPasskeyDisplay(uint8_t handle, uint32_t passkey) override;
    void onSmPasskeyRequest(uint8_t handle) override;
    void onSmBondStatus(const SmBondStatus& status) override;
    void onGapScanResponse(const GapScanResponse& response) override;
    void onGapModeChanged(uint8_t discover, uint8_t connect) override;
    void onHardwareIoPortStatus(const IoPortStatus& status) override;
    void onHardwareSoftTimer(uint8_t handle) override;
    void onHardwareAdcResult(uint8_t input, int16_t value) override;

private:
    std::ostream& out_;
};

} // namespace bgapi

#endif // BLED112_DRIVER_OBSERVER_HPP
