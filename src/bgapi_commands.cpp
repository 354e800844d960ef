#include "bled112_driver/bgapi_commands.hpp"
#include "bled112_driver/payload.hpp"

namespace bgapi {

BgapiCommands::BgapiCommands(BgapiDriver& driver)
    : driver_(driver)
{
}

template <typename Command>
boost::system::error_code BgapiCommands::sendForResult(EventClass cls, Command command,
                                                       const Bytes& payload, uint16_t& result) {
    return send(cls, command, payload, [&result](const Bytes& reply) {
        PayloadReader r(reply);
        result = r.u16();
    });
}

// ========== System ==========

boost::system::error_code BgapiCommands::systemReset(bool boot_in_dfu) {
    Bytes payload{static_cast<uint8_t>(boot_in_dfu ? 1 : 0)};
    boost::system::error_code ec = driver_.send(static_cast<uint8_t>(EventClass::SYSTEM),
                                                static_cast<uint8_t>(SystemCommand::RESET), payload,
                                                std::chrono::milliseconds(RESET_TIMEOUT_MS));
    // The module reboots instead of answering; the boot event follows
    if (ec == make_error_code(errc::timeout)) {
        return boost::system::error_code();
    }
    return ec;
}

boost::system::error_code BgapiCommands::systemHello() {
    return send(EventClass::SYSTEM, SystemCommand::HELLO, Bytes());
}

boost::system::error_code BgapiCommands::systemAddressGet(Mac& address) {
    return send(EventClass::SYSTEM, SystemCommand::ADDRESS_GET, Bytes(), [&](const Bytes& reply) {
        PayloadReader r(reply);
        address = r.mac();
    });
}

boost::system::error_code BgapiCommands::systemRegWrite(uint16_t address, uint8_t value, uint16_t& result) {
    PayloadWriter w;
    w.u16(address).u8(value);
    return sendForResult(EventClass::SYSTEM, SystemCommand::REG_WRITE, w.data(), result);
}

boost::system::error_code BgapiCommands::systemRegRead(uint16_t address, uint16_t& reply_address,
                                                       uint8_t& value) {
    PayloadWriter w;
    w.u16(address);
    return send(EventClass::SYSTEM, SystemCommand::REG_READ, w.data(), [&](const Bytes& reply) {
        PayloadReader r(reply);
        reply_address = r.u16();
        value = r.u8();
    });
}

boost::system::error_code BgapiCommands::systemGetCounters(SystemCounters& counters) {
    return send(EventClass::SYSTEM, SystemCommand::GET_COUNTERS, Bytes(), [&](const Bytes& reply) {
        PayloadReader r(reply);
        counters.tx_ok = r.u8();
        counters.tx_retry = r.u8();
        counters.rx_ok = r.u8();
        counters.rx_fail = r.u8();
        counters.mbuf = r.u8();
    });
}

boost::system::error_code BgapiCommands::systemGetConnections(uint8_t& max_connections) {
    return send(EventClass::SYSTEM, SystemCommand::GET_CONNECTIONS, Bytes(), [&](const Bytes& reply) {
        PayloadReader r(reply);
        max_connections = r.u8();
    });
}

boost::system::error_code BgapiCommands::systemReadMemory(uint32_t address, uint8_t length,
                                                          uint32_t& reply_address, Bytes& data) {
    PayloadWriter w;
    w.u32(address).u8(length);
    return send(EventClass::SYSTEM, SystemCommand::READ_MEMORY, w.data(), [&](const Bytes& reply) {
        PayloadReader r(reply);
        reply_address = r.u32();
        data = r.lengthPrefixed();
    });
}

boost::system::error_code BgapiCommands::systemGetInfo(SystemInfo& info) {
    return send(EventClass::SYSTEM, SystemCommand::GET_INFO, Bytes(), [&](const Bytes& reply) {
        PayloadReader r(reply);
        info.major = r.u16();
        info.minor = r.u16();
        info.patch = r.u16();
        info.build = r.u16();
        info.ll_version = r.u16();
        info.protocol_version = r.u8();
        info.hw = r.u8();
    });
}

boost::system::error_code BgapiCommands::systemEndpointTx(uint8_t endpoint, const Bytes& data,
                                                          uint16_t& result) {
    PayloadWriter w;
    w.u8(endpoint).lengthPrefixed(data);
    return sendForResult(EventClass::SYSTEM, SystemCommand::ENDPOINT_TX, w.data(), result);
}

boost::system::error_code BgapiCommands::systemWhitelistAppend(const QualifiedMac& address,
                                                               uint16_t& result) {
    PayloadWriter w;
    w.mac(address.address).u8(address.address_type);
    return sendForResult(EventClass::SYSTEM, SystemCommand::WHITELIST_APPEND, w.data(), result);
}

boost::system::error_code BgapiCommands::systemWhitelistRemove(const QualifiedMac& address,
                                                               uint16_t& result) {
    PayloadWriter w;
    w.mac(address.address).u8(address.address_type);
    return sendForResult(EventClass::SYSTEM, SystemCommand::WHITELIST_REMOVE, w.data(), result);
}

boost::system::error_code BgapiCommands::systemWhitelistClear() {
    return send(EventClass::SYSTEM, SystemCommand::WHITELIST_CLEAR, Bytes());
}

boost::system::error_code BgapiCommands::systemEndpointRx(uint8_t endpoint, uint8_t size,
                                                          uint16_t& result, Bytes& data) {
    Bytes payload{endpoint, size};
    return send(EventClass::SYSTEM, SystemCommand::ENDPOINT_RX, payload, [&](const Bytes& reply) {
        PayloadReader r(reply);
        result = r.u16();
        data = r.lengthPrefixed();
    });
}

boost::system::error_code BgapiCommands::systemEndpointSetWatermarks(uint8_t endpoint, uint8_t rx,
                                                                     uint8_t tx, uint16_t& result) {
    Bytes payload{endpoint, rx, tx};
    return sendForResult(EventClass::SYSTEM, SystemCommand::ENDPOINT_SET_WATERMARKS, payload, result);
}

// ========== Flash ==========

boost::system::error_code BgapiCommands::flashPsDefrag() {
    return send(EventClass::FLASH, FlashCommand::PS_DEFRAG, Bytes());
}

boost::system::error_code BgapiCommands::flashPsDump() {
    return send(EventClass::FLASH, FlashCommand::PS_DUMP, Bytes());
}

boost::system::error_code BgapiCommands::flashPsEraseAll() {
    return send(EventClass::FLASH, FlashCommand::PS_ERASE_ALL, Bytes());
}

boost::system::error_code BgapiCommands::flashPsSave(uint16_t key, const Bytes& value, uint16_t& result) {
    PayloadWriter w;
    w.u16(key).lengthPrefixed(value);
    return sendForResult(EventClass::FLASH, FlashCommand::PS_SAVE, w.data(), result);
}

boost::system::error_code BgapiCommands::flashPsLoad(uint16_t key, uint16_t& result, Bytes& value) {
    PayloadWriter w;
    w.u16(key);
    return send(EventClass::FLASH, FlashCommand::PS_LOAD, w.data(), [&](const Bytes& reply) {
        PayloadReader r(reply);
        result = r.u16();
        value = r.lengthPrefixed();
    });
}

boost::system::error_code BgapiCommands::flashPsErase(uint16_t key) {
    PayloadWriter w;
    w.u16(key);
    return send(EventClass::FLASH, FlashCommand::PS_ERASE, w.data());
}

boost::system::error_code BgapiCommands::flashErasePage(uint8_t page, uint16_t& result) {
    return sendForResult(EventClass::FLASH, FlashCommand::ERASE_PAGE, Bytes{page}, result);
}

boost::system::error_code BgapiCommands::flashWriteData(uint32_t address, const Bytes& data,
                                                        uint16_t& result) {
    PayloadWriter w;
    w.u32(address).lengthPrefixed(data);
    return sendForResult(EventClass::FLASH, FlashCommand::WRITE_DATA, w.data(), result);
}

// ========== Attributes ==========

boost::system::error_code BgapiCommands::attributesWrite(uint16_t handle, uint8_t offset,
                                                         const Bytes& value, uint16_t& result) {
    PayloadWriter w;
    w.u16(handle).u8(offset).lengthPrefixed(value);
    return sendForResult(EventClass::ATTRIBUTES, AttributesCommand::WRITE, w.data(), result);
}

boost::system::error_code BgapiCommands::attributesRead(uint16_t handle, uint16_t offset,
                                                        uint16_t& result, Bytes& value) {
    PayloadWriter w;
    w.u16(handle).u16(offset);
    return send(EventClass::ATTRIBUTES, AttributesCommand::READ, w.data(), [&](const Bytes& reply) {
        PayloadReader r(reply);
        r.u16();   // handle
        r.u16();   // offset
        result = r.u16();
        value = r.lengthPrefixed();
    });
}

boost::system::error_code BgapiCommands::attributesReadType(uint16_t handle, uint16_t& result, Bytes& type) {
    PayloadWriter w;
    w.u16(handle);
    return send(EventClass::ATTRIBUTES, AttributesCommand::READ_TYPE, w.data(), [&](const Bytes& reply) {
        PayloadReader r(reply);
        r.u16();   // handle
        result = r.u16();
        type = r.lengthPrefixed();
    });
}

boost::system::error_code BgapiCommands::attributesUserReadResponse(uint8_t connection, uint8_t att_error,
                                                                    const Bytes& value) {
    PayloadWriter w;
    w.u8(connection).u8(att_error).lengthPrefixed(value);
    return send(EventClass::ATTRIBUTES, AttributesCommand::USER_READ_RESPONSE, w.data());
}

boost::system::error_code BgapiCommands::attributesUserWriteResponse(uint8_t connection, uint8_t att_error) {
    return send(EventClass::ATTRIBUTES, AttributesCommand::USER_WRITE_RESPONSE, Bytes{connection, att_error});
}

// ========== Connection ==========

namespace {

// Connection and attclient responses lead with the connection handle
BgapiDriver::SuccessHandler connectionResult(uint16_t& result) {
    return [&result](const Bytes& reply) {
        PayloadReader r(reply);
        r.u8();
        result = r.u16();
    };
}

} // namespace

boost::system::error_code BgapiCommands::connectionDisconnect(uint8_t connection, uint16_t& result) {
    return send(EventClass::CONNECTION, ConnectionCommand::DISCONNECT, Bytes{connection},
                connectionResult(result));
}

boost::system::error_code BgapiCommands::connectionGetRssi(uint8_t connection, int8_t& rssi) {
    return send(EventClass::CONNECTION, ConnectionCommand::GET_RSSI, Bytes{connection},
                [&](const Bytes& reply) {
        PayloadReader r(reply);
        r.u8();
        rssi = r.i8();
    });
}

boost::system::error_code BgapiCommands::connectionUpdate(uint8_t connection, const ConnectionParameters& params,
                                                          uint16_t& result) {
    // Wire order is latency before timeout here, unlike gap_connect_direct
    PayloadWriter w;
    w.u8(connection)
     .u16(params.interval_min)
     .u16(params.interval_max)
     .u16(params.latency)
     .u16(params.timeout);
    return send(EventClass::CONNECTION, ConnectionCommand::UPDATE, w.data(), connectionResult(result));
}

boost::system::error_code BgapiCommands::connectionVersionUpdate(uint8_t connection, uint16_t& result) {
    return send(EventClass::CONNECTION, ConnectionCommand::VERSION_UPDATE, Bytes{connection},
                connectionResult(result));
}

boost::system::error_code BgapiCommands::connectionChannelMapGet(uint8_t connection, Bytes& map) {
    return send(EventClass::CONNECTION, ConnectionCommand::CHANNEL_MAP_GET, Bytes{connection},
                [&](const Bytes& reply) {
        PayloadReader r(reply);
        r.u8();
        map = r.lengthPrefixed();
    });
}

boost::system::error_code BgapiCommands::connectionChannelMapSet(uint8_t connection, const Bytes& map,
                                                                 uint16_t& result) {
    PayloadWriter w;
    w.u8(connection).lengthPrefixed(map);
    return send(EventClass::CONNECTION, ConnectionCommand::CHANNEL_MAP_SET, w.data(), connectionResult(result));
}

boost::system::error_code BgapiCommands::connectionFeaturesGet(uint8_t connection, uint16_t& result) {
    return send(EventClass::CONNECTION, ConnectionCommand::FEATURES_GET, Bytes{connection},
                connectionResult(result));
}

boost::system::error_code BgapiCommands::connectionGetStatus(uint8_t connection) {
    return send(EventClass::CONNECTION, ConnectionCommand::GET_STATUS, Bytes{connection});
}

boost::system::error_code BgapiCommands::connectionRawTx(uint8_t connection, const Bytes& data) {
    PayloadWriter w;
    w.u8(connection).lengthPrefixed(data);
    return send(EventClass::CONNECTION, ConnectionCommand::RAW_TX, w.data());
}

// ========== Attribute client ==========

boost::system::error_code BgapiCommands::attclientFindByTypeValue(uint8_t connection, uint16_t start,
                                                                  uint16_t end, uint16_t uuid,
                                                                  const Bytes& value, uint16_t& result) {
    PayloadWriter w;
    w.u8(connection).u16(start).u16(end).u16(uuid).lengthPrefixed(value);
    return send(EventClass::ATTCLIENT, AttclientCommand::FIND_BY_TYPE_VALUE, w.data(), connectionResult(result));
}

boost::system::error_code BgapiCommands::attclientReadByGroupType(uint8_t connection, uint16_t start,
                                                                  uint16_t end, const Bytes& uuid,
                                                                  uint16_t& result) {
    PayloadWriter w;
    w.u8(connection).u16(start).u16(end).lengthPrefixed(uuid);
    return send(EventClass::ATTCLIENT, AttclientCommand::READ_BY_GROUP_TYPE, w.data(), connectionResult(result));
}

boost::system::error_code BgapiCommands::attclientReadByType(uint8_t connection, uint16_t start,
                                                             uint16_t end, const Bytes& uuid,
                                                             uint16_t& result) {
    PayloadWriter w;
    w.u8(connection).u16(start).u16(end).lengthPrefixed(uuid);
    return send(EventClass::ATTCLIENT, AttclientCommand::READ_BY_TYPE, w.data(), connectionResult(result));
}

boost::system::error_code BgapiCommands::attclientFindInformation(uint8_t connection, uint16_t start,
                                                                  uint16_t end, uint16_t& result) {
    PayloadWriter w;
    w.u8(connection).u16(start).u16(end);
    return send(EventClass::ATTCLIENT, AttclientCommand::FIND_INFORMATION, w.data(), connectionResult(result));
}

boost::system::error_code BgapiCommands::attclientReadByHandle(uint8_t connection, uint16_t handle,
                                                               uint16_t& result) {
    PayloadWriter w;
    w.u8(connection).u16(handle);
    return send(EventClass::ATTCLIENT, AttclientCommand::READ_BY_HANDLE, w.data(), connectionResult(result));
}

boost::system::error_code BgapiCommands::attclientAttributeWrite(uint8_t connection, uint16_t handle,
                                                                 const Bytes& data, uint16_t& result) {
    PayloadWriter w;
    w.u8(connection).u16(handle).lengthPrefixed(data);
    return send(EventClass::ATTCLIENT, AttclientCommand::ATTRIBUTE_WRITE, w.data(), connectionResult(result));
}

boost::system::error_code BgapiCommands::attclientWriteCommand(uint8_t connection, uint16_t handle,
                                                               const Bytes& data, uint16_t& result) {
    PayloadWriter w;
    w.u8(connection).u16(handle).lengthPrefixed(data);
    return send(EventClass::ATTCLIENT, AttclientCommand::WRITE_COMMAND, w.data(), connectionResult(result));
}

boost::system::error_code BgapiCommands::attclientIndicateConfirm(uint8_t connection, uint16_t& result) {
    return sendForResult(EventClass::ATTCLIENT, AttclientCommand::INDICATE_CONFIRM, Bytes{connection}, result);
}

boost::system::error_code BgapiCommands::attclientReadLong(uint8_t connection, uint16_t handle,
                                                           uint16_t& result) {
    PayloadWriter w;
    w.u8(connection).u16(handle);
    return send(EventClass::ATTCLIENT, AttclientCommand::READ_LONG, w.data(), connectionResult(result));
}

boost::system::error_code BgapiCommands::attclientPrepareWrite(uint8_t connection, uint16_t handle,
                                                               uint16_t offset, const Bytes& data,
                                                               uint16_t& result) {
    PayloadWriter w;
    w.u8(connection).u16(handle).u16(offset).lengthPrefixed(data);
    return send(EventClass::ATTCLIENT, AttclientCommand::PREPARE_WRITE, w.data(), connectionResult(result));
}

boost::system::error_code BgapiCommands::attclientExecuteWrite(uint8_t connection, uint8_t commit,
                                                               uint16_t& result) {
    return send(EventClass::ATTCLIENT, AttclientCommand::EXECUTE_WRITE, Bytes{connection, commit},
                connectionResult(result));
}

boost::system::error_code BgapiCommands::attclientReadMultiple(uint8_t connection, const Bytes& handles,
                                                               uint16_t& result) {
    PayloadWriter w;
    w.u8(connection).lengthPrefixed(handles);
    return send(EventClass::ATTCLIENT, AttclientCommand::READ_MULTIPLE, w.data(), connectionResult(result));
}

// ========== Security manager ==========

boost::system::error_code BgapiCommands::smEncryptStart(uint8_t connection, uint8_t bonding, uint16_t& result) {
    return send(EventClass::SM, SmCommand::ENCRYPT_START, Bytes{connection, bonding}, connectionResult(result));
}

boost::system::error_code BgapiCommands::smSetBondableMode(uint8_t bondable) {
    return send(EventClass::SM, SmCommand::SET_BONDABLE_MODE, Bytes{bondable});
}

boost::system::error_code BgapiCommands::smDeleteBonding(uint8_t bond, uint16_t& result) {
    return sendForResult(EventClass::SM, SmCommand::DELETE_BONDING, Bytes{bond}, result);
}

boost::system::error_code BgapiCommands::smSetParameters(uint8_t mitm, uint8_t min_key_size,
                                                         uint8_t io_capabilities) {
    return send(EventClass::SM, SmCommand::SET_PARAMETERS, Bytes{mitm, min_key_size, io_capabilities});
}

boost::system::error_code BgapiCommands::smPasskeyEntry(uint8_t connection, uint32_t passkey, uint16_t& result) {
    PayloadWriter w;
    w.u8(connection).u32(passkey);
    return sendForResult(EventClass::SM, SmCommand::PASSKEY_ENTRY, w.data(), result);
}

boost::system::error_code BgapiCommands::smGetBonds(uint8_t& bonds) {
    return send(EventClass::SM, SmCommand::GET_BONDS, Bytes(), [&](const Bytes& reply) {
        PayloadReader r(reply);
        bonds = r.u8();
    });
}

boost::system::error_code BgapiCommands::smSetOobData(const Bytes& oob) {
    PayloadWriter w;
    w.lengthPrefixed(oob);
    return send(EventClass::SM, SmCommand::SET_OOB_DATA, w.data());
}

// ========== GAP ==========

boost::system::error_code BgapiCommands::gapSetPrivacyFlags(uint8_t peripheral_privacy, uint8_t central_privacy) {
    return send(EventClass::GAP, GapCommand::SET_PRIVACY_FLAGS, Bytes{peripheral_privacy, central_privacy});
}

boost::system::error_code BgapiCommands::gapSetMode(uint8_t discover, uint8_t connect, uint16_t& result) {
    return sendForResult(EventClass::GAP, GapCommand::SET_MODE, Bytes{discover, connect}, result);
}

boost::system::error_code BgapiCommands::gapDiscover(uint8_t mode, uint16_t& result) {
    return sendForResult(EventClass::GAP, GapCommand::DISCOVER, Bytes{mode}, result);
}

boost::system::error_code BgapiCommands::gapConnectDirect(const QualifiedMac& address,
                                                          const ConnectionParameters& params,
                                                          uint16_t& result, uint8_t& connection) {
    PayloadWriter w;
    w.mac(address.address)
     .u8(address.address_type)
     .u16(params.interval_min)
     .u16(params.interval_max)
     .u16(params.timeout)
     .u16(params.latency);
    return send(EventClass::GAP, GapCommand::CONNECT_DIRECT, w.data(), [&](const Bytes& reply) {
        PayloadReader r(reply);
        result = r.u16();
        connection = r.u8();
    });
}

boost::system::error_code BgapiCommands::gapEndProcedure(uint16_t& result) {
    return sendForResult(EventClass::GAP, GapCommand::END_PROCEDURE, Bytes(), result);
}

boost::system::error_code BgapiCommands::gapConnectSelective(const ConnectionParameters& params,
                                                             uint16_t& result, uint8_t& connection) {
    PayloadWriter w;
    w.u16(params.interval_min).u16(params.interval_max).u16(params.timeout).u16(params.latency);
    return send(EventClass::GAP, GapCommand::CONNECT_SELECTIVE, w.data(), [&](const Bytes& reply) {
        PayloadReader r(reply);
        result = r.u16();
        connection = r.u8();
    });
}

boost::system::error_code BgapiCommands::gapSetFiltering(uint8_t scan_policy, uint8_t adv_policy,
                                                         uint8_t scan_duplicate_filtering, uint16_t& result) {
    return sendForResult(EventClass::GAP, GapCommand::SET_FILTERING,
                         Bytes{scan_policy, adv_policy, scan_duplicate_filtering}, result);
}

boost::system::error_code BgapiCommands::gapSetScanParameters(uint16_t scan_interval, uint16_t scan_window,
                                                              uint8_t active, uint16_t& result) {
    PayloadWriter w;
    w.u16(scan_interval).u16(scan_window).u8(active);
    return sendForResult(EventClass::GAP, GapCommand::SET_SCAN_PARAMETERS, w.data(), result);
}

boost::system::error_code BgapiCommands::gapSetAdvParameters(uint16_t interval_min, uint16_t interval_max,
                                                             uint8_t channels, uint16_t& result) {
    PayloadWriter w;
    w.u16(interval_min).u16(interval_max).u8(channels);
    return sendForResult(EventClass::GAP, GapCommand::SET_ADV_PARAMETERS, w.data(), result);
}

boost::system::error_code BgapiCommands::gapSetAdvData(uint8_t set_scan_response, const Bytes& adv_data,
                                                       uint16_t& result) {
    PayloadWriter w;
    w.u8(set_scan_response).lengthPrefixed(adv_data);
    return sendForResult(EventClass::GAP, GapCommand::SET_ADV_DATA, w.data(), result);
}

boost::system::error_code BgapiCommands::gapSetDirectedConnectableMode(const QualifiedMac& address,
                                                                       uint16_t& result) {
    PayloadWriter w;
    w.mac(address.address).u8(address.address_type);
    return sendForResult(EventClass::GAP, GapCommand::SET_DIRECTED_CONNECTABLE_MODE, w.data(), result);
}

// ========== Hardware ==========

boost::system::error_code BgapiCommands::hardwareIoPortConfigIrq(uint8_t port, uint8_t enable_bits,
                                                                 uint8_t falling_edge, uint16_t& result) {
    return sendForResult(EventClass::HARDWARE, HardwareCommand::IO_PORT_CONFIG_IRQ,
                         Bytes{port, enable_bits, falling_edge}, result);
}

boost::system::error_code BgapiCommands::hardwareSetSoftTimer(uint32_t time, uint8_t handle,
                                                              uint8_t single_shot, uint16_t& result) {
    PayloadWriter w;
    w.u32(time).u8(handle).u8(single_shot);
    return sendForResult(EventClass::HARDWARE, HardwareCommand::SET_SOFT_TIMER, w.data(), result);
}

boost::system::error_code BgapiCommands::hardwareAdcRead(uint8_t input, uint8_t decimation,
                                                         uint8_t reference, uint16_t& result) {
    return sendForResult(EventClass::HARDWARE, HardwareCommand::ADC_READ,
                         Bytes{input, decimation, reference}, result);
}

boost::system::error_code BgapiCommands::hardwareIoPortConfigDirection(uint8_t port, uint8_t direction,
                                                                       uint16_t& result) {
    return sendForResult(EventClass::HARDWARE, HardwareCommand::IO_PORT_CONFIG_DIRECTION,
                         Bytes{port, direction}, result);
}

boost::system::error_code BgapiCommands::hardwareIoPortConfigFunction(uint8_t port, uint8_t function,
                                                                      uint16_t& result) {
    return sendForResult(EventClass::HARDWARE, HardwareCommand::IO_PORT_CONFIG_FUNCTION,
                         Bytes{port, function}, result);
}

boost::system::error_code BgapiCommands::hardwareIoPortConfigPull(uint8_t port, uint8_t tristate_mask,
                                                                  uint8_t pull_up, uint16_t& result) {
    return sendForResult(EventClass::HARDWARE, HardwareCommand::IO_PORT_CONFIG_PULL,
                         Bytes{port, tristate_mask, pull_up}, result);
}

boost::system::error_code BgapiCommands::hardwareIoPortWrite(uint8_t port, uint8_t mask, uint8_t data,
                                                             uint16_t& result) {
    return sendForResult(EventClass::HARDWARE, HardwareCommand::IO_PORT_WRITE, Bytes{port, mask, data}, result);
}

boost::system::error_code BgapiCommands::hardwareIoPortRead(uint8_t port, uint8_t mask, uint16_t& result,
                                                            uint8_t& reply_port, uint8_t& data) {
    return send(EventClass::HARDWARE, HardwareCommand::IO_PORT_READ, Bytes{port, mask},
                [&](const Bytes& reply) {
        PayloadReader r(reply);
        result = r.u16();
        reply_port = r.u8();
        data = r.u8();
    });
}

boost::system::error_code BgapiCommands::hardwareSpiConfig(uint8_t channel, const SpiConfig& config,
                                                           uint16_t& result) {
    Bytes payload{channel, config.polarity, config.phase, config.bit_order, config.baud_e, config.baud_m};
    return sendForResult(EventClass::HARDWARE, HardwareCommand::SPI_CONFIG, payload, result);
}

boost::system::error_code BgapiCommands::hardwareSpiTransfer(uint8_t channel, const Bytes& data,
                                                             uint16_t& result, Bytes& received) {
    PayloadWriter w;
    w.u8(channel).lengthPrefixed(data);
    return send(EventClass::HARDWARE, HardwareCommand::SPI_TRANSFER, w.data(), [&](const Bytes& reply) {
        PayloadReader r(reply);
        result = r.u16();
        r.u8();   // channel
        received = r.lengthPrefixed();
    });
}

boost::system::error_code BgapiCommands::hardwareI2cRead(uint8_t address, uint8_t stop, uint8_t length,
                                                         uint16_t& result, Bytes& data) {
    return send(EventClass::HARDWARE, HardwareCommand::I2C_READ, Bytes{address, stop, length},
                [&](const Bytes& reply) {
        PayloadReader r(reply);
        result = r.u16();
        data = r.lengthPrefixed();
    });
}

boost::system::error_code BgapiCommands::hardwareI2cWrite(uint8_t address, uint8_t stop, const Bytes& data,
                                                          uint8_t& written) {
    PayloadWriter w;
    w.u8(address).u8(stop).lengthPrefixed(data);
    return send(EventClass::HARDWARE, HardwareCommand::I2C_WRITE, w.data(), [&](const Bytes& reply) {
        PayloadReader r(reply);
        written = r.u8();
    });
}

boost::system::error_code BgapiCommands::hardwareSetTxPower(uint8_t power) {
    return send(EventClass::HARDWARE, HardwareCommand::SET_TXPOWER, Bytes{power});
}

boost::system::error_code BgapiCommands::hardwareTimerComparator(uint8_t timer, uint8_t channel, uint8_t mode,
                                                                 uint16_t comparator_value, uint16_t& result) {
    PayloadWriter w;
    w.u8(timer).u8(channel).u8(mode).u16(comparator_value);
    return sendForResult(EventClass::HARDWARE, HardwareCommand::TIMER_COMPARATOR, w.data(), result);
}

// ========== Test ==========

boost::system::error_code BgapiCommands::testPhyTx(uint8_t channel, uint8_t length, uint8_t type) {
    return send(EventClass::TEST, TestCommand::PHY_TX, Bytes{channel, length, type});
}

boost::system::error_code BgapiCommands::testPhyRx(uint8_t channel) {
    return send(EventClass::TEST, TestCommand::PHY_RX, Bytes{channel});
}

boost::system::error_code BgapiCommands::testPhyEnd(uint16_t& counter) {
    return sendForResult(EventClass::TEST, TestCommand::PHY_END, Bytes(), counter);
}

boost::system::error_code BgapiCommands::testPhyReset() {
    return send(EventClass::TEST, TestCommand::PHY_RESET, Bytes());
}

boost::system::error_code BgapiCommands::testGetChannelMap(Bytes& channel_map) {
    return send(EventClass::TEST, TestCommand::GET_CHANNEL_MAP, Bytes(), [&](const Bytes& reply) {
        PayloadReader r(reply);
        channel_map = r.lengthPrefixed();
    });
}

boost::system::error_code BgapiCommands::testDebug(const Bytes& input, Bytes& output) {
    PayloadWriter w;
    w.lengthPrefixed(input);
    return send(EventClass::TEST, TestCommand::DEBUG, w.data(), [&](const Bytes& reply) {
        PayloadReader r(reply);
        output = r.lengthPrefixed();
    });
}

} // namespace bgapi
