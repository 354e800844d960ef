#ifndef BLED112_DRIVER_BGAPI_COMMANDS_HPP
#define BLED112_DRIVER_BGAPI_COMMANDS_HPP

#include "bgapi_driver.hpp"
#include "errors.hpp"
#include "types.hpp"
#include <cstdint>

namespace bgapi {

/**
 * @brief Typed BGAPI commands on top of BgapiDriver::send()
 *
 * Every method blocks until the response arrives (or the operation fails)
 * and returns the transport/correlation outcome. Response fields are written
 * to the out-parameters only on success. A `result` out-parameter carries the
 * firmware's own result code (0 = success), which is not an error at this
 * layer.
 */
class BgapiCommands {
public:
    explicit BgapiCommands(BgapiDriver& driver);

    // Reset is never answered; wait this long before assuming it went through
    static constexpr uint32_t RESET_TIMEOUT_MS = 200;

    // System
    boost::system::error_code systemReset(bool boot_in_dfu);
    boost::system::error_code systemHello();
    boost::system::error_code systemAddressGet(Mac& address);
    boost::system::error_code systemRegWrite(uint16_t address, uint8_t value, uint16_t& result);
    boost::system::error_code systemRegRead(uint16_t address, uint16_t& reply_address, uint8_t& value);
    boost::system::error_code systemGetCounters(SystemCounters& counters);
    boost::system::error_code systemGetConnections(uint8_t& max_connections);
    boost::system::error_code systemReadMemory(uint32_t address, uint8_t length,
                                               uint32_t& reply_address, Bytes& data);
    boost::system::error_code systemGetInfo(SystemInfo& info);
    boost::system::error_code systemEndpointTx(uint8_t endpoint, const Bytes& data, uint16_t& result);
    boost::system::error_code systemWhitelistAppend(const QualifiedMac& address, uint16_t& result);
    boost::system::error_code systemWhitelistRemove(const QualifiedMac& address, uint16_t& result);
    boost::system::error_code systemWhitelistClear();
    boost::system::error_code systemEndpointRx(uint8_t endpoint, uint8_t size,
                                               uint16_t& result, Bytes& data);
    boost::system::error_code systemEndpointSetWatermarks(uint8_t endpoint, uint8_t rx, uint8_t tx,
                                                          uint16_t& result);

    // Flash persistent store (ps_dump results arrive as onFlashPsKey events)
    boost::system::error_code flashPsDefrag();
    boost::system::error_code flashPsDump();
    boost::system::error_code flashPsEraseAll();
    boost::system::error_code flashPsSave(uint16_t key, const Bytes& value, uint16_t& result);
    boost::system::error_code flashPsLoad(uint16_t key, uint16_t& result, Bytes& value);
    boost::system::error_code flashPsErase(uint16_t key);
    boost::system::error_code flashErasePage(uint8_t page, uint16_t& result);
    boost::system::error_code flashWriteData(uint32_t address, const Bytes& data, uint16_t& result);

    // Local GATT database
    boost::system::error_code attributesWrite(uint16_t handle, uint8_t offset, const Bytes& value,
                                              uint16_t& result);
    boost::system::error_code attributesRead(uint16_t handle, uint16_t offset,
                                             uint16_t& result, Bytes& value);
    boost::system::error_code attributesReadType(uint16_t handle, uint16_t& result, Bytes& type);
    boost::system::error_code attributesUserReadResponse(uint8_t connection, uint8_t att_error,
                                                         const Bytes& value);
    boost::system::error_code attributesUserWriteResponse(uint8_t connection, uint8_t att_error);

    // Connection
    boost::system::error_code connectionDisconnect(uint8_t connection, uint16_t& result);
    boost::system::error_code connectionGetRssi(uint8_t connection, int8_t& rssi);
    boost::system::error_code connectionUpdate(uint8_t connection, const ConnectionParameters& params,
                                               uint16_t& result);
    boost::system::error_code connectionVersionUpdate(uint8_t connection, uint16_t& result);
    boost::system::error_code connectionChannelMapGet(uint8_t connection, Bytes& map);
    boost::system::error_code connectionChannelMapSet(uint8_t connection, const Bytes& map,
                                                      uint16_t& result);
    boost::system::error_code connectionFeaturesGet(uint8_t connection, uint16_t& result);
    // Status itself arrives as an onConnectionStatus event
    boost::system::error_code connectionGetStatus(uint8_t connection);
    boost::system::error_code connectionRawTx(uint8_t connection, const Bytes& data);

    // GATT client; results arrive as attclient events
    boost::system::error_code attclientFindByTypeValue(uint8_t connection, uint16_t start, uint16_t end,
                                                       uint16_t uuid, const Bytes& value,
                                                       uint16_t& result);
    boost::system::error_code attclientReadByGroupType(uint8_t connection, uint16_t start, uint16_t end,
                                                       const Bytes& uuid, uint16_t& result);
    boost::system::error_code attclientReadByType(uint8_t connection, uint16_t start, uint16_t end,
                                                  const Bytes& uuid, uint16_t& result);
    boost::system::error_code attclientFindInformation(uint8_t connection, uint16_t start, uint16_t end,
                                                       uint16_t& result);
    boost::system::error_code attclientReadByHandle(uint8_t connection, uint16_t handle, uint16_t& result);
    boost::system::error_code attclientAttributeWrite(uint8_t connection, uint16_t handle,
                                                      const Bytes& data, uint16_t& result);
    boost::system::error_code attclientWriteCommand(uint8_t connection, uint16_t handle,
                                                    const Bytes& data, uint16_t& result);
    boost::system::error_code attclientIndicateConfirm(uint8_t connection, uint16_t& result);
    boost::system::error_code attclientReadLong(uint8_t connection, uint16_t handle, uint16_t& result);
    boost::system::error_code attclientPrepareWrite(uint8_t connection, uint16_t handle, uint16_t offset,
                                                    const Bytes& data, uint16_t& result);
    boost::system::error_code attclientExecuteWrite(uint8_t connection, uint8_t commit, uint16_t& result);
    // handles: packed little-endian uint16 handles
    boost::system::error_code attclientReadMultiple(uint8_t connection, const Bytes& handles,
                                                    uint16_t& result);

    // Security manager
    boost::system::error_code smEncryptStart(uint8_t connection, uint8_t bonding, uint16_t& result);
    boost::system::error_code smSetBondableMode(uint8_t bondable);
    boost::system::error_code smDeleteBonding(uint8_t bond, uint16_t& result);
    boost::system::error_code smSetParameters(uint8_t mitm, uint8_t min_key_size, uint8_t io_capabilities);
    boost::system::error_code smPasskeyEntry(uint8_t connection, uint32_t passkey, uint16_t& result);
    boost::system::error_code smGetBonds(uint8_t& bonds);
    boost::system::error_code smSetOobData(const Bytes& oob);

    // GAP
    boost::system::error_code gapSetPrivacyFlags(uint8_t peripheral_privacy, uint8_t central_privacy);
    boost::system::error_code gapSetMode(uint8_t discover, uint8_t connect, uint16_t& result);
    boost::system::error_code gapDiscover(uint8_t mode, uint16_t& result);
    boost::system::error_code gapConnectDirect(const QualifiedMac& address, const ConnectionParameters& params,
                                               uint16_t& result, uint8_t& connection);
    boost::system::error_code gapEndProcedure(uint16_t& result);
    boost::system::error_code gapConnectSelective(const ConnectionParameters& params,
                                                  uint16_t& result, uint8_t& connection);
    boost::system::error_code gapSetFiltering(uint8_t scan_policy, uint8_t adv_policy,
                                              uint8_t scan_duplicate_filtering, uint16_t& result);
    boost::system::error_code gapSetScanParameters(uint16_t scan_interval, uint16_t scan_window,
                                                   uint8_t active, uint16_t& result);
    boost::system::error_code gapSetAdvParameters(uint16_t interval_min, uint16_t interval_max,
                                                  uint8_t channels, uint16_t& result);
    boost::system::error_code gapSetAdvData(uint8_t set_scan_response, const Bytes& adv_data,
                                            uint16_t& result);
    boost::system::error_code gapSetDirectedConnectableMode(const QualifiedMac& address, uint16_t& result);

    // Hardware
    boost::system::error_code hardwareIoPortConfigIrq(uint8_t port, uint8_t enable_bits, uint8_t falling_edge,
                                                      uint16_t& result);
    boost::system::error_code hardwareSetSoftTimer(uint32_t time, uint8_t handle, uint8_t single_shot,
                                                   uint16_t& result);
    // Conversion result arrives as an onHardwareAdcResult event
    boost::system::error_code hardwareAdcRead(uint8_t input, uint8_t decimation, uint8_t reference,
                                              uint16_t& result);
    boost::system::error_code hardwareIoPortConfigDirection(uint8_t port, uint8_t direction, uint16_t& result);
    boost::system::error_code hardwareIoPortConfigFunction(uint8_t port, uint8_t function, uint16_t& result);
    boost::system::error_code hardwareIoPortConfigPull(uint8_t port, uint8_t tristate_mask, uint8_t pull_up,
                                                       uint16_t& result);
    boost::system::error_code hardwareIoPortWrite(uint8_t port, uint8_t mask, uint8_t data, uint16_t& result);
    boost::system::error_code hardwareIoPortRead(uint8_t port, uint8_t mask,
                                                 uint16_t& result, uint8_t& reply_port, uint8_t& data);
    boost::system::error_code hardwareSpiConfig(uint8_t channel, const SpiConfig& config, uint16_t& result);
    boost::system::error_code hardwareSpiTransfer(uint8_t channel, const Bytes& data,
                                                  uint16_t& result, Bytes& received);
    boost::system::error_code hardwareI2cRead(uint8_t address, uint8_t stop, uint8_t length,
                                              uint16_t& result, Bytes& data);
    boost::system::error_code hardwareI2cWrite(uint8_t address, uint8_t stop, const Bytes& data,
                                               uint8_t& written);
    boost::system::error_code hardwareSetTxPower(uint8_t power);
    boost::system::error_code hardwareTimerComparator(uint8_t timer, uint8_t channel, uint8_t mode,
                                                      uint16_t comparator_value, uint16_t& result);

    // Radio test modes
    boost::system::error_code testPhyTx(uint8_t channel, uint8_t length, uint8_t type);
    boost::system::error_code testPhyRx(uint8_t channel);
    boost::system::error_code testPhyEnd(uint16_t& counter);
    boost::system::error_code testPhyReset();
    boost::system::error_code testGetChannelMap(Bytes& channel_map);
    boost::system::error_code testDebug(const Bytes& input, Bytes& output);

private:
    // Command ids, per class
    enum class SystemCommand : uint8_t {
        RESET = 0, HELLO = 1, ADDRESS_GET = 2, REG_WRITE = 3, REG_READ = 4,
        GET_COUNTERS = 5, GET_CONNECTIONS = 6, READ_MEMORY = 7, GET_INFO = 8,
        ENDPOINT_TX = 9, WHITELIST_APPEND = 10, WHITELIST_REMOVE = 11,
        WHITELIST_CLEAR = 12, ENDPOINT_RX = 13, ENDPOINT_SET_WATERMARKS = 14
    };
    enum class FlashCommand : uint8_t {
        PS_DEFRAG = 0, PS_DUMP = 1, PS_ERASE_ALL = 2, PS_SAVE = 3, PS_LOAD = 4,
        PS_ERASE = 5, ERASE_PAGE = 6, WRITE_DATA = 7
    };
    enum class AttributesCommand : uint8_t {
        WRITE = 0, READ = 1, READ_TYPE = 2, USER_READ_RESPONSE = 3, USER_WRITE_RESPONSE = 4
    };
    enum class ConnectionCommand : uint8_t {
        DISCONNECT = 0, GET_RSSI = 1, UPDATE = 2, VERSION_UPDATE = 3, CHANNEL_MAP_GET = 4,
        CHANNEL_MAP_SET = 5, FEATURES_GET = 6, GET_STATUS = 7, RAW_TX = 8
    };
    enum class AttclientCommand : uint8_t {
        FIND_BY_TYPE_VALUE = 0, READ_BY_GROUP_TYPE = 1, READ_BY_TYPE = 2, FIND_INFORMATION = 3,
        READ_BY_HANDLE = 4, ATTRIBUTE_WRITE = 5, WRITE_COMMAND = 6, INDICATE_CONFIRM = 7,
        READ_LONG = 8, PREPARE_WRITE = 9, EXECUTE_WRITE = 10, READ_MULTIPLE = 11
    };
    enum class SmCommand : uint8_t {
        ENCRYPT_START = 0, SET_BONDABLE_MODE = 1, DELETE_BONDING = 2, SET_PARAMETERS = 3,
        PASSKEY_ENTRY = 4, GET_BONDS = 5, SET_OOB_DATA = 6
    };
    enum class GapCommand : uint8_t {
        SET_PRIVACY_FLAGS = 0, SET_MODE = 1, DISCOVER = 2, CONNECT_DIRECT = 3, END_PROCEDURE = 4,
        CONNECT_SELECTIVE = 5, SET_FILTERING = 6, SET_SCAN_PARAMETERS = 7, SET_ADV_PARAMETERS = 8,
        SET_ADV_DATA = 9, SET_DIRECTED_CONNECTABLE_MODE = 10
    };
    enum class HardwareCommand : uint8_t {
        IO_PORT_CONFIG_IRQ = 0, SET_SOFT_TIMER = 1, ADC_READ = 2, IO_PORT_CONFIG_DIRECTION = 3,
        IO_PORT_CONFIG_FUNCTION = 4, IO_PORT_CONFIG_PULL = 5, IO_PORT_WRITE = 6, IO_PORT_READ = 7,
        SPI_CONFIG = 8, SPI_TRANSFER = 9, I2C_READ = 10, I2C_WRITE = 11, SET_TXPOWER = 12,
        TIMER_COMPARATOR = 13
    };
    enum class TestCommand : uint8_t {
        PHY_TX = 0, PHY_RX = 1, PHY_END = 2, PHY_RESET = 3, GET_CHANNEL_MAP = 4, DEBUG = 5
    };

    template <typename Command>
    boost::system::error_code send(EventClass cls, Command command, const Bytes& payload,
                                   const BgapiDriver::SuccessHandler& on_success = BgapiDriver::SuccessHandler()) {
        return driver_.send(static_cast<uint8_t>(cls), static_cast<uint8_t>(command), payload, on_success);
    }

    // For the many commands whose response is a single uint16 result
    template <typename Command>
    boost::system::error_code sendForResult(EventClass cls, Command command, const Bytes& payload,
                                            uint16_t& result);

    BgapiDriver& driver_;
};

} // namespace bgapi

#endif // BLED112_DRIVER_BGAPI_COMMANDS_HPP
