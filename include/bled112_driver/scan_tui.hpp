#ifndef BLED112_DRIVER_SCAN_TUI_HPP
#define BLED112_DRIVER_SCAN_TUI_HPP

#include "bgapi_commands.hpp"
#include "bgapi_driver.hpp"
#include "observer.hpp"
#include <ncurses.h>
#include <atomic>
#include <chrono>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace bgapi {

/**
 * @brief Terminal scanner for a BLED112 dongle
 *
 * Features:
 * - Dongle identity (address, firmware) and link counters
 * - Start/stop GAP discovery, discover mode and active scan toggles
 * - Live table of advertisers with RSSI and last advertisement payload
 * - CSV logging of every scan response
 *
 * Scan responses arrive on the driver's reader thread; the table is shared
 * with the UI thread under a mutex.
 */
class ScanTUI : public Observer {
public:
    struct Config {
        BgapiSerial::Config serial;
        uint8_t discover_mode;   // 0=limited, 1=generic, 2=observation
        bool active_scan;

        Config() : discover_mode(1), active_scan(true) {}
    };

    explicit ScanTUI(const Config& config = Config());
    ~ScanTUI() override;

    // Main application loop; returns when the user quits or *stop is set
    void run(const std::atomic<bool>* stop = nullptr);

    // Observer (reader thread)
    void onSystemBoot(const SystemInfo& info) override;
    void onGapScanResponse(const GapScanResponse& response) override;
    void onConnectionStatus(const ConnectionStatus& status) override;
    void onConnectionDisconnected(uint8_t connection, uint16_t reason) override;

private:
    struct Advertiser {
        QualifiedMac address;
        int8_t rssi = 0;
        uint8_t packet_type = 0;
        uint8_t bond = 0;
        Bytes data;
        uint32_t count = 0;
        std::chrono::steady_clock::time_point last_seen;
    };

    // UI Management
    void initUI();
    void shutdownUI();
    void drawUI();
    void drawHeader();
    void drawDongleStatus();
    void drawAdvertisers();
    void drawHelp();
    void drawStatusBar();

    // Input handling
    void handleInput(int ch);
    void toggleScan();
    void cycleDiscoverMode();
    void toggleActiveScan();
    void clearTable();
    void toggleLogging();

    // Dongle
    bool startScan();
    bool stopScan();
    void setStatus(const std::string& message);
    void onLog(LogLevel level, const std::string& message);

    // Logging
    bool openLogFile();
    void closeLogFile();
    void logResponse(const GapScanResponse& response);

    Config config_;
    std::unique_ptr<BgapiDriver> driver_;
    std::unique_ptr<BgapiCommands> commands_;
    bool running_;
    bool scanning_;

    // Dongle identity, read once after connecting
    std::string dongle_address_;
    std::string firmware_version_;

    // Shared with the reader thread
    std::mutex mutex_;
    std::map<std::string, Advertiser> advertisers_;
    std::string status_message_;
    uint32_t boots_seen_;

    // UI state
    int screen_height_;
    int screen_width_;
    bool show_help_;
    std::chrono::steady_clock::time_point started_;

    // Logging
    std::atomic<bool> logging_enabled_;   // Read by the reader thread
    std::ofstream log_file_;
    std::chrono::steady_clock::time_point log_start_time_;

    static constexpr int UPDATE_RATE_MS = 250;
    static constexpr int STALE_AFTER_S = 10;   // Dim advertisers not heard from in this long
};

} // namespace bgapi

#endif // BLED112_DRIVER_SCAN_TUI_HPP
