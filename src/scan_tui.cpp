#include "bled112_driver/scan_tui.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <vector>

namespace bgapi {

namespace {

const char* discoverModeName(uint8_t mode) {
    switch (mode) {
        case 0: return "LIMITED";
        case 1: return "GENERIC";
        case 2: return "OBSERVATION";
        default: return "?";
    }
}

const char* packetTypeName(uint8_t type) {
    switch (type) {
        case 0: return "ADV_IND";
        case 1: return "DIRECT_IND";
        case 2: return "NONCONN";
        case 3: return "SCAN_REQ";
        case 4: return "SCAN_RSP";
        case 6: return "DISCOVER";
        default: return "?";
    }
}

} // namespace

ScanTUI::ScanTUI(const Config& config)
    : config_(config)
    , running_(false)
    , scanning_(false)
    , boots_seen_(0)
    , screen_height_(0)
    , screen_width_(0)
    , show_help_(false)
    , logging_enabled_(false)
{
    BgapiDriver::Config driver_config;
    driver_config.serial = config_.serial;
    driver_ = std::make_unique<BgapiDriver>(*this, driver_config);
    driver_->setLogHandler([this](LogLevel level, const std::string& message) {
        onLog(level, message);
    });
    commands_ = std::make_unique<BgapiCommands>(*driver_);
}

ScanTUI::~ScanTUI() {
    shutdownUI();
    // Reader thread calls back into this object; stop it before members go
    driver_->disconnect();
    closeLogFile();
}

void ScanTUI::run(const std::atomic<bool>* stop) {
    initUI();

    setStatus("Connecting to " + config_.serial.device + "...");
    drawUI();

    if (!driver_->connect()) {
        setStatus("ERROR: " + driver_->getLastError());
        drawUI();
        timeout(-1);
        getch();  // Wait for keypress
        return;
    }

    boost::system::error_code ec = commands_->systemHello();
    if (!ec) {
        // A scan left running by a previous session keeps the dongle busy
        uint16_t result = 0;
        ec = commands_->gapEndProcedure(result);
    }
    if (ec) {
        setStatus("ERROR: Dongle not answering: " + ec.message());
        drawUI();
        timeout(-1);
        getch();
        return;
    }

    Mac address;
    if (!commands_->systemAddressGet(address)) {
        dongle_address_ = address.toString();
    }
    SystemInfo info;
    if (!commands_->systemGetInfo(info)) {
        firmware_version_ = info.toString();
    } else {
        firmware_version_ = "Unknown";
    }

    if (startScan()) {
        setStatus("Connected, scanning");
    }

    running_ = true;
    started_ = std::chrono::steady_clock::now();
    auto last_update = started_;

    while (running_) {
        if (stop != nullptr && *stop) {
            break;
        }

        // getch() waits up to 50 ms
        int ch = getch();
        if (ch != ERR) {
            handleInput(ch);
        }

        auto now = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_update).count();
        if (elapsed >= UPDATE_RATE_MS) {
            drawUI();
            last_update = now;
        }
    }

    if (scanning_) {
        stopScan();
    }
}

void ScanTUI::onSystemBoot(const SystemInfo& info) {
    std::lock_guard<std::mutex> lock(mutex_);
    boots_seen_++;
    status_message_ = "Dongle rebooted: " + info.toString();
}

void ScanTUI::onGapScanResponse(const GapScanResponse& response) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Advertiser& entry = advertisers_[response.address.hashable()];
        entry.address = response.address;
        entry.rssi = response.rssi;
        entry.packet_type = response.packet_type;
        entry.bond = response.bond;
        if (!response.data.empty()) {
            entry.data = response.data;
        }
        entry.count++;
        entry.last_seen = std::chrono::steady_clock::now();
    }

    if (logging_enabled_) {
        logResponse(response);
    }
}

void ScanTUI::onConnectionStatus(const ConnectionStatus& status) {
    std::stringstream ss;
    ss << "Connection " << static_cast<int>(status.connection) << " to "
       << status.address.address.toString() << (status.isConnected() ? " up" : " down");
    setStatus(ss.str());
}

void ScanTUI::onConnectionDisconnected(uint8_t connection, uint16_t reason) {
    std::stringstream ss;
    ss << "Connection " << static_cast<int>(connection) << " closed, reason 0x"
       << std::hex << std::setw(4) << std::setfill('0') << reason;
    setStatus(ss.str());
}

void ScanTUI::initUI() {
    initscr();
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);
    timeout(50);

    if (has_colors()) {
        start_color();
        init_pair(1, COLOR_GREEN, COLOR_BLACK);   // Normal
        init_pair(2, COLOR_RED, COLOR_BLACK);     // Error
        init_pair(3, COLOR_YELLOW, COLOR_BLACK);  // Warning / stale
        init_pair(4, COLOR_CYAN, COLOR_BLACK);    // Info
    }

    getmaxyx(stdscr, screen_height_, screen_width_);
}

void ScanTUI::shutdownUI() {
    endwin();
}

void ScanTUI::drawUI() {
    getmaxyx(stdscr, screen_height_, screen_width_);
    clear();

    drawHeader();
    drawDongleStatus();
    drawAdvertisers();

    if (show_help_) {
        drawHelp();
    }

    drawStatusBar();

    refresh();
}

void ScanTUI::drawHeader() {
    attron(COLOR_PAIR(4) | A_BOLD);
    mvprintw(0, 0, "================================================================================");
    mvprintw(1, 0, "                       BLED112 Scanner - BGAPI over USB                        ");
    mvprintw(2, 0, "================================================================================");
    attroff(COLOR_PAIR(4) | A_BOLD);
}

void ScanTUI::drawDongleStatus() {
    int row = 4;

    if (driver_->isConnected()) {
        attron(COLOR_PAIR(1));
        mvprintw(row, 2, "● CONNECTED");
        attroff(COLOR_PAIR(1));
    } else {
        attron(COLOR_PAIR(2));
        mvprintw(row, 2, "● DISCONNECTED");
        attroff(COLOR_PAIR(2));
    }

    mvprintw(row, 20, "Device: %s", config_.serial.device.c_str());
    if (!dongle_address_.empty()) {
        mvprintw(row, 50, "Addr: %s", dongle_address_.c_str());
    }

    row++;
    if (!firmware_version_.empty()) {
        mvprintw(row, 20, "FW: %s", firmware_version_.c_str());
    }

    row++;
    if (scanning_) {
        attron(COLOR_PAIR(1) | A_BOLD);
        mvprintw(row, 2, "● SCANNING");
        attroff(COLOR_PAIR(1) | A_BOLD);
    } else {
        attron(COLOR_PAIR(3));
        mvprintw(row, 2, "○ IDLE");
        attroff(COLOR_PAIR(3));
    }
    mvprintw(row, 20, "Mode: %s  %s", discoverModeName(config_.discover_mode),
             config_.active_scan ? "ACTIVE" : "PASSIVE");
    if (logging_enabled_) {
        attron(COLOR_PAIR(1));
        mvprintw(row, 50, "● LOGGING");
        attroff(COLOR_PAIR(1));
    }

    row++;
    DriverStats stats = driver_->stats();
    mvprintw(row, 2, "Frames: %llu  Events: %llu  Responses: %llu  Timeouts: %llu  Read errors: %llu",
             static_cast<unsigned long long>(stats.frames_received),
             static_cast<unsigned long long>(stats.events),
             static_cast<unsigned long long>(stats.responses),
             static_cast<unsigned long long>(stats.timeouts),
             static_cast<unsigned long long>(stats.read_errors));
}

void ScanTUI::drawAdvertisers() {
    int row = 9;

    std::vector<Advertiser> rows;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& kv : advertisers_) {
            rows.push_back(kv.second);
        }
    }
    // Strongest first
    std::sort(rows.begin(), rows.end(), [](const Advertiser& a, const Advertiser& b) {
        return a.rssi > b.rssi;
    });

    attron(A_BOLD);
    mvprintw(row++, 2, "ADVERTISERS (%zu)", rows.size());
    mvprintw(row++, 4, "%-17s %-4s %5s %-10s %6s  %s", "ADDRESS", "TYPE", "RSSI", "PACKET", "SEEN", "DATA");
    attroff(A_BOLD);

    auto now = std::chrono::steady_clock::now();
    int last_row = screen_height_ - 2;

    for (const Advertiser& adv : rows) {
        if (row >= last_row) {
            mvprintw(row, 4, "... %zu more", rows.size() - (row - 11));
            break;
        }

        auto age = std::chrono::duration_cast<std::chrono::seconds>(now - adv.last_seen).count();
        bool stale = age >= STALE_AFTER_S;
        if (stale) {
            attron(COLOR_PAIR(3) | A_DIM);
        }

        std::string data = toHex(adv.data);
        int data_width = screen_width_ - 56;
        if (data_width > 3 && static_cast<int>(data.length()) > data_width) {
            data = data.substr(0, data_width - 3) + "...";
        }

        mvprintw(row++, 4, "%-17s %-4s %5d %-10s %6u  %s",
                 adv.address.address.toString().c_str(),
                 adv.address.address_type == 0 ? "pub" : "rnd",
                 static_cast<int>(adv.rssi),
                 packetTypeName(adv.packet_type),
                 adv.count,
                 data.c_str());

        if (stale) {
            attroff(COLOR_PAIR(3) | A_DIM);
        }
    }
}

void ScanTUI::drawHelp() {
    int row = screen_height_ / 2 - 6;
    int col = 10;

    attron(COLOR_PAIR(4));
    mvprintw(row++, col, "==================================== HELP ====================================");
    mvprintw(row++, col, "                                                                              ");
    mvprintw(row++, col, "  S          - Start/stop scanning                                           ");
    mvprintw(row++, col, "  M          - Cycle discover mode (restarts the scan)                       ");
    mvprintw(row++, col, "  A          - Toggle active/passive scanning                                ");
    mvprintw(row++, col, "  C          - Clear the advertiser table                                    ");
    mvprintw(row++, col, "  L          - Toggle CSV logging                                            ");
    mvprintw(row++, col, "  ?          - Toggle this help                                              ");
    mvprintw(row++, col, "  Q / ESC    - Quit                                                          ");
    mvprintw(row++, col, "                                                                              ");
    mvprintw(row++, col, "==============================================================================");
    attroff(COLOR_PAIR(4));
}

void ScanTUI::drawStatusBar() {
    int row = screen_height_ - 1;

    std::string message;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        message = status_message_;
    }

    attron(A_REVERSE);
    mvprintw(row, 0, "%-*s", screen_width_, message.c_str());
    attroff(A_REVERSE);

    std::string hint = "Press ? for help";
    mvprintw(row, screen_width_ - hint.length() - 1, "%s", hint.c_str());
}

void ScanTUI::handleInput(int ch) {
    switch (ch) {
        case 's':
        case 'S':
            toggleScan();
            break;
        case 'm':
        case 'M':
            cycleDiscoverMode();
            break;
        case 'a':
        case 'A':
            toggleActiveScan();
            break;
        case 'c':
        case 'C':
            clearTable();
            break;
        case 'l':
        case 'L':
            toggleLogging();
            break;
        case '?':
            show_help_ = !show_help_;
            break;
        case 'q':
        case 'Q':
        case 27:  // ESC
            running_ = false;
            setStatus("Shutting down...");
            break;
    }
    drawUI();
}

void ScanTUI::toggleScan() {
    if (scanning_) {
        if (stopScan()) {
            setStatus("Scan stopped");
        }
    } else {
        if (startScan()) {
            setStatus("Scan started");
        }
    }
}

void ScanTUI::cycleDiscoverMode() {
    config_.discover_mode = static_cast<uint8_t>((config_.discover_mode + 1) % 3);
    if (scanning_) {
        stopScan();
        startScan();
    }
    setStatus(std::string("Discover mode ") + discoverModeName(config_.discover_mode));
}

void ScanTUI::toggleActiveScan() {
    config_.active_scan = !config_.active_scan;
    if (scanning_) {
        // Scan parameters only take effect on the next discover
        stopScan();
        startScan();
    }
    setStatus(config_.active_scan ? "Active scanning" : "Passive scanning");
}

void ScanTUI::clearTable() {
    std::lock_guard<std::mutex> lock(mutex_);
    advertisers_.clear();
    status_message_ = "Table cleared";
}

void ScanTUI::toggleLogging() {
    if (logging_enabled_) {
        logging_enabled_ = false;
        closeLogFile();
        setStatus("Logging stopped");
    } else {
        if (openLogFile()) {
            log_start_time_ = std::chrono::steady_clock::now();
            logging_enabled_ = true;
            setStatus("Logging started");
        } else {
            setStatus("Failed to open log file");
        }
    }
}

bool ScanTUI::startScan() {
    uint16_t result = 0;

    // 0x4B = 75 * 0.625 ms = 46.875 ms, scan window == interval
    boost::system::error_code ec = commands_->gapSetScanParameters(0x4B, 0x4B, config_.active_scan ? 1 : 0, result);
    if (ec || result != 0) {
        std::stringstream ss;
        ss << "ERROR: set_scan_parameters failed: " << (ec ? ec.message() : "result " + std::to_string(result));
        setStatus(ss.str());
        return false;
    }

    ec = commands_->gapDiscover(config_.discover_mode, result);
    if (ec || result != 0) {
        std::stringstream ss;
        ss << "ERROR: discover failed: " << (ec ? ec.message() : "result " + std::to_string(result));
        setStatus(ss.str());
        return false;
    }

    scanning_ = true;
    return true;
}

bool ScanTUI::stopScan() {
    uint16_t result = 0;
    boost::system::error_code ec = commands_->gapEndProcedure(result);
    if (ec) {
        setStatus("ERROR: end_procedure failed: " + ec.message());
        return false;
    }
    scanning_ = false;
    return true;
}

void ScanTUI::setStatus(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_message_ = message;
}

void ScanTUI::onLog(LogLevel level, const std::string& message) {
    // stderr would tear the curses screen; surface problems in the status bar
    if (level >= LogLevel::WARN) {
        setStatus(std::string(toString(level)) + ": " + message);
    }
}

bool ScanTUI::openLogFile() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);

    std::stringstream filename;
    filename << "bled112_scan_"
             << std::put_time(&tm, "%Y%m%d_%H%M%S")
             << ".csv";

    std::lock_guard<std::mutex> lock(mutex_);
    log_file_.open(filename.str());
    if (!log_file_.is_open()) {
        return false;
    }

    log_file_ << "timestamp_s,address,address_type,rssi,packet_type,bond,data\n";
    return true;
}

void ScanTUI::closeLogFile() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void ScanTUI::logResponse(const GapScanResponse& response) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!log_file_.is_open()) return;

    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        now - log_start_time_).count() / 1000.0;

    log_file_ << std::fixed << std::setprecision(3) << elapsed << ","
              << response.address.address.toString() << ","
              << static_cast<int>(response.address.address_type) << ","
              << static_cast<int>(response.rssi) << ","
              << static_cast<int>(response.packet_type) << ","
              << static_cast<int>(response.bond) << ","
              << toHex(response.data) << "\n";

    log_file_.flush();
}

} // namespace bgapi
