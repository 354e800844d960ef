#include "bled112_driver/scan_tui.hpp"
#include <iostream>
#include <cstdlib>
#include <csignal>
#include <atomic>
#include <cstring>

// Global flag for signal handling
std::atomic<bool> g_shutdown_requested(false);

void signalHandler(int /*signum*/) {
    g_shutdown_requested = true;
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [OPTIONS]\n"
              << "\n"
              << "BLED112 Scanner\n"
              << "Discovers nearby BLE advertisers through a BLED112 USB dongle.\n"
              << "\n"
              << "Options:\n"
              << "  -d, --device DEVICE  Dongle device (default: /dev/ttyACM0)\n"
              << "  -b, --baud RATE      Baud rate (default: 115200)\n"
              << "  -m, --mode MODE      Discover mode: 0=limited, 1=generic, 2=observation (default: 1)\n"
              << "  --passive            Passive scanning (no scan requests)\n"
              << "  -h, --help           Show this help message\n"
              << "\n"
              << "Examples:\n"
              << "  " << program << "\n"
              << "  " << program << " -d /dev/ttyACM1 --passive\n"
              << "\n"
              << "Controls:\n"
              << "  S   - Start/stop scanning\n"
              << "  M   - Cycle discover mode\n"
              << "  A   - Toggle active/passive scanning\n"
              << "  C   - Clear table\n"
              << "  L   - Toggle CSV logging\n"
              << "  ?   - Show help overlay\n"
              << "  Q   - Quit\n";
}

int main(int argc, char** argv) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    bgapi::ScanTUI::Config config;

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return EXIT_SUCCESS;
        }
        else if ((strcmp(argv[i], "-d") == 0 || strcmp(argv[i], "--device") == 0) && i + 1 < argc) {
            config.serial.device = argv[++i];
        }
        else if ((strcmp(argv[i], "-b") == 0 || strcmp(argv[i], "--baud") == 0) && i + 1 < argc) {
            config.serial.baudrate = static_cast<unsigned int>(std::strtoul(argv[++i], nullptr, 10));
        }
        else if ((strcmp(argv[i], "-m") == 0 || strcmp(argv[i], "--mode") == 0) && i + 1 < argc) {
            int mode = std::atoi(argv[++i]);
            if (mode < 0 || mode > 2) {
                std::cerr << "Invalid discover mode: " << mode << "\n";
                return EXIT_FAILURE;
            }
            config.discover_mode = static_cast<uint8_t>(mode);
        }
        else if (strcmp(argv[i], "--passive") == 0) {
            config.active_scan = false;
        }
        else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            std::cerr << "Use --help for usage information.\n";
            return EXIT_FAILURE;
        }
    }

    try {
        bgapi::ScanTUI tui(config);
        tui.run(&g_shutdown_requested);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
