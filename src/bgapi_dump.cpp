#include "bled112_driver/bgapi_serial.hpp"
#include "bled112_driver/frame_codec.hpp"
#include "bled112_driver/types.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <vector>

// Raw protocol dump: pokes the dongle with system_hello / system_get_info and
// prints every byte that comes back, split into frames.

std::atomic<bool> g_shutdown_requested(false);

void signalHandler(int /*signum*/) {
    g_shutdown_requested = true;
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [OPTIONS]\n"
              << "\n"
              << "BGAPI protocol dump for BLED112 dongles.\n"
              << "\n"
              << "Options:\n"
              << "  -d, --device DEVICE   Serial device (default: /dev/ttyACM0)\n"
              << "  -b, --baud RATE       Baud rate (default: 115200)\n"
              << "  -t, --time SECONDS    Listen time after the probes (default: 5, 0 = until Ctrl+C)\n"
              << "  --no-probe            Only listen, send nothing\n"
              << "  -h, --help            Show this help message\n";
}

static void printFrame(const bgapi::Frame& frame) {
    const bgapi::FrameHeader& hdr = frame.header;
    std::cout << "  " << (hdr.messageKind() == bgapi::MessageKind::EVENT ? "EVT" : "RSP")
              << " class=" << static_cast<int>(hdr.category)
              << " id=" << static_cast<int>(hdr.subtype)
              << " tech=" << static_cast<int>(hdr.technologyType())
              << " len=" << hdr.payloadLength();
    if (!frame.payload.empty()) {
        std::cout << " payload: " << bgapi::toHex(frame.payload);
    }
    std::cout << std::endl;
}

static bool sendProbe(bgapi::BgapiSerial& serial, uint8_t category, uint8_t command, const char* name) {
    bgapi::Bytes request = bgapi::encodeFrame(bgapi::MessageKind::RESPONSE, category, command, {});
    std::cout << "TX " << name << ": " << bgapi::toHex(request) << std::endl;

    boost::system::error_code ec = serial.write(request);
    if (!ec) {
        ec = serial.flush();
    }
    if (ec) {
        std::cerr << "Write failed: " << ec.message() << std::endl;
        return false;
    }
    return true;
}

// Read and dump for the given duration; 0 means until interrupted
static void listen(bgapi::BgapiSerial& serial, bgapi::FrameReader& framer, int seconds) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
    std::vector<uint8_t> buffer(128);

    while (!g_shutdown_requested) {
        if (seconds > 0 && std::chrono::steady_clock::now() >= deadline) {
            break;
        }

        boost::system::error_code ec;
        size_t n = serial.read(buffer.data(), buffer.size(), 100, ec);
        if (ec) {
            std::cerr << "Read failed: " << ec.message() << std::endl;
            return;
        }
        if (n == 0) {
            continue;
        }

        std::cout << "RX " << n << " bytes: "
                  << bgapi::toHex(bgapi::Bytes(buffer.begin(), buffer.begin() + n)) << std::endl;

        framer.append(buffer.data(), n);
        while (framer.hasCompleteFrame()) {
            printFrame(framer.takeFrame());
        }
    }

    if (framer.bufferedBytes() > 0) {
        std::cout << "(" << framer.bufferedBytes() << " bytes of an incomplete frame left over)" << std::endl;
    }
}

int main(int argc, char** argv) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    bgapi::BgapiSerial::Config config;
    int listen_seconds = 5;
    bool probe = true;

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return EXIT_SUCCESS;
        }
        else if ((strcmp(argv[i], "-d") == 0 || strcmp(argv[i], "--device") == 0) && i + 1 < argc) {
            config.device = argv[++i];
        }
        else if ((strcmp(argv[i], "-b") == 0 || strcmp(argv[i], "--baud") == 0) && i + 1 < argc) {
            config.baudrate = static_cast<unsigned int>(std::strtoul(argv[++i], nullptr, 10));
        }
        else if ((strcmp(argv[i], "-t") == 0 || strcmp(argv[i], "--time") == 0) && i + 1 < argc) {
            listen_seconds = std::atoi(argv[++i]);
        }
        else if (strcmp(argv[i], "--no-probe") == 0) {
            probe = false;
        }
        else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            std::cerr << "Use --help for usage information.\n";
            return EXIT_FAILURE;
        }
    }

    std::cout << "=== BGAPI Protocol Dump ===" << std::endl;
    std::cout << "Device: " << config.device << std::endl;
    std::cout << "Baudrate: " << config.baudrate << std::endl;

    bgapi::BgapiSerial serial(config);
    if (!serial.connect()) {
        std::cerr << "Failed to connect: " << serial.getLastError() << std::endl;
        return EXIT_FAILURE;
    }
    std::cout << "Connected!\n" << std::endl;

    bgapi::FrameReader framer;

    if (probe) {
        // system_hello (0, 1), then system_get_info (0, 8)
        if (!sendProbe(serial, 0, 1, "system_hello")) {
            return EXIT_FAILURE;
        }
        listen(serial, framer, 1);
        if (!sendProbe(serial, 0, 8, "system_get_info")) {
            return EXIT_FAILURE;
        }
    }

    listen(serial, framer, listen_seconds);

    serial.disconnect();
    return EXIT_SUCCESS;
}
