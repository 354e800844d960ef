#ifndef BLED112_DRIVER_TRANSPORT_HPP
#define BLED112_DRIVER_TRANSPORT_HPP

#include "types.hpp"
#include <boost/system/error_code.hpp>
#include <cstddef>
#include <cstdint>

namespace bgapi {

/**
 * @brief Byte-oriented duplex channel under the driver
 *
 * No message framing is assumed. read() is only ever called from the
 * driver's reader thread, write()/flush() only from its writer thread.
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * @brief Read whatever is available, waiting at most timeout_ms
     * @return Number of bytes stored in buffer; 0 on timeout or error
     */
    virtual size_t read(uint8_t* buffer, size_t len, uint32_t timeout_ms,
                        boost::system::error_code& ec) = 0;

    virtual boost::system::error_code write(const Bytes& data) = 0;

    // Block until written bytes have left the host
    virtual boost::system::error_code flush() = 0;
};

} // namespace bgapi

#endif // BLED112_DRIVER_TRANSPORT_HPP
