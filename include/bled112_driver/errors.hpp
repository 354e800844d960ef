#ifndef BLED112_DRIVER_ERRORS_HPP
#define BLED112_DRIVER_ERRORS_HPP

#include <boost/system/error_code.hpp>
#include <type_traits>

namespace bgapi {

/**
 * @brief Error conditions reported by the driver core
 *
 * Values live in their own error category so they can travel in a
 * boost::system::error_code next to transport (errno / asio) errors.
 */
enum class errc {
    success = 0,
    timeout = 1,               // No response within the operation timeout
    protocol_mismatch,         // Response class/command differs from the request
    unsolicited_response,      // Response frame with nothing pending
    transport_write_failure,
    transport_read_failure,
    not_connected,             // Driver not started, or already stopped
    aborted                    // Operation dropped by driver shutdown
};

const boost::system::error_category& bgapi_category() noexcept;

boost::system::error_code make_error_code(errc e) noexcept;

} // namespace bgapi

namespace boost {
namespace system {

template <>
struct is_error_code_enum<bgapi::errc> : std::true_type {};

} // namespace system
} // namespace boost

#endif // BLED112_DRIVER_ERRORS_HPP
