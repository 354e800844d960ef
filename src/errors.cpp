#include "bled112_driver/errors.hpp"
#include <string>

namespace bgapi {

namespace {

class BgapiCategory : public boost::system::error_category {
public:
    const char* name() const noexcept override {
        return "bgapi";
    }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::success:                 return "success";
            case errc::timeout:                 return "operation timed-out";
            case errc::protocol_mismatch:       return "received incorrect response type";
            case errc::unsolicited_response:    return "response received with no pending operation";
            case errc::transport_write_failure: return "transport write failed";
            case errc::transport_read_failure:  return "transport read failed";
            case errc::not_connected:           return "not connected";
            case errc::aborted:                 return "operation aborted";
        }
        return "unknown bgapi error";
    }
};

} // namespace

const boost::system::error_category& bgapi_category() noexcept {
    static const BgapiCategory category;
    return category;
}

boost::system::error_code make_error_code(errc e) noexcept {
    return boost::system::error_code(static_cast<int>(e), bgapi_category());
}

} // namespace bgapi
