#include "bulbs/core/Error.hpp"

namespace bulbs::core {

namespace {

class BulbsCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "bulbs"; }

    std::string message(int value) const override {
        switch (static_cast<errc>(value)) {
            case errc::invalid_command:    return "invalid command";
            case errc::device_unreachable: return "device unreachable";
            case errc::protocol_error:     return "unexpected device response";
            case errc::discovery_timeout:  return "no devices answered the discovery probe";
            case errc::config_error:       return "invalid device list";
        }
        return "unknown bulbs error";
    }
};

} // namespace

const std::error_category& bulbs_category() noexcept {
    static const BulbsCategory category;
    return category;
}

std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), bulbs_category()};
}

} // namespace bulbs::core
