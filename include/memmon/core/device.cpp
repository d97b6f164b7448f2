#include "memmon/core/device.hpp"

#include <cctype>
#include <stdexcept>

namespace memmon {

    DeviceRef DeviceRef::parse(const std::string& text) {
        const auto colon = text.find(':');
        std::string type = text.substr(0, colon);
        if (type.empty()) {
            throw std::invalid_argument("device reference has no type: '" + text + "'");
        }

        if (colon == std::string::npos) {
            return DeviceRef(std::move(type));
        }

        const std::string idx = text.substr(colon + 1);
        if (idx.empty() || idx.size() > 9) {
            throw std::invalid_argument("invalid device index in '" + text + "'");
        }
        for (const char c : idx) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw std::invalid_argument("invalid device index in '" + text + "'");
            }
        }
        return DeviceRef(std::move(type), std::stoi(idx));
    }

    std::string DeviceRef::toString() const {
        if (!index) return type;
        return type + ":" + std::to_string(*index);
    }

} // namespace memmon
