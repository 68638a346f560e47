#include "Device.hpp"

namespace speedwire {

std::string Device::to_string() const {
    return "serial " + std::to_string(serial_) + " (susy " + std::to_string(susy_id_) + ") at " + ip_;
}

} // namespace speedwire
