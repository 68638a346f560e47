#include "ProtoError.hpp"

#include <string>

namespace speedwire::proto {

namespace {

class ProtoCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "speedwire.proto"; }

    std::string message(int ev) const override {
        switch (static_cast<proto_errc>(ev)) {
            case proto_errc::too_short:       return "datagram too short";
            case proto_errc::bad_magic:       return "missing SMA signature";
            case proto_errc::missing_group:   return "missing group tag";
            case proto_errc::truncated_entry: return "truncated entry";
            case proto_errc::missing_end:     return "missing end marker";
            default:                          return "unknown speedwire error";
        }
    }
};

} // namespace

const std::error_category& proto_category() noexcept {
    static ProtoCategory category;
    return category;
}

} // namespace speedwire::proto
