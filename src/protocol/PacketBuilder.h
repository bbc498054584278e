#ifndef YAPP_PACKET_BUILDER_H
#define YAPP_PACKET_BUILDER_H

#include "yapp_packet.h"
#include <etl/vector.h>
#include <etl/string.h>
#include <etl/string_view.h>
#include <etl/to_string.h>
#include <etl/algorithm.h>

namespace yapp {

/**
 * @brief Fluent interface for building YAPP packet payloads.
 *
 * Writes are bounded by the payload capacity; anything that does not fit is
 * dropped and reported through overflowed().
 */
class PacketBuilder {
public:
    explicit PacketBuilder(etl::ivector<uint8_t>& payload)
        : _payload(payload), _overflowed(false) {
        _payload.clear();
    }

    PacketBuilder& add(uint8_t byte) {
        if (!_payload.full()) {
            _payload.push_back(byte);
        } else {
            _overflowed = true;
        }
        return *this;
    }

    PacketBuilder& add(const uint8_t* data, size_t len) {
        const size_t available = _payload.capacity() - _payload.size();
        const size_t to_copy = etl::min(len, available);
        if (to_copy > 0) {
            _payload.insert(_payload.end(), data, data + to_copy);
        }
        if (to_copy < len) {
            _overflowed = true;
        }
        return *this;
    }

    PacketBuilder& add_text(etl::string_view str) {
        return add(reinterpret_cast<const uint8_t*>(str.data()), str.length());
    }

    // NUL-terminated field, as used by Header and Resume payloads.
    PacketBuilder& add_field(etl::string_view str) {
        add_text(str);
        return add(uint8_t{0});
    }

    PacketBuilder& add_decimal_field(uint32_t value) {
        etl::string<10> digits;
        etl::to_string(value, digits);
        return add_field(etl::string_view(digits.data(), digits.size()));
    }

    size_t size() const { return _payload.size(); }
    const uint8_t* data() const { return _payload.data(); }
    bool overflowed() const { return _overflowed; }

private:
    etl::ivector<uint8_t>& _payload;
    bool _overflowed;
};

} // namespace yapp

#endif // YAPP_PACKET_BUILDER_H
