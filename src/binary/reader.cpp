#include "reader.hpp"

namespace Egress::Binary {

void Reader::require(size_t count) const {
    if (offset_ + count > data_.size()) {
        throw std::out_of_range("Attempt to read past end of buffer.");
    }
}

uint8_t Reader::read_uint8() {
    require(1);
    return data_[offset_++];
}

uint16_t Reader::read_uint16_be() {
    require(2);
    uint16_t value = static_cast<uint16_t>((data_[offset_] << 8) | data_[offset_ + 1]);
    offset_ += 2;
    return value;
}

void Reader::skip(size_t count) {
    require(count);
    offset_ += count;
}
}  // namespace Egress::Binary
