#ifndef EGRESS_BINARY_READER_HPP
#define EGRESS_BINARY_READER_HPP

#include <cstdint>
#include <stdexcept>
#include <vector>

namespace Egress::Binary {
class Reader {
public:
    explicit Reader(const std::vector<uint8_t>& data) : data_(data), offset_(0) {
    }

    uint8_t  read_uint8();
    uint16_t read_uint16_be();
    void     skip(size_t count);

    bool eof() const {
        return offset_ >= data_.size();
    }
    size_t offset() const {
        return offset_;
    }

private:
    const std::vector<uint8_t>& data_;
    size_t                      offset_;

    void require(size_t count) const;
};
}  // namespace Egress::Binary

#endif  // EGRESS_BINARY_READER_HPP
