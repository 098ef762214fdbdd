#ifndef EGRESS_BINARY_WRITER_HPP
#define EGRESS_BINARY_WRITER_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace Egress::Binary {
class Writer {
public:
    explicit Writer(std::vector<uint8_t>& data) : data_(data) {
    }

    void write_uint8(uint8_t value);
    void write_uint16_be(uint16_t value);
    void write_string(const std::string& value);

    template <size_t N>
    void write_bytes(const std::array<uint8_t, N>& bytes) {
        data_.insert(data_.end(), bytes.begin(), bytes.end());
    }

private:
    std::vector<uint8_t>& data_;
};
}  // namespace Egress::Binary

#endif  // EGRESS_BINARY_WRITER_HPP
