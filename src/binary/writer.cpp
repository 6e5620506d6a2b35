#include "frontier/binary/writer.hpp"
#include <cstring>
#include <limits>
#include <stdexcept>

namespace Frontier::Binary {

namespace {
template <typename T>
void write_be(std::vector<uint8_t>& data, T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
        data.push_back(static_cast<uint8_t>((value >> ((sizeof(T) - 1 - i) * 8)) & 0xFF));
    }
}
}  // namespace

void Writer::write_uint8(uint8_t value) {
    data_.push_back(value);
}

void Writer::write_uint32(uint32_t value) {
    write_be(data_, value);
}

void Writer::write_uint64(uint64_t value) {
    write_be(data_, value);
}

void Writer::write_int64(int64_t value) {
    write_be(data_, static_cast<uint64_t>(value));
}

void Writer::write_double(double value) {
    static_assert(sizeof(double) == sizeof(uint64_t));
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    write_be(data_, bits);
}

void Writer::write_bool(bool value) {
    data_.push_back(value ? 1 : 0);
}

void Writer::write_raw(std::string_view value) {
    data_.insert(data_.end(), value.begin(), value.end());
}

void Writer::write_bytes(std::string_view value) {
    if (value.size() > std::numeric_limits<uint32_t>::max())
        throw std::length_error("Field too large for snapshot");
    write_uint32(static_cast<uint32_t>(value.size()));
    write_raw(value);
}

}  // namespace Frontier::Binary
