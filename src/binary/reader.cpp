#include "frontier/binary/reader.hpp"
#include <cstring>
#include <stdexcept>

namespace Frontier::Binary {

namespace {
template <typename T>
T read_be(const std::vector<uint8_t>& data, size_t& offset) {
    T value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        value = static_cast<T>((value << 8) | data[offset + i]);
    }
    offset += sizeof(T);
    return value;
}
}  // namespace

void Reader::require(size_t length) const {
    if (length > data_.size() - offset_) {
        throw std::out_of_range("Attempt to read past end of buffer.");
    }
}

uint8_t Reader::read_uint8() {
    require(1);
    return data_[offset_++];
}

uint32_t Reader::read_uint32() {
    require(sizeof(uint32_t));
    return read_be<uint32_t>(data_, offset_);
}

uint64_t Reader::read_uint64() {
    require(sizeof(uint64_t));
    return read_be<uint64_t>(data_, offset_);
}

int64_t Reader::read_int64() {
    return static_cast<int64_t>(read_uint64());
}

double Reader::read_double() {
    uint64_t bits = read_uint64();
    double   value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

bool Reader::read_bool() {
    return read_uint8() != 0;
}

std::string Reader::read_raw(size_t length) {
    require(length);
    std::string s(reinterpret_cast<const char*>(data_.data() + offset_), length);
    offset_ += length;
    return s;
}

std::string Reader::read_bytes() {
    uint32_t length = read_uint32();
    return read_raw(length);
}

}  // namespace Frontier::Binary
