#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace Frontier::Binary {

// Appends big-endian fields to a caller-owned buffer.
class Writer {
public:
    explicit Writer(std::vector<uint8_t>& data) : data_(data) {
    }

    void write_uint8(uint8_t value);
    void write_uint32(uint32_t value);
    void write_uint64(uint64_t value);
    void write_int64(int64_t value);
    void write_double(double value);
    void write_bool(bool value);

    // Raw bytes, no length.
    void write_raw(std::string_view value);
    // uint32 length followed by the bytes.
    void write_bytes(std::string_view value);

    size_t size() const {
        return data_.size();
    }

private:
    std::vector<uint8_t>& data_;
};

}  // namespace Frontier::Binary
