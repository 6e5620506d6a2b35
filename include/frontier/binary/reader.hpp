#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace Frontier::Binary {

// Reads fields written by Writer. Throws std::out_of_range on truncation.
class Reader {
public:
    explicit Reader(const std::vector<uint8_t>& data) : data_(data), offset_(0) {
    }

    uint8_t     read_uint8();
    uint32_t    read_uint32();
    uint64_t    read_uint64();
    int64_t     read_int64();
    double      read_double();
    bool        read_bool();
    std::string read_raw(size_t length);
    std::string read_bytes();

    bool eof() const {
        return offset_ >= data_.size();
    }
    size_t offset() const {
        return offset_;
    }
    size_t remaining() const {
        return data_.size() - offset_;
    }

private:
    const std::vector<uint8_t>& data_;
    size_t                      offset_;

    void require(size_t length) const;
};

}  // namespace Frontier::Binary
