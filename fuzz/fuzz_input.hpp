// FuzzInput: structured reads over raw fuzz data
#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

class FuzzInput {
public:
    FuzzInput(const uint8_t *data, size_t size) : data_(data), size_(size), offset_(0) {}

    std::string read_string(size_t len) {
        if (offset_ + len > size_) {
            return "";
        }
        std::string result(reinterpret_cast<const char*>(data_ + offset_), len);
        offset_ += len;
        return result;
    }

    std::string read_remaining() {
        if (offset_ >= size_) {
            return "";
        }
        std::string result(reinterpret_cast<const char*>(data_ + offset_), size_ - offset_);
        offset_ = size_;
        return result;
    }

    template<typename T>
    T read() {
        if (offset_ + sizeof(T) > size_) {
            return T{};
        }
        T value;
        memcpy(&value, data_ + offset_, sizeof(T));
        offset_ += sizeof(T);
        return value;
    }

    bool has_bytes(size_t n) const {
        return offset_ + n <= size_;
    }

private:
    const uint8_t *data_;
    size_t size_;
    size_t offset_;
};
