#ifndef PCLOUD_BYTE_ORDER_HPP
#define PCLOUD_BYTE_ORDER_HPP

#include <cstdint>
#include <array>
#include <algorithm>
#include <cstring>
#include <vector>

namespace pcloud::crypto {
class ByteOrder {
public:
    // Detects if system is little endian
    static bool isLittleEndian() {
        static const uint16_t value = 0x0001;
        return *reinterpret_cast<const uint8_t*>(&value) == 0x01;
    }

    // Converts host byte order to little endian (canonical encodings are little endian)
    template<typename T>
    static T toLittleEndian(T value) {
        if (!isLittleEndian()) {
            return byteSwap(value);
        }
        return value;
    }

    // Converts little endian back to host byte order
    template<typename T>
    static T fromLittleEndian(T value) {
        return toLittleEndian(value);
    }

    // Appends the fixed-width little endian representation of value
    template<typename T>
    static void appendLittleEndian(std::vector<uint8_t>& out, T value) {
        T le = toLittleEndian(value);
        std::array<uint8_t, sizeof(T)> bytes;
        std::memcpy(bytes.data(), &le, sizeof(T));
        out.insert(out.end(), bytes.begin(), bytes.end());
    }

private:
    // Generic byte swap implementation that works for any size T
    template<typename T>
    static T byteSwap(T value) {
        std::array<uint8_t, sizeof(T)> bytes;
        std::memcpy(bytes.data(), &value, sizeof(T));
        std::reverse(bytes.begin(), bytes.end());
        T result;
        std::memcpy(&result, bytes.data(), sizeof(T));
        return result;
    }
};

} // namespace pcloud::crypto

#endif // PCLOUD_BYTE_ORDER_HPP
