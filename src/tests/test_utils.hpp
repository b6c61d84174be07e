#ifndef PCLOUD_TEST_UTILS_HPP
#define PCLOUD_TEST_UTILS_HPP

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include "crypto/signing_key.hpp"

// Set logging severity level and configure logging
inline void init_logging() {
    // Remove any existing sinks to prevent duplicates
    boost::log::core::get()->remove_all_sinks();

    // Add console output with formatting
    boost::log::register_simple_formatter_factory<boost::log::trivial::severity_level, char>("Severity");

    auto console_sink = boost::log::add_console_log(
        std::cout,
        boost::log::keywords::format = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%",
        boost::log::keywords::auto_flush = true
    );

    // Set logging level to debug to see all messages
    boost::log::core::get()->set_filter(
        boost::log::trivial::severity >= boost::log::trivial::debug
    );

    // Add commonly used attributes
    boost::log::add_common_attributes();
}

// Fresh directory under the system temp dir, unique per call
inline std::filesystem::path make_test_dir(const std::string& prefix) {
    static int counter = 0;
    auto dir = std::filesystem::temp_directory_path() /
        (prefix + "_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()) +
         "_" + std::to_string(++counter));
    std::filesystem::create_directories(dir);
    return dir;
}

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

// Number of entries directly inside dir
inline size_t count_entries(const std::filesystem::path& dir) {
    if (!std::filesystem::exists(dir)) {
        return 0;
    }
    return static_cast<size_t>(std::distance(std::filesystem::directory_iterator(dir),
                                             std::filesystem::directory_iterator()));
}

// Same signature with the group order L added to its scalar S. The result is a
// non-canonical encoding of an equally valid equation, which strict verification rejects.
inline pcloud::crypto::Signature with_malleated_scalar(pcloud::crypto::Signature signature) {
    // L = 2^252 + 27742317777372353535851937790883648493, little endian
    static const uint8_t group_order[32] = {
        0xed, 0xd3, 0xf5, 0x5c, 0x1a, 0x63, 0x12, 0x58, 0xd6, 0x9c, 0xf7, 0xa2, 0xde, 0xf9, 0xde, 0x14,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x10};
    unsigned carry = 0;
    for (size_t i = 0; i < 32; ++i) {
        unsigned sum = signature[32 + i] + group_order[i] + carry;
        signature[32 + i] = static_cast<uint8_t>(sum & 0xff);
        carry = sum >> 8;
    }
    return signature;
}

#endif // PCLOUD_TEST_UTILS_HPP
