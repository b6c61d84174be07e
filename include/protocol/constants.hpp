#ifndef PCLOUD_PROTOCOL_CONSTANTS_HPP
#define PCLOUD_PROTOCOL_CONSTANTS_HPP

#include <cstddef>
#include <cstdint>

namespace pcloud {
namespace protocol {

// Request targets
constexpr const char* METHOD_UPLOAD = "/upload";
constexpr const char* METHOD_DOWNLOAD = "/download";

// Header names carrying request metadata
constexpr const char* PARAM_FILENAME = "filename";
constexpr const char* PARAM_PUBKEY = "pubkey";
constexpr const char* PARAM_TIME = "time";
constexpr const char* PARAM_REQUEST_SIGNATURE = "request-signature";
constexpr const char* PARAM_FILE_SIGNATURE = "file-signature";

// Maximum allowed distance in seconds between request time and verification time
constexpr std::uint64_t MAX_TIME_DIFF = 60;

// Suffix appended to the payload path to get the signature path
constexpr const char* SIGNATURE_EXTENSION = ".sig";

// Longest filename component accepted, leaving room for the signature suffix within NAME_MAX
constexpr std::size_t MAX_NAME_COMPONENT_LENGTH = 251;

} // namespace protocol
} // namespace pcloud

#endif // PCLOUD_PROTOCOL_CONSTANTS_HPP
