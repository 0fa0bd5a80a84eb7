#ifndef DFSNODE_NETWORK_PROTOCOL_HPP
#define DFSNODE_NETWORK_PROTOCOL_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace dfsnode {
namespace network {

// Size of every chunked socket read and write
constexpr std::size_t BUFFER_SIZE = 1024;
// Upper bound for a single control frame
constexpr uint32_t MAX_FRAME_SIZE = 64 * 1024;

constexpr const char* SEPARATOR = "<>";

// Request types
constexpr const char* GET_REQUEST = "<GET_REQUEST>";
constexpr const char* PUT_REQUEST = "<PUT_REQUEST>";
constexpr const char* STATUS_REQUEST = "<STATUS_REQUEST>";

// Responses
constexpr const char* SERVER_AVAILABLE_CODE = "200";
constexpr const char* TRANSFER_SUCCESSFUL_CODE = "TRANSFER_SUCCESSFUL";
constexpr const char* NOTIFY_SUCCESS = "<NOTIFY_SUCCESS>";
constexpr const char* NOTIFY_FAILURE = "<NOTIFY_FAILURE>";
constexpr const char* UNSUPPORTED_REQUEST_MESSAGE = "Request type not supported yet!";

enum class RequestType {
  GET,
  PUT,
  STATUS,
  UNKNOWN
};

// Parsed request: type token plus its arguments
struct Request {
  RequestType type = RequestType::UNKNOWN;
  std::string type_token;
  std::vector<std::string> args;
};

// Header describing a file that follows on the stream
struct FileHeader {
  std::string filename;
  uint64_t file_size = 0;
  std::string file_hash;
};


// ---- FIELD ENCODING ----
// Splits a frame body on SEPARATOR, keeping empty fields
std::vector<std::string> split_fields(const std::string& body);
// Joins fields with SEPARATOR
std::string join_fields(const std::vector<std::string>& fields);


// ---- REQUESTS ----
Request parse_request(const std::string& body);
RequestType request_type_from_token(const std::string& token);
const char* request_type_to_string(RequestType type);

std::string make_status_request();
std::string make_get_request(const std::string& filename);
// <type><>filename<>size<>hash, type is PUT_REQUEST unless overridden
std::string make_file_header(const FileHeader& header, const std::string& type = PUT_REQUEST);
// Parses the PUT-shaped argument list (filename, size, hash); throws
// MalformedRequest on a wrong arity or a non-numeric size
FileHeader parse_file_header(const std::vector<std::string>& args);

std::string make_failure_notice(const std::string& message);


// ---- FRAME PREFIX ----
// 4-byte big-endian length prefix
std::vector<uint8_t> encode_frame_length(uint32_t length);
uint32_t decode_frame_length(const uint8_t* prefix);

} // namespace network
} // namespace dfsnode

#endif // DFSNODE_NETWORK_PROTOCOL_HPP
