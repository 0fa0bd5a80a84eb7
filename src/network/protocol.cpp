#include "dfsnode/network/protocol.hpp"
#include "dfsnode/common/error.hpp"
#include <boost/endian/conversion.hpp>
#include <algorithm>
#include <cctype>
#include <cstring>

namespace dfsnode {
namespace network {

//==============================================
// FIELD ENCODING
//==============================================

std::vector<std::string> split_fields(const std::string& body) {
  const std::string separator(SEPARATOR);
  std::vector<std::string> fields;

  std::size_t start = 0;
  std::size_t pos = body.find(separator);
  while (pos != std::string::npos) {
    fields.push_back(body.substr(start, pos - start));
    start = pos + separator.size();
    pos = body.find(separator, start);
  }
  fields.push_back(body.substr(start));
  return fields;
}

std::string join_fields(const std::vector<std::string>& fields) {
  std::string body;
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) {
      body += SEPARATOR;
    }
    body += fields[i];
  }
  return body;
}


//==============================================
// REQUESTS
//==============================================

Request parse_request(const std::string& body) {
  std::vector<std::string> fields = split_fields(body);

  Request request;
  request.type_token = fields.front();
  request.type = request_type_from_token(request.type_token);
  request.args.assign(fields.begin() + 1, fields.end());
  return request;
}

RequestType request_type_from_token(const std::string& token) {
  if (token == GET_REQUEST) {
    return RequestType::GET;
  }
  if (token == PUT_REQUEST) {
    return RequestType::PUT;
  }
  if (token == STATUS_REQUEST) {
    return RequestType::STATUS;
  }
  return RequestType::UNKNOWN;
}

const char* request_type_to_string(RequestType type) {
  switch (type) {
    case RequestType::GET:    return "GET";
    case RequestType::PUT:    return "PUT";
    case RequestType::STATUS: return "STATUS";
    default:                  return "UNKNOWN";
  }
}

std::string make_status_request() {
  return STATUS_REQUEST;
}

std::string make_get_request(const std::string& filename) {
  return join_fields({GET_REQUEST, filename});
}

std::string make_file_header(const FileHeader& header, const std::string& type) {
  return join_fields({type, header.filename, std::to_string(header.file_size), header.file_hash});
}

FileHeader parse_file_header(const std::vector<std::string>& args) {
  if (args.size() != 3) {
    throw MalformedRequest("expected filename, size and hash but got " +
                           std::to_string(args.size()) + " fields");
  }

  const std::string& size_str = args[1];
  if (size_str.empty() || size_str.size() > 20 ||
      !std::all_of(size_str.begin(), size_str.end(), [](unsigned char c) { return std::isdigit(c); })) {
    throw MalformedRequest("file size '" + size_str + "' is not a non-negative integer");
  }

  FileHeader header;
  header.filename = args[0];
  try {
    header.file_size = std::stoull(size_str);
  } catch (const std::out_of_range&) {
    throw MalformedRequest("file size '" + size_str + "' is out of range");
  }
  header.file_hash = args[2];
  return header;
}

std::string make_failure_notice(const std::string& message) {
  return join_fields({NOTIFY_FAILURE, message});
}


//==============================================
// FRAME PREFIX
//==============================================

std::vector<uint8_t> encode_frame_length(uint32_t length) {
  uint32_t network_length = boost::endian::native_to_big(length);
  std::vector<uint8_t> prefix(sizeof(network_length));
  std::memcpy(prefix.data(), &network_length, sizeof(network_length));
  return prefix;
}

uint32_t decode_frame_length(const uint8_t* prefix) {
  uint32_t network_length;
  std::memcpy(&network_length, prefix, sizeof(network_length));
  return boost::endian::big_to_native(network_length);
}

} // namespace network
} // namespace dfsnode
