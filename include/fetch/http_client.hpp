#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "fetch/fetch_error.hpp"

namespace mvault {
namespace fetch {

using Bytes = std::vector<uint8_t>;

// Pull-style reader over a response body
class ByteStreamReader {
public:
  virtual ~ByteStreamReader() = default;

  // Replaces out with the next batch of body bytes. Returns false once the
  // body is exhausted. Throws FetchFailedError on transport errors.
  virtual bool read_some(Bytes& out) = 0;
};

class HttpResponse {
public:
  virtual ~HttpResponse() = default;

  virtual int status() const = 0;
  bool ok() const { return status() >= 200 && status() < 300; }
  // Declared Content-Length, if the server sent one
  virtual std::optional<std::uint64_t> content_length() const = 0;
  // Streaming access to the body, or nullptr if the transport cannot stream
  virtual ByteStreamReader* reader() = 0;
  // Reads the remaining body into memory
  virtual Bytes read_all() = 0;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;

  // Issues a GET. Returns the response once headers are available; the
  // status is not checked here. Throws FetchFailedError when no response
  // could be obtained at all.
  virtual std::unique_ptr<HttpResponse> get(const std::string& url) = 0;
};

} // namespace fetch
} // namespace mvault
