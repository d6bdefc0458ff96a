#include "fetch/beast_http_client.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/log/trivial.hpp>

namespace mvault {
namespace fetch {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

using PlainStream = beast::tcp_stream;
using TlsStream = beast::ssl_stream<beast::tcp_stream>;

// Runs the operation queued on io until it completes. Beast stream deadlines
// only apply to asynchronous operations, expiry surfaces as beast::error::timeout.
void run_to_completion(asio::io_context& io) {
  io.restart();
  io.run();
}

std::string describe(const beast::error_code& ec) {
  if (ec == beast::error::timeout) {
    return "timed out";
  }
  return ec.message();
}

// Response that owns its connection. Also serves as the body reader.
class BeastResponseBase : public HttpResponse, public ByteStreamReader {
public:
  virtual std::string location() const = 0;
};

template <class Stream>
class BeastResponse : public BeastResponseBase {
public:
  BeastResponse(std::unique_ptr<asio::io_context> io,
                std::unique_ptr<Stream> stream,
                std::shared_ptr<asio::ssl::context> ssl_context,
                std::string url,
                const BeastHttpClient::Options& options)
    : io_(std::move(io))
    , ssl_context_(std::move(ssl_context))
    , stream_(std::move(stream))
    , url_(std::move(url))
    , timeout_(options.timeout)
    , buffer_size_(options.read_buffer_size) {
    // Model files are far larger than the default body limit
    parser_.body_limit((std::numeric_limits<std::uint64_t>::max)());
  }

  ~BeastResponse() override {
    beast::get_lowest_layer(*stream_).close();
  }

  void read_header() {
    beast::error_code ec;
    beast::get_lowest_layer(*stream_).expires_after(timeout_);
    http::async_read_header(*stream_, buffer_, parser_,
                            [&ec](beast::error_code result, std::size_t) { ec = result; });
    run_to_completion(*io_);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "HTTP client: Failed to read response header from " << url_ << ": " << describe(ec);
      throw FetchFailedError(url_, "reading header: " + describe(ec));
    }
    BOOST_LOG_TRIVIAL(debug) << "HTTP client: " << url_ << " answered " << status();
  }

  int status() const override {
    return static_cast<int>(parser_.get().result_int());
  }

  std::optional<std::uint64_t> content_length() const override {
    auto length = parser_.content_length();
    if (length) {
      return *length;
    }
    return std::nullopt;
  }

  ByteStreamReader* reader() override {
    return this;
  }

  Bytes read_all() override {
    Bytes body;
    if (auto length = content_length()) {
      body.reserve(static_cast<std::size_t>(*length));
    }
    Bytes batch;
    while (read_some(batch)) {
      body.insert(body.end(), batch.begin(), batch.end());
    }
    return body;
  }

  bool read_some(Bytes& out) override {
    while (!parser_.is_done()) {
      out.resize(buffer_size_);
      parser_.get().body().data = out.data();
      parser_.get().body().size = out.size();

      beast::error_code ec;
      beast::get_lowest_layer(*stream_).expires_after(timeout_);
      http::async_read(*stream_, buffer_, parser_,
                       [&ec](beast::error_code result, std::size_t) { ec = result; });
      run_to_completion(*io_);
      if (ec == http::error::need_buffer) {
        ec = {};
      }
      if (ec) {
        BOOST_LOG_TRIVIAL(error) << "HTTP client: Body read from " << url_ << " failed: " << describe(ec);
        throw FetchFailedError(url_, "reading body: " + describe(ec));
      }

      out.resize(out.size() - parser_.get().body().size);
      if (!out.empty()) {
        return true;
      }
    }
    out.clear();
    return false;
  }

  std::string location() const override {
    auto value = parser_.get()[http::field::location];
    return std::string(value.data(), value.size());
  }

private:
  std::unique_ptr<asio::io_context> io_;
  std::shared_ptr<asio::ssl::context> ssl_context_;
  std::unique_ptr<Stream> stream_;
  std::string url_;
  std::chrono::seconds timeout_;
  std::size_t buffer_size_;
  beast::flat_buffer buffer_;
  http::response_parser<http::buffer_body> parser_;
};

bool is_redirect(int status) {
  return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

std::string default_port(const std::string& scheme) {
  return scheme == "https" ? "443" : "80";
}

std::string url_string(const ParsedUrl& url) {
  std::string result = url.scheme + "://" + url.host;
  if (url.port != default_port(url.scheme)) {
    result += ":" + url.port;
  }
  return result + url.target;
}

http::request<http::empty_body> make_request(const ParsedUrl& url, const std::string& user_agent) {
  http::request<http::empty_body> request{http::verb::get, url.target, 11};
  std::string host = url.host;
  if (url.port != default_port(url.scheme)) {
    host += ":" + url.port;
  }
  request.set(http::field::host, host);
  request.set(http::field::user_agent, user_agent);
  request.set(http::field::accept, "*/*");
  return request;
}

template <class Stream>
std::unique_ptr<BeastResponseBase> send_request(std::unique_ptr<asio::io_context> io,
                                                std::unique_ptr<Stream> stream,
                                                std::shared_ptr<asio::ssl::context> ssl_context,
                                                const ParsedUrl& url,
                                                const BeastHttpClient::Options& options) {
  const std::string full_url = url_string(url);
  auto request = make_request(url, options.user_agent);

  beast::error_code ec;
  beast::get_lowest_layer(*stream).expires_after(options.timeout);
  http::async_write(*stream, request, [&ec](beast::error_code result, std::size_t) { ec = result; });
  run_to_completion(*io);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "HTTP client: Failed to send request to " << full_url << ": " << describe(ec);
    throw FetchFailedError(full_url, "sending request: " + describe(ec));
  }

  auto response = std::make_unique<BeastResponse<Stream>>(
    std::move(io), std::move(stream), std::move(ssl_context), full_url, options);
  response->read_header();
  return response;
}

void connect_stream(asio::io_context& io,
                    beast::tcp_stream& stream,
                    const tcp::resolver::results_type& endpoints,
                    const ParsedUrl& url,
                    std::chrono::seconds timeout) {
  beast::error_code ec;
  stream.expires_after(timeout);
  stream.async_connect(endpoints, [&ec](beast::error_code result, const tcp::endpoint&) { ec = result; });
  run_to_completion(io);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "HTTP client: Failed to connect to " << url.host << ":" << url.port << ": " << describe(ec);
    throw FetchFailedError(url_string(url), "connecting: " + describe(ec));
  }
}

std::unique_ptr<BeastResponseBase> open(const ParsedUrl& url,
                                        const BeastHttpClient::Options& options,
                                        const std::shared_ptr<asio::ssl::context>& ssl_context) {
  const std::string full_url = url_string(url);
  BOOST_LOG_TRIVIAL(debug) << "HTTP client: Connecting to " << url.host << ":" << url.port;

  auto io = std::make_unique<asio::io_context>();
  tcp::resolver resolver(*io);
  beast::error_code ec;
  auto endpoints = resolver.resolve(url.host, url.port, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "HTTP client: Failed to resolve " << url.host << ": " << ec.message();
    throw FetchFailedError(full_url, "resolving host: " + ec.message());
  }

  if (url.scheme == "https") {
    auto stream = std::make_unique<TlsStream>(*io, *ssl_context);

    // SNI and certificate host name check
    if (!SSL_set_tlsext_host_name(stream->native_handle(), url.host.c_str())) {
      throw FetchFailedError(full_url, "setting TLS server name");
    }
    stream->set_verify_callback(asio::ssl::host_name_verification(url.host));

    connect_stream(*io, beast::get_lowest_layer(*stream), endpoints, url, options.timeout);

    beast::get_lowest_layer(*stream).expires_after(options.timeout);
    stream->async_handshake(asio::ssl::stream_base::client, [&ec](beast::error_code result) { ec = result; });
    run_to_completion(*io);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "HTTP client: TLS handshake with " << url.host << " failed: " << describe(ec);
      throw FetchFailedError(full_url, "TLS handshake: " + describe(ec));
    }
    return send_request(std::move(io), std::move(stream), ssl_context, url, options);
  }

  auto stream = std::make_unique<PlainStream>(*io);
  connect_stream(*io, *stream, endpoints, url, options.timeout);
  return send_request(std::move(io), std::move(stream), nullptr, url, options);
}

} // namespace

//==============================================
// URL HANDLING
//==============================================

ParsedUrl parse_url(const std::string& url) {
  std::size_t scheme_end = url.find("://");
  if (scheme_end == std::string::npos) {
    throw FetchError("HTTP client: URL has no scheme: " + url);
  }

  ParsedUrl parsed;
  parsed.scheme = url.substr(0, scheme_end);
  std::transform(parsed.scheme.begin(), parsed.scheme.end(), parsed.scheme.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (parsed.scheme != "http" && parsed.scheme != "https") {
    throw FetchError("HTTP client: Unsupported scheme: " + parsed.scheme);
  }

  std::size_t authority_begin = scheme_end + 3;
  std::size_t path_begin = url.find_first_of("/?#", authority_begin);
  std::string authority = url.substr(authority_begin, path_begin - authority_begin);
  parsed.target = path_begin == std::string::npos ? "/" : url.substr(path_begin);

  // Fragments are never sent to the server
  std::size_t fragment = parsed.target.find('#');
  if (fragment != std::string::npos) {
    parsed.target.erase(fragment);
  }
  if (parsed.target.empty() || parsed.target[0] != '/') {
    parsed.target.insert(0, "/");
  }

  std::size_t userinfo_end = authority.rfind('@');
  if (userinfo_end != std::string::npos) {
    authority.erase(0, userinfo_end + 1);
  }

  std::size_t port_sep = authority.rfind(':');
  std::size_t bracket = authority.rfind(']');
  if (port_sep != std::string::npos && (bracket == std::string::npos || port_sep > bracket)) {
    parsed.host = authority.substr(0, port_sep);
    parsed.port = authority.substr(port_sep + 1);
    if (parsed.port.empty() ||
        !std::all_of(parsed.port.begin(), parsed.port.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
      throw FetchError("HTTP client: Invalid port in URL: " + url);
    }
  } else {
    parsed.host = authority;
    parsed.port = default_port(parsed.scheme);
  }

  if (parsed.host.size() > 2 && parsed.host.front() == '[' && parsed.host.back() == ']') {
    parsed.host = parsed.host.substr(1, parsed.host.size() - 2);
  }
  if (parsed.host.empty()) {
    throw FetchError("HTTP client: URL has no host: " + url);
  }
  return parsed;
}

std::string resolve_location(const ParsedUrl& base, const std::string& location) {
  if (location.find("://") != std::string::npos) {
    return location;
  }
  if (location.rfind("//", 0) == 0) {
    return base.scheme + ":" + location;
  }

  ParsedUrl resolved = base;
  if (!location.empty() && location[0] == '/') {
    resolved.target = location;
  } else {
    std::string directory = base.target.substr(0, base.target.find('?'));
    directory = directory.substr(0, directory.rfind('/') + 1);
    resolved.target = directory + location;
  }
  return url_string(resolved);
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BeastHttpClient::BeastHttpClient() : BeastHttpClient(Options{}) {}

BeastHttpClient::BeastHttpClient(Options options)
  : options_(std::move(options))
  , ssl_context_(std::make_shared<asio::ssl::context>(asio::ssl::context::tls_client)) {
  ssl_context_->set_default_verify_paths();
  ssl_context_->set_verify_mode(asio::ssl::verify_peer);
  BOOST_LOG_TRIVIAL(debug) << "HTTP client: Initialized with timeout " << options_.timeout.count()
                           << "s and up to " << options_.max_redirects << " redirects";
}

BeastHttpClient::~BeastHttpClient() = default;


//==============================================
// REQUESTS
//==============================================

std::unique_ptr<HttpResponse> BeastHttpClient::get(const std::string& url) {
  BOOST_LOG_TRIVIAL(info) << "HTTP client: GET " << url;

  ParsedUrl current = parse_url(url);
  for (int redirects = 0; ; ++redirects) {
    auto response = open(current, options_, ssl_context_);
    if (!is_redirect(response->status())) {
      return response;
    }

    std::string location = response->location();
    if (location.empty()) {
      BOOST_LOG_TRIVIAL(warning) << "HTTP client: Redirect without Location from " << url_string(current);
      return response;
    }
    if (redirects >= options_.max_redirects) {
      BOOST_LOG_TRIVIAL(error) << "HTTP client: Too many redirects for " << url;
      throw FetchFailedError(url, "too many redirects");
    }

    std::string next = resolve_location(current, location);
    BOOST_LOG_TRIVIAL(debug) << "HTTP client: Following redirect to " << next;
    current = parse_url(next);
  }
}

} // namespace fetch
} // namespace mvault
