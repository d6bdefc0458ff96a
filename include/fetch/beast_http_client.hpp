#ifndef MVAULT_FETCH_BEAST_HTTP_CLIENT_HPP
#define MVAULT_FETCH_BEAST_HTTP_CLIENT_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include "fetch/http_client.hpp"

namespace boost::asio::ssl {
class context;
}

namespace mvault {
namespace fetch {

struct ParsedUrl {
  std::string scheme;   // "http" or "https"
  std::string host;
  std::string port;
  std::string target;   // path and query, at least "/"
};

// Parses absolute http(s) URLs. Throws FetchError on anything else.
ParsedUrl parse_url(const std::string& url);

// Resolves a Location header against the URL that produced it
std::string resolve_location(const ParsedUrl& base, const std::string& location);

// HttpClient over Boost.Beast. Plain TCP for http://, TLS through
// Boost.Asio SSL (OpenSSL) for https://. Each call opens its own
// connection; responses own their connection until destroyed.
class BeastHttpClient : public HttpClient {
public:
  struct Options {
    std::chrono::seconds timeout{60};
    int max_redirects{5};
    std::string user_agent{"mvault/1.0"};
    std::size_t read_buffer_size{64 * 1024};
  };

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  BeastHttpClient();
  explicit BeastHttpClient(Options options);
  ~BeastHttpClient() override;

  std::unique_ptr<HttpResponse> get(const std::string& url) override;

private:
  Options options_;
  std::shared_ptr<boost::asio::ssl::context> ssl_context_;
};

} // namespace fetch
} // namespace mvault

#endif // MVAULT_FETCH_BEAST_HTTP_CLIENT_HPP
