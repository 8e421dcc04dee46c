#pragma once
#include <prsync/errors.hpp>

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace prsync {

struct HttpResponse {
  long status = 0;
  std::string body;
};

// Connection-level failure: no HTTP status was received.
class TransportError : public Error {
public:
  explicit TransportError(const std::string &msg)
      : Error("http transport: " + msg) {}
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  // Any status is returned as a response; TransportError when none arrived.
  virtual HttpResponse request(const std::string &method,
                               const std::string &url,
                               const std::vector<std::string> &headers,
                               const std::string &body) = 0;
};

// RAII wrapper for a CURL easy handle, performs global init once.
class CurlHandle {
public:
  CurlHandle();
  ~CurlHandle();
  CurlHandle(const CurlHandle &) = delete;
  CurlHandle &operator=(const CurlHandle &) = delete;

  CURL *get() const { return handle_; }

private:
  CURL *handle_;
};

class CurlHttpClient : public HttpClient {
public:
  explicit CurlHttpClient(long timeout_ms = 30000);

  HttpResponse request(const std::string &method, const std::string &url,
                       const std::vector<std::string> &headers,
                       const std::string &body) override;

private:
  CurlHandle curl_;
  long timeout_ms_;
};

// Bounded retry with exponential backoff. Retries transport failures and
// 5xx responses; anything else propagates on the first attempt.
struct RetryPolicy {
  int attempts = 3;
  std::chrono::milliseconds delay{500};
  double factor = 2.0;
  std::function<void(std::chrono::milliseconds)> sleep;

  template <class F> auto run(const std::string &what, F &&fn) -> decltype(fn()) {
    auto wait = delay;
    for (int attempt = 1;; ++attempt) {
      try {
        return fn();
      } catch (const TransportError &e) {
        if (attempt >= attempts)
          throw;
        spdlog::warn("[http] {} failed ({}), attempt {}/{}", what, e.what(),
                     attempt, attempts);
      } catch (const HostingServiceError &e) {
        if (e.status() < 500 || attempt >= attempts)
          throw;
        spdlog::warn("[http] {} failed ({}), attempt {}/{}", what, e.what(),
                     attempt, attempts);
      }
      pause(wait);
      wait = std::chrono::milliseconds(
          static_cast<long long>(static_cast<double>(wait.count()) * factor));
    }
  }

private:
  void pause(std::chrono::milliseconds d) const;
};

} // namespace prsync
