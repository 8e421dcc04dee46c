#include <prsync/http.hpp>

#include <mutex>
#include <thread>

namespace prsync {

CurlHandle::CurlHandle() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
  handle_ = curl_easy_init();
  if (!handle_)
    throw TransportError("curl_easy_init failed");
}

CurlHandle::~CurlHandle() { curl_easy_cleanup(handle_); }

namespace {

struct CurlSlist {
  curl_slist *list{nullptr};
  ~CurlSlist() { curl_slist_free_all(list); }
  void append(const std::string &s) {
    list = curl_slist_append(list, s.c_str());
  }
};

size_t write_callback(void *contents, size_t size, size_t nmemb, void *userp) {
  auto *out = static_cast<std::string *>(userp);
  out->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

} // namespace

CurlHttpClient::CurlHttpClient(long timeout_ms) : timeout_ms_(timeout_ms) {}

HttpResponse CurlHttpClient::request(const std::string &method,
                                     const std::string &url,
                                     const std::vector<std::string> &headers,
                                     const std::string &body) {
  CURL *curl = curl_.get();
  curl_easy_reset(curl);

  HttpResponse resp;
  CurlSlist header_list;
  for (auto &h : headers)
    header_list.append(h);
  if (!body.empty())
    header_list.append("Content-Type: application/json");

  char errbuf[CURL_ERROR_SIZE] = {0};
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
  if (!body.empty() || method == "POST" || method == "PATCH") {
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(body.size()));
  }
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.list);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "prsync");
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

  spdlog::debug("[http] {} {}", method, url);
  CURLcode res = curl_easy_perform(curl);
  if (res != CURLE_OK)
    throw TransportError(method + " " + url + ": " +
                         (errbuf[0] ? errbuf : curl_easy_strerror(res)));
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
  spdlog::debug("[http] {} {} -> {}", method, url, resp.status);
  return resp;
}

void RetryPolicy::pause(std::chrono::milliseconds d) const {
  if (sleep)
    sleep(d);
  else
    std::this_thread::sleep_for(d);
}

} // namespace prsync
