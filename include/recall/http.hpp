#pragma once

#include <map>
#include <mutex>
#include <string>

#include <curl/curl.h>

#include "recall/common.hpp"

namespace recall {

struct HttpResponse {
  long status{0};
  std::string body;
  std::string error;

  bool ok() const { return error.empty() && status >= 200 && status < 300; }

  std::string describe_failure() const {
    if (!error.empty()) {
      return error;
    }
    std::string snippet = body.substr(0, (std::min<std::size_t>)(body.size(), 300));
    return "HTTP " + std::to_string(status) + (snippet.empty() ? "" : ": " + snippet);
  }
};

// One easy handle per instance; use thread_local instances across threads.
class HttpClient {
 public:
  HttpClient() {
    ensure_global_init();
    easy_ = curl_easy_init();
  }

  ~HttpClient() {
    if (easy_) {
      curl_easy_cleanup(easy_);
      easy_ = nullptr;
    }
  }

  HttpClient(const HttpClient&) = delete;
  HttpClient& operator=(const HttpClient&) = delete;

  HttpResponse post(const std::string& url, const std::string& body,
                    const std::map<std::string, std::string>& headers = {}, int timeout_s = 60) {
    return request("POST", url, body, headers, timeout_s);
  }

 private:
  static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const auto n = size * nmemb;
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, n);
    return n;
  }

  static void ensure_global_init() {
    static std::once_flag flag;
    std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
  }

  CURL* ensure_easy() {
    if (!easy_) {
      easy_ = curl_easy_init();
    }
    return easy_;
  }

  static void apply_common_options(CURL* curl, int timeout_s) {
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_s));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>((std::min)(10, (std::max)(1, timeout_s / 3))));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "recall/0.1");
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
  }

  HttpResponse request(const std::string& method, const std::string& url, const std::string& body,
                       const std::map<std::string, std::string>& headers, int timeout_s) {
    CURL* curl = ensure_easy();
    if (!curl) {
      return HttpResponse{0, "", "curl init failed"};
    }

    curl_easy_reset(curl);
    std::string response_body;
    struct curl_slist* header_list = nullptr;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    apply_common_options(curl, timeout_s);

    if (method == "POST") {
      curl_easy_setopt(curl, CURLOPT_POST, 1L);
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
      curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }

    for (const auto& [k, v] : headers) {
      const std::string line = k + ": " + v;
      header_list = curl_slist_append(header_list, line.c_str());
    }
    if (header_list) {
      curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }

    const CURLcode rc = curl_easy_perform(curl);

    HttpResponse out;
    if (rc != CURLE_OK) {
      out.error = curl_easy_strerror(rc);
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.status);
    out.body = std::move(response_body);

    if (header_list) {
      curl_slist_free_all(header_list);
    }
    return out;
  }

  CURL* easy_{nullptr};
};

}  // namespace recall
