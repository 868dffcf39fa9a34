#include "http.hpp"

#include <curl/curl.h>
#include <iostream>
#include <string>

namespace memweave {

CurlGlobal::CurlGlobal() {
    curl_global_init(CURL_GLOBAL_ALL);
}

CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}

namespace {

// Called by curl about once per second; non-zero aborts the transfer.
int abort_progress_cb(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* flag = static_cast<const std::atomic<bool>*>(clientp);
    return flag->load(std::memory_order_relaxed) ? 1 : 0;
}

size_t append_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    static_cast<std::string*>(userdata)->append(ptr, total);
    return total;
}

// Owns one easy handle and its header list.
struct CurlRequest {
    CURL* curl = curl_easy_init();
    curl_slist* hlist = nullptr;

    CurlRequest() = default;
    ~CurlRequest() {
        curl_slist_free_all(hlist);
        if (curl) curl_easy_cleanup(curl);
    }
    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    explicit operator bool() const { return curl != nullptr; }
};

} // namespace

HttpResponse CurlHttpClient::post(const std::string& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers,
                                  long timeout_seconds) {
    HttpResponse response;
    CurlRequest req;
    if (!req) {
        response.body = "curl_easy_init failed";
        return response;
    }

    for (const auto& h : headers) {
        std::string entry = h.first + ": " + h.second;
        req.hlist = curl_slist_append(req.hlist, entry.c_str());
    }
    curl_easy_setopt(req.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.hlist);
    curl_easy_setopt(req.curl, CURLOPT_USERAGENT, "memweave");
    curl_easy_setopt(req.curl, CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(req.curl, CURLOPT_CONNECTTIMEOUT,
                     timeout_seconds < 10 ? timeout_seconds : 10L);
    curl_easy_setopt(req.curl, CURLOPT_NOSIGNAL, 1L);
    if (abort_flag_) {
        curl_easy_setopt(req.curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(req.curl, CURLOPT_XFERINFOFUNCTION, abort_progress_cb);
        curl_easy_setopt(req.curl, CURLOPT_XFERINFODATA, abort_flag_);
    }

    curl_easy_setopt(req.curl, CURLOPT_POST, 1L);
    curl_easy_setopt(req.curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(req.curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &response.body);

    CURLcode res = curl_easy_perform(req.curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    } else {
        std::cerr << "[http] POST " << url << " failed: " << curl_easy_strerror(res) << "\n";
        response.status_code = 0;
        response.body = curl_easy_strerror(res);
    }
    return response;
}

} // namespace memweave
