#pragma once
#include <string>
#include <vector>
#include <utility>
#include <atomic>

namespace memweave {

using Header = std::pair<std::string, std::string>;

// status_code == 0 means the transfer itself failed (DNS, connect, timeout,
// abort); body then holds the transport error text.
struct HttpResponse {
    long status_code = 0;
    std::string body;
};

// Every collaborator contract (chat, embeddings, NLI) is a JSON POST.
// Injectable so tests can answer with canned responses.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds) = 0;
};

// libcurl global init/cleanup for the lifetime of the process.
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

// libcurl implementation. When abort_flag is set and becomes true, in-flight
// transfers stop within about a second.
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(const std::atomic<bool>* abort_flag = nullptr)
        : abort_flag_(abort_flag) {}

    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds) override;

private:
    const std::atomic<bool>* abort_flag_;
};

} // namespace memweave
