#pragma once

#include <curl/curl.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace tw::util {

class CurlEasy {
public:
    CurlEasy() : h_(curl_easy_init()) {
        if (!h_) throw std::runtime_error("curl_easy_init failed");
        curl_easy_setopt(h_, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(h_, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(h_, CURLOPT_MAXREDIRS, 10L);
        // No SIGALRM-based timeouts: handles live on worker threads
        curl_easy_setopt(h_, CURLOPT_NOSIGNAL, 1L);
    }
    ~CurlEasy() { curl_easy_cleanup(h_); }

    CurlEasy(const CurlEasy&) = delete;
    CurlEasy& operator=(const CurlEasy&) = delete;

    operator CURL*()       { return h_; }
    operator const CURL*() const { return h_; }

private:
    CURL* h_;
};

class SList {
public:
    SList() = default;
    SList(const SList&) = delete;
    SList& operator=(const SList&) = delete;

    void add(std::string s) {
        store_.push_back(std::move(s));
        head_ = curl_slist_append(head_, store_.back().c_str());
    }
    ~SList() { curl_slist_free_all(head_); }
    curl_slist* get() const { return head_; }

private:
    std::vector<std::string> store_;
    curl_slist*              head_ = nullptr;
};

struct HttpResponse {
    CURLcode curl  = CURLE_OK;
    long     http  = 0;
    double   total_time_ms = 0.0;
    std::string body;
    std::string error;   // CURLOPT_ERRORBUFFER contents, when set
    bool ok() const { return curl == CURLE_OK && http / 100 == 2; }
};

inline size_t writeToString(char* p, size_t s, size_t n, void* ud) {
    static_cast<std::string*>(ud)->append(p, s * n);
    return s * n;
}

inline size_t discardBody(char*, size_t s, size_t n, void*) {
    return s * n;
}

// Runs one transfer on a fresh handle. `setup` applies the caller-specific options.
template <class SetupFn>
static HttpResponse performCurl(SetupFn&& setup, bool keepBody = true) {
    CurlEasy h;                    // RAII handle
    std::string bodyBuf;
    char errBuf[CURL_ERROR_SIZE] = {0};

    if (keepBody) {
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeToString);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &bodyBuf);
    } else {
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, discardBody);
    }
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errBuf);

    setup(h);                      // caller-specific tweaks

    HttpResponse r;
    r.curl = curl_easy_perform(h);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &r.http);

    double totalSeconds = 0.0;
    curl_easy_getinfo(h, CURLINFO_TOTAL_TIME, &totalSeconds);
    r.total_time_ms = totalSeconds * 1000.0;

    r.body.swap(bodyBuf);
    r.error = errBuf[0] ? std::string(errBuf) : std::string(curl_easy_strerror(r.curl));
    return r;
}

} // namespace tw::util
