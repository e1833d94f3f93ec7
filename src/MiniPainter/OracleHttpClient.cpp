#include <MiniPainter/OracleHttpClient.hpp>
#include <curl/curl.h>
#include <plog/Log.h>
#include <mutex>

namespace MiniPainter {

static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp){
    size_t realsize = size * nmemb;
    std::string* mem = reinterpret_cast<std::string*>(userp);
    if(mem) mem->append(reinterpret_cast<char*>(contents), realsize);
    return realsize;
}

// curl_global_init is not thread-safe; run it once per process and never
// clean up, since other code in the process may still use libcurl.
static void ensureCurlInitialized(){
    static std::once_flag once;
    std::call_once(once, [](){ curl_global_init(CURL_GLOBAL_DEFAULT); });
}

// Owns an easy handle and header list for one transfer
struct CurlTransfer {
    CURL* curl = nullptr;
    struct curl_slist* headers = nullptr;

    CurlTransfer() : curl(curl_easy_init()) {}
    ~CurlTransfer(){
        if(headers) curl_slist_free_all(headers);
        if(curl) curl_easy_cleanup(curl);
    }
    CurlTransfer(const CurlTransfer&) = delete;
    CurlTransfer& operator=(const CurlTransfer&) = delete;

    void addHeader(const std::string& h){ headers = curl_slist_append(headers, h.c_str()); }
};

static void perform(CurlTransfer& t, OracleHttpClient::Response& resp){
    if(t.headers) curl_easy_setopt(t.curl, CURLOPT_HTTPHEADER, t.headers);
    curl_easy_setopt(t.curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(t.curl, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(t.curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(t.curl);
    if(res != CURLE_OK){ resp.curlError = curl_easy_strerror(res); }
    curl_easy_getinfo(t.curl, CURLINFO_RESPONSE_CODE, &resp.httpCode);
}

OracleHttpClient::OracleHttpClient(){
    ensureCurlInitialized();
}

OracleHttpClient::OracleHttpClient(const std::string& baseUrl): OracleHttpClient(){
    baseUrl_ = baseUrl;
}

std::string OracleHttpClient::buildUrl(const std::string& path) const {
    std::string base = baseUrl_;
    while(!base.empty() && base.back() == '/') base.pop_back();
    if(path.empty()) return base;
    if(path.front() == '/') return base + path;
    return base + "/" + path;
}

OracleHttpClient::Response OracleHttpClient::get(const std::string& path, long timeoutSeconds) const {
    Response resp;
    CurlTransfer t;
    if(!t.curl){ resp.curlError = "curl_easy_init failed"; return resp; }

    std::string url = buildUrl(path);
    curl_easy_setopt(t.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(t.curl, CURLOPT_TIMEOUT, timeoutSeconds > 0 ? timeoutSeconds : timeoutSeconds_);
    curl_easy_setopt(t.curl, CURLOPT_CONNECTTIMEOUT, connectTimeoutSeconds_);

    t.addHeader("Accept: application/json");
    for(const auto &dh : defaultHeaders_) t.addHeader(dh);

    perform(t, resp);
    if(!resp.transportOk()){ PLOGW << "OracleHttpClient: GET " << url << " failed: " << resp.curlError; }
    else { PLOGD << "OracleHttpClient: GET " << url << " -> " << resp.httpCode; }
    return resp;
}

OracleHttpClient::Response OracleHttpClient::postJson(const std::string& path, const std::string& jsonBody) const {
    Response resp;
    CurlTransfer t;
    if(!t.curl){ resp.curlError = "curl_easy_init failed"; return resp; }

    std::string url = buildUrl(path);
    curl_easy_setopt(t.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(t.curl, CURLOPT_POST, 1L);
    curl_easy_setopt(t.curl, CURLOPT_POSTFIELDS, jsonBody.c_str());
    curl_easy_setopt(t.curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(jsonBody.size()));
    curl_easy_setopt(t.curl, CURLOPT_TIMEOUT, timeoutSeconds_);
    curl_easy_setopt(t.curl, CURLOPT_CONNECTTIMEOUT, connectTimeoutSeconds_);

    t.addHeader("Content-Type: application/json");
    t.addHeader("Accept: application/json");
    for(const auto &dh : defaultHeaders_) t.addHeader(dh);

    perform(t, resp);
    if(!resp.transportOk()){ PLOGW << "OracleHttpClient: POST " << url << " failed: " << resp.curlError; }
    else { PLOGD << "OracleHttpClient: POST " << url << " (" << jsonBody.size() << " bytes) -> " << resp.httpCode; }
    return resp;
}

} // namespace MiniPainter
