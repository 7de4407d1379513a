// uiautomator2 agent clients over libcurl + nlohmann::json.
// The agent listens on device port 7912: /ping, /shell and /jsonrpc/0.

#include "transport/UiAutomatorTransport.hpp"
#include "transport/ShellParsers.hpp"
#include "device/DeviceIdentity.hpp"
#include "core/DeviceError.hpp"
#include "core/ErrorCatalog.hpp"

#include <curl/curl.h>

#include <iostream>
#include <mutex>

using json = nlohmann::json;

namespace droidlink {

namespace {

size_t write_cb(void* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* resp = static_cast<std::string*>(userdata);
    resp->append(static_cast<char*>(ptr), size * nmemb);
    return size * nmemb;
}

void global_init_once() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResult perform(CURL* curl, const std::string& url, std::chrono::milliseconds timeout) {
    HttpResult result;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &result.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.code);
    } else {
        result.error = curl_easy_strerror(res);
    }
    return result;
}

std::string describe(const std::string& url, const HttpResult& r) {
    if (!r.error.empty()) return url + ": " + r.error;
    return url + ": HTTP " + std::to_string(r.code);
}

} // namespace

AgentHttp::AgentHttp(const UiEndpoint& endpoint, std::chrono::milliseconds timeout)
: base_(endpoint.scheme + "://" + endpoint.host + ":" + std::to_string(endpoint.port)), timeout_(timeout) {
    global_init_once();
}

HttpResult AgentHttp::get(const std::string& path) const {
    CURL* curl = curl_easy_init();
    if (!curl) return {0, "", "curl_easy_init failed"};
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    HttpResult r = perform(curl, base_ + path, timeout_);
    curl_easy_cleanup(curl);
    return r;
}

HttpResult AgentHttp::post_json(const std::string& path, const std::string& payload) const {
    CURL* curl = curl_easy_init();
    if (!curl) return {0, "", "curl_easy_init failed"};
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    HttpResult r = perform(curl, base_ + path, timeout_);

    // clear the header option on the easy handle before freeing the list
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, nullptr);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return r;
}

std::string AgentHttp::escape(const std::string& text) const {
    CURL* curl = curl_easy_init();
    if (!curl) return text;
    char* out = curl_easy_escape(curl, text.c_str(), static_cast<int>(text.size()));
    std::string escaped = out ? out : text;
    curl_free(out);
    curl_easy_cleanup(curl);
    return escaped;
}

// ---- AtxShellClient ----

AtxShellClient::AtxShellClient(std::string serial, const UiEndpoint& agent, std::chrono::milliseconds timeout)
: serial_(std::move(serial)), http_(agent, timeout) {}

std::string AtxShellClient::get_state() {
    auto r = http_.get("/ping");
    if (!r.ok()) throw TransportError(describe(http_.base_url() + "/ping", r));
    return trim(r.body) == "pong" ? "device" : "offline";
}

std::string AtxShellClient::shell(const std::string& cmd) {
    std::string path = "/shell?command=" + http_.escape(cmd) + "&timeout=60";
    auto r = http_.get(path);
    if (!r.ok()) throw TransportError(describe(http_.base_url() + "/shell", r));
    try {
        auto j = json::parse(r.body);
        if (j.contains("error") && !j["error"].is_null()) {
            throw TransportError("shell '" + cmd + "': " + j["error"].dump());
        }
        return strip_shell_warnings(j.value("output", ""));
    } catch (const json::exception& e) {
        throw TransportError(std::string("bad /shell reply: ") + e.what());
    }
}

uint16_t AtxShellClient::forward(const std::string& remote) {
    throw TransportError(errors::with_detail(errors::D1400_NOT_OVER_HTTP, "forward " + remote));
}

void AtxShellClient::reverse(const std::string& remote, const std::string&) {
    throw TransportError(errors::with_detail(errors::D1400_NOT_OVER_HTTP, "reverse " + remote));
}

void AtxShellClient::remove_forward(const PortMapping&) {
    // forward() never succeeds over http, so nothing can be left behind
}

std::set<std::string> AtxShellClient::list_packages() {
    return parse_package_list(shell("pm list packages"));
}

// ---- UiAutomatorClient ----

UiAutomatorClient::UiAutomatorClient(const UiEndpoint& endpoint, std::chrono::milliseconds timeout)
: http_(endpoint, timeout) {}

bool UiAutomatorClient::ping() {
    auto r = http_.get("/ping");
    return r.ok() && trim(r.body) == "pong";
}

std::string UiAutomatorClient::shell(const std::string& cmd) {
    auto r = http_.get("/shell?command=" + http_.escape(cmd) + "&timeout=60");
    if (!r.ok()) throw TransportError(describe(http_.base_url() + "/shell", r));
    try {
        return strip_shell_warnings(json::parse(r.body).value("output", ""));
    } catch (const json::exception& e) {
        throw TransportError(std::string("bad /shell reply: ") + e.what());
    }
}

json UiAutomatorClient::jsonrpc(const std::string& method, const json& params) {
    json request = {
        {"jsonrpc", "2.0"},
        {"id", next_id_++},
        {"method", method},
        {"params", params}
    };
    auto r = http_.post_json("/jsonrpc/0", request.dump());
    if (!r.ok()) throw TransportError(describe(http_.base_url() + "/jsonrpc/0 " + method, r));

    json reply;
    try {
        reply = json::parse(r.body);
    } catch (const json::exception& e) {
        throw TransportError(method + ": bad reply: " + e.what());
    }
    if (reply.contains("error")) {
        const auto& err = reply["error"];
        std::string msg = err.is_object() ? err.value("message", err.dump()) : err.dump();
        throw TransportError(method + ": " + msg);
    }
    return reply.value("result", json());
}

std::string UiAutomatorClient::dump_hierarchy() {
    auto result = jsonrpc("dumpWindowHierarchy", json::array({false}));
    if (!result.is_string()) throw TransportError("dumpWindowHierarchy: unexpected result");
    return result.get<std::string>();
}

void UiAutomatorClient::app_start(const std::string& package) {
    shell("monkey -p " + package + " -c android.intent.category.LAUNCHER 1");
}

void UiAutomatorClient::app_stop(const std::string& package) {
    shell("am force-stop " + package);
}

std::string UiAutomatorClient::app_current() {
    return parse_focused_package(shell("dumpsys window windows | grep mCurrentFocus"));
}

void UiAutomatorClient::click(int x, int y) {
    jsonrpc("click", json::array({x, y}));
}

// ---- UiAutomatorTransport ----

UiAutomatorTransport::UiAutomatorTransport(std::chrono::milliseconds timeout)
: timeout_(timeout) {}

std::shared_ptr<UiClient> UiAutomatorTransport::connect(const DeviceIdentity& id, const UiEndpoint& endpoint) {
    auto client = std::make_shared<UiAutomatorClient>(endpoint, timeout_);
    if (!client->ping()) {
        throw TransportError("ui agent of " + id.serial + " not answering at " + endpoint.scheme + "://" +
                             endpoint.host + ":" + std::to_string(endpoint.port));
    }
    return client;
}

} // namespace droidlink
