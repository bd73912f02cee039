#include "paste_client.h"
#include "shell_command.h"
#include <stdexcept>
#include <curl/curl.h>

size_t PasteClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* response = static_cast<std::string*>(userp);
    response->append(static_cast<char*>(contents), total_size);
    return total_size;
}

PasteClient::PasteClient(const std::string& endpoint, const std::string& api_key)
    : endpoint_(endpoint)
    , api_key_(api_key)
    , curl_handle_(curl_easy_init()) {
}

PasteClient::~PasteClient() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
        curl_handle_ = nullptr;
    }
}

std::string PasteClient::escape(const std::string& value) const {
    char* escaped = curl_easy_escape(curl_handle_, value.data(), static_cast<int>(value.size()));
    if (!escaped) {
        throw std::runtime_error("failed to encode paste form");
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

std::string PasteClient::buildForm(const std::string& text) const {
    return "api_dev_key=" + escape(api_key_)
         + "&api_option=paste"
         + "&api_paste_code=" + escape(text)
         + "&api_paste_private=1";
}

std::string PasteClient::parseReply(long status_code, const std::string& body) {
    std::string reply = trimOutput(body);
    if (status_code < 200 || status_code >= 300) {
        throw std::runtime_error("paste service returned HTTP " + std::to_string(status_code));
    }
    if (reply.empty() || reply.rfind("Bad API request", 0) == 0) {
        throw std::runtime_error("paste service rejected the upload: " + reply);
    }
    return reply;
}

std::string PasteClient::paste(const std::string& text) {
    if (api_key_.empty()) {
        throw std::runtime_error("no pastebin api_key configured");
    }
    if (!curl_handle_) {
        throw std::runtime_error("failed to initialize CURL");
    }

    std::string form = buildForm(text);
    std::string body;

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_URL, endpoint_.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_POST, 1L);
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, form.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDSIZE, static_cast<long>(form.length()));
    curl_easy_setopt(curl_handle_, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl_handle_, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl_handle_, CURLOPT_TIMEOUT, 30L);
    curl_easy_setopt(curl_handle_, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl_handle_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_handle_, CURLOPT_MAXREDIRS, 3L);
    curl_easy_setopt(curl_handle_, CURLOPT_USERAGENT, "mtda-cli");
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &body);

    CURLcode res = curl_easy_perform(curl_handle_);
    if (res != CURLE_OK) {
        throw std::runtime_error(std::string("paste upload failed: ") + curl_easy_strerror(res));
    }

    long status_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &status_code);
    return parseReply(status_code, body);
}
