#pragma once

#include <string>

// Uploads console captures to a pastebin-compatible service.
class PasteClient {
public:
    PasteClient(const std::string& endpoint, const std::string& api_key);
    ~PasteClient();

    // Returns the link to the new paste; throws std::runtime_error on failure.
    std::string paste(const std::string& text);

    // Form body and reply handling, exposed for tests.
    std::string buildForm(const std::string& text) const;
    static std::string parseReply(long status_code, const std::string& body);

private:
    std::string endpoint_;
    std::string api_key_;

    // CURL handle (opaque pointer to avoid including curl headers)
    void* curl_handle_;

    std::string escape(const std::string& value) const;
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
};
