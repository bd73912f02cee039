#include <gtest/gtest.h>
#include <stdexcept>
#include "paste_client.h"

TEST(PasteClientTest, BuildsEncodedForm) {
    PasteClient client("https://pastebin.example/api", "key 1");
    EXPECT_EQ(client.buildForm("a&b=c\n"),
              "api_dev_key=key%201&api_option=paste&api_paste_code=a%26b%3Dc%0A&api_paste_private=1");
}

TEST(PasteClientTest, ParsesLinkFromReply) {
    EXPECT_EQ(PasteClient::parseReply(200, "https://pastebin.com/xYz12\n"), "https://pastebin.com/xYz12");
}

TEST(PasteClientTest, RejectsErrors) {
    EXPECT_THROW(PasteClient::parseReply(500, "oops"), std::runtime_error);
    EXPECT_THROW(PasteClient::parseReply(200, "Bad API request, invalid api_dev_key"), std::runtime_error);
    EXPECT_THROW(PasteClient::parseReply(200, ""), std::runtime_error);
}

TEST(PasteClientTest, RequiresApiKey) {
    PasteClient client("https://pastebin.example/api", "");
    EXPECT_THROW(client.paste("log"), std::runtime_error);
}
