#pragma once

#include <string>

// Base64 without line breaks, used to carry binary data inside JSON strings.
std::string base64Encode(const std::string& input);
std::string base64Decode(const std::string& input);
