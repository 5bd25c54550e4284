#pragma once

#include <cstdint>
#include <string>
#include <vector>

// RFC 4648 base64 with '=' padding
std::string base64_encode(const std::vector<uint8_t>& data);

// {"type":"frame","feed":<name>,"data":<base64>,"frameId":<n>}
std::string encode_feed_message(const std::string& feed,
                                const std::vector<uint8_t>& data,
                                uint64_t frame_id);

// {"type":"test","message":<text>}, sent once when a client connects
std::string encode_hello_message(const std::string& text);
