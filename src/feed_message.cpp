#include "feed_message.hpp"

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <json/json.h>

namespace {

std::string write_compact(const Json::Value& root) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, root);
}

} // namespace

std::string base64_encode(const std::vector<uint8_t>& data) {
    using namespace boost::archive::iterators;
    using Base64Iterator = base64_from_binary<transform_width<std::vector<uint8_t>::const_iterator, 6, 8>>;

    if (data.empty()) return std::string();

    std::string encoded(Base64Iterator(data.begin()), Base64Iterator(data.end()));
    encoded.append((3 - data.size() % 3) % 3, '=');
    return encoded;
}

std::string encode_feed_message(const std::string& feed,
                                const std::vector<uint8_t>& data,
                                uint64_t frame_id) {
    Json::Value root;
    root["type"] = "frame";
    root["feed"] = feed;
    root["data"] = base64_encode(data);
    root["frameId"] = Json::UInt64(frame_id);
    return write_compact(root);
}

std::string encode_hello_message(const std::string& text) {
    Json::Value root;
    root["type"] = "test";
    root["message"] = text;
    return write_compact(root);
}
