/**
 * HttpTranscriber.cpp - multipart/form-data upload to whisper-server
 */

#include "volley/stt/HttpTranscriber.hpp"
#include "volley/Errors.hpp"
#include "net/HttpSupport.hpp"

#include <iostream>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace volley::stt {

namespace {

const char* BOUNDARY = "----volley-segment-boundary";

void addField(std::string& body, const std::string& name, const std::string& value) {
    body += "--";
    body += BOUNDARY;
    body += "\r\nContent-Disposition: form-data; name=\"" + name + "\"\r\n\r\n";
    body += value;
    body += "\r\n";
}

} // anonymous namespace

struct HttpTranscriber::Impl {
    std::unique_ptr<httplib::Client> client;
    net::Endpoint endpoint;

    Impl(const std::string& url, int timeout_ms)
        : endpoint(net::parseEndpoint(url)) {
        client = net::makeClient(endpoint, timeout_ms);
    }
};

HttpTranscriber::HttpTranscriber(const std::string& server_url, int timeout_ms)
    : impl_(std::make_unique<Impl>(server_url, timeout_ms)) {
    std::cout << "[HttpTranscriber] whisper server at " << server_url << std::endl;
}

HttpTranscriber::~HttpTranscriber() = default;

std::string HttpTranscriber::transcribe(const std::vector<uint8_t>& wav, const std::string& language_hint) {
    std::string body;
    body.reserve(wav.size() + 512);

    body += "--";
    body += BOUNDARY;
    body += "\r\nContent-Disposition: form-data; name=\"file\"; filename=\"segment.wav\"\r\n";
    body += "Content-Type: audio/wav\r\n\r\n";
    body.append(reinterpret_cast<const char*>(wav.data()), wav.size());
    body += "\r\n";
    addField(body, "response_format", "json");
    addField(body, "temperature", "0.0");
    if (!language_hint.empty()) {
        addField(body, "language", language_hint);
    }
    body += "--";
    body += BOUNDARY;
    body += "--\r\n";

    auto res = impl_->client->Post(impl_->endpoint.base_path + "/inference", body,
                                   std::string("multipart/form-data; boundary=") + BOUNDARY);
    if (!net::isSuccess(res)) {
        throw CollaboratorError("HttpTranscriber", "inference " + net::describeFailure(res));
    }

    try {
        json res_json = json::parse(res->body);
        if (res_json.contains("error")) {
            throw CollaboratorError("HttpTranscriber", res_json["error"].dump());
        }
        return res_json.value("text", "");
    } catch (const json::exception& e) {
        throw CollaboratorError("HttpTranscriber", std::string("JSON parse error: ") + e.what());
    }
}

} // namespace volley::stt
