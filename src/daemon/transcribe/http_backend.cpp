#include "http_backend.hpp"

#include "../text_util.hpp"
#include "stream_parser.hpp"

#include <curl/curl.h>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

struct TransferContext {
    CURL* curl = nullptr;
    std::string body;
    StreamAccumulator* stream = nullptr;
    std::stop_token stop;
};

bool is_success(long status) {
    return status >= 200 && status < 300;
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    size_t len = size * nmemb;
    ctx->body.append(ptr, len);

    if (ctx->stream) {
        long status = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
        if (is_success(status)) {
            ctx->stream->feed(std::string_view(ptr, len));
        }
    }
    return len;
}

int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    return ctx->stop.stop_requested() ? 1 : 0;
}

void add_field(curl_mime* mime, const char* name, const std::string& value) {
    auto* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
}

TranscribeError map_curl_error(CURLcode res) {
    switch (res) {
        case CURLE_OPERATION_TIMEDOUT:
            return transcribe_error::Timeout{};
        case CURLE_ABORTED_BY_CALLBACK:
            return transcribe_error::Cancelled{};
        default:
            return transcribe_error::Network{curl_easy_strerror(res)};
    }
}

TranscribeError map_http_error(long status, const std::string& body) {
    if (status == 401) return transcribe_error::Unauthorized{};
    if (status == 413) return transcribe_error::FileTooLarge{};
    return transcribe_error::Server{
        static_cast<int>(status),
        parse_error_message(body).value_or("Unknown server error"),
    };
}

std::optional<std::string> json_text(const std::string& body) {
    auto j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    auto it = j.find("text");
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

} // namespace

std::optional<std::string> parse_error_message(const std::string& body) {
    auto j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    if (auto err = j.find("error"); err != j.end()) {
        if (err->is_string()) return err->get<std::string>();
        if (err->is_object()) {
            auto msg = err->find("message");
            if (msg != err->end() && msg->is_string()) return msg->get<std::string>();
        }
    }
    if (auto msg = j.find("message"); msg != j.end() && msg->is_string()) {
        return msg->get<std::string>();
    }
    return std::nullopt;
}

HttpBackend::HttpBackend(HttpBackendOptions options)
    : options_(std::move(options)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpBackend::~HttpBackend() {
    if (warm_thread_.joinable()) warm_thread_.join();
    curl_global_cleanup();
}

std::string HttpBackend::endpoint() const {
    if (options_.api_format == "whisper.cpp") {
        return options_.url + "/inference";
    }
    return options_.url + "/v1/audio/transcriptions";
}

std::expected<std::string, TranscribeError>
HttpBackend::transcribe(const TranscriptionRequest& request, const DeltaCallback& on_delta,
                        std::stop_token stop) {
    std::error_code ec;
    auto size = fs::file_size(request.file, ec);
    if (ec) return std::unexpected(transcribe_error::AudioFileNotReady{});
    if (size > kMaxUploadBytes) return std::unexpected(transcribe_error::FileTooLarge{});

    bool streaming = options_.api_format != "whisper.cpp";

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(transcribe_error::Network{"curl_easy_init failed"});
    }

    curl_mime* mime = curl_mime_init(curl);
    if (streaming) {
        add_field(mime, "model", request.model);
        add_field(mime, "response_format", "json");
        add_field(mime, "stream", "true");
    } else {
        add_field(mime, "temperature", "0.0");
        add_field(mime, "response_format", "json");
    }
    if (request.language && !request.language->empty()) {
        add_field(mime, "language", *request.language);
    }
    if (request.prompt && !request.prompt->empty()) {
        add_field(mime, "prompt", *request.prompt);
    }

    auto* file_part = curl_mime_addpart(mime);
    curl_mime_name(file_part, "file");
    curl_mime_filedata(file_part, request.file.c_str());
    curl_mime_type(file_part, "audio/wav");

    curl_slist* headers = nullptr;
    if (!request.api_key.empty()) {
        headers = curl_slist_append(headers, ("Authorization: Bearer " + request.api_key).c_str());
    }
    if (streaming) {
        headers = curl_slist_append(headers, "Accept: text/event-stream");
    }

    StreamAccumulator stream(on_delta);
    TransferContext ctx{
        .curl = curl,
        .body = {},
        .stream = streaming ? &stream : nullptr,
        .stop = stop,
    };

    auto url = endpoint();
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, options_.timeout_s);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_slist_free_all(headers);
    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) return std::unexpected(map_curl_error(res));
    if (!is_success(status)) return std::unexpected(map_http_error(status, ctx.body));

    if (streaming) {
        stream.finish();
        if (stream.error()) {
            return std::unexpected(transcribe_error::Server{static_cast<int>(status), *stream.error()});
        }
        if (stream.final_text()) {
            auto text = text::trimmed(*stream.final_text());
            if (!text.empty()) return text;
        }
        auto aggregated = text::trimmed(stream.aggregated());
        if (!aggregated.empty()) return aggregated;
    }

    // Servers that ignore stream=true answer with a single JSON object.
    if (auto body_text = json_text(ctx.body)) {
        auto text = text::trimmed(*body_text);
        if (text.empty()) return std::unexpected(transcribe_error::EmptyText{});
        return text;
    }
    if (!streaming) {
        if (auto msg = parse_error_message(ctx.body)) {
            return std::unexpected(transcribe_error::Server{static_cast<int>(status), *msg});
        }
        return std::unexpected(transcribe_error::InvalidResponse{});
    }
    if (ctx.body.find("data:") == std::string::npos && !json::accept(ctx.body)) {
        return std::unexpected(transcribe_error::InvalidResponse{});
    }
    return std::unexpected(transcribe_error::EmptyText{});
}

void HttpBackend::keep_warm() {
    if (!warm_gate_.begin(KeepWarmGate::Clock::now())) return;

    // The previous warm-up has finished, so this join does not block.
    if (warm_thread_.joinable()) warm_thread_.join();

    warm_thread_ = std::jthread([this, url = endpoint()] {
        CURL* curl = curl_easy_init();
        if (curl) {
            curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
            curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
            curl_easy_setopt(curl, CURLOPT_TIMEOUT, 5L);
            CURLcode res = curl_easy_perform(curl);
            if (res != CURLE_OK) {
                std::println(stderr, "backend: warm-up failed: {}", curl_easy_strerror(res));
            }
            curl_easy_cleanup(curl);
        }
        warm_gate_.finish();
    });
}
