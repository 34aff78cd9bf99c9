/*
 * http_providers.cpp
 *
 * Notes
 * - Blocking libcurl easy-API calls, one handle per request.
 * - Honors total and connect timeouts; a timeout surfaces as ErrorCode::Timeout,
 *   every other failure as ErrorCode::ProviderUnavailable.
 */

#include <kgrag/providers/http_providers.h>

#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <mutex>

namespace kgrag::providers {

using json = nlohmann::json;

namespace {

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
    std::string message = std::string(where) + ": " + curl_easy_strerror(code);
    if (code == CURLE_OPERATION_TIMEDOUT)
        return Error{ErrorCode::Timeout, message};
    return Error{ErrorCode::ProviderUnavailable, message};
}

size_t writeBody(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(data, size * nmemb);
    return size * nmemb;
}

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

// GET when `payload` is null, JSON POST otherwise. Returns the body of a 200 response.
Result<std::string> perform(const std::string& url, const std::string* payload,
                            const HttpProviderOptions& options) {
    ensureCurlGlobalInit();
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        return Error{ErrorCode::ProviderUnavailable, "curl_easy_init failed"};
    }

    std::string body;
    std::unique_ptr<curl_slist, SlistDeleter> headers;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(options.connectTimeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeBody);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    if (payload) {
        headers.reset(curl_slist_append(nullptr, "Content-Type: application/json"));
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload->c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload->size()));
    }

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        return makeCurlError(rc, url);
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status != 200) {
        return Error{ErrorCode::ProviderUnavailable,
                     url + " returned HTTP " + std::to_string(status)};
    }
    return body;
}

Result<void> probeHealth(const std::string& baseUrl, const HttpProviderOptions& options) {
    auto r = perform(detail::joinUrl(baseUrl, "/health"), nullptr, options);
    if (!r)
        return r.error();
    return {};
}

} // namespace

namespace detail {

std::string joinUrl(std::string_view baseUrl, std::string_view path) {
    while (!baseUrl.empty() && baseUrl.back() == '/')
        baseUrl.remove_suffix(1);
    std::string out(baseUrl);
    if (!path.empty() && path.front() != '/')
        out.push_back('/');
    out.append(path);
    return out;
}

Result<std::vector<std::vector<float>>> parseEmbedResponse(std::string_view body,
                                                           size_t expectedCount) {
    try {
        auto doc = json::parse(body);
        if (!doc.is_array()) {
            return Error{ErrorCode::ProviderUnavailable, "embed response is not an array"};
        }
        std::vector<std::vector<float>> out;
        out.reserve(doc.size());
        for (const auto& row : doc) {
            if (!row.is_array() || row.empty()) {
                return Error{ErrorCode::ProviderUnavailable,
                             "embed response row is not a non-empty array"};
            }
            out.push_back(row.get<std::vector<float>>());
        }
        if (out.size() != expectedCount) {
            return Error{ErrorCode::ProviderUnavailable,
                         "embed response has " + std::to_string(out.size()) +
                             " vectors, expected " + std::to_string(expectedCount)};
        }
        for (const auto& v : out) {
            if (v.size() != out.front().size()) {
                return Error{ErrorCode::ProviderUnavailable,
                             "embed response mixes vector dimensions"};
            }
        }
        return out;
    } catch (const json::exception& e) {
        return Error{ErrorCode::ProviderUnavailable,
                     std::string("malformed embed response: ") + e.what()};
    }
}

Result<std::vector<float>> parseRerankResponse(std::string_view body, size_t expectedCount) {
    try {
        auto doc = json::parse(body);
        if (!doc.is_array()) {
            return Error{ErrorCode::ProviderUnavailable, "rerank response is not an array"};
        }
        std::vector<float> scores(expectedCount, 0.0f);
        std::vector<bool> seen(expectedCount, false);
        for (const auto& item : doc) {
            const auto index = item.at("index").get<size_t>();
            if (index >= expectedCount || seen[index]) {
                return Error{ErrorCode::ProviderUnavailable,
                             "rerank response has invalid index " + std::to_string(index)};
            }
            scores[index] = item.at("score").get<float>();
            seen[index] = true;
        }
        for (size_t i = 0; i < expectedCount; ++i) {
            if (!seen[i]) {
                return Error{ErrorCode::ProviderUnavailable,
                             "rerank response is missing index " + std::to_string(i)};
            }
        }
        return scores;
    } catch (const json::exception& e) {
        return Error{ErrorCode::ProviderUnavailable,
                     std::string("malformed rerank response: ") + e.what()};
    }
}

} // namespace detail

// HttpEmbeddingProvider

HttpEmbeddingProvider::HttpEmbeddingProvider(std::string baseUrl, HttpProviderOptions options)
    : baseUrl_(std::move(baseUrl)), options_(options) {}

Result<std::shared_ptr<HttpEmbeddingProvider>>
HttpEmbeddingProvider::connect(std::string baseUrl, HttpProviderOptions options) {
    auto health = probeHealth(baseUrl, options);
    if (!health) {
        return health.error();
    }
    spdlog::info("embedding service reachable at {}", baseUrl);
    return std::make_shared<HttpEmbeddingProvider>(std::move(baseUrl), options);
}

Result<std::vector<float>> HttpEmbeddingProvider::embed(const std::string& text) {
    auto batch = embedBatch({text});
    if (!batch)
        return batch.error();
    return std::move(batch.value().front());
}

Result<std::vector<std::vector<float>>>
HttpEmbeddingProvider::embedBatch(const std::vector<std::string>& texts) {
    std::vector<std::string> inputs;
    inputs.reserve(texts.size());
    for (const auto& t : texts) {
        auto prepared = prepareModelInput(t, options_.maxInputChars);
        if (!prepared)
            return prepared.error();
        inputs.push_back(std::move(prepared).value());
    }

    std::vector<std::vector<float>> out;
    out.reserve(inputs.size());
    const size_t step = options_.maxBatchSize == 0 ? inputs.size() : options_.maxBatchSize;
    for (size_t off = 0; off < inputs.size(); off += step) {
        const size_t end = std::min(inputs.size(), off + step);
        json request = {{"inputs", json::array()}, {"truncate", true}};
        for (size_t i = off; i < end; ++i)
            request["inputs"].push_back(inputs[i]);
        const std::string payload = request.dump();

        auto body = perform(detail::joinUrl(baseUrl_, "/embed"), &payload, options_);
        if (!body)
            return body.error();
        auto vectors = detail::parseEmbedResponse(body.value(), end - off);
        if (!vectors)
            return vectors.error();
        for (auto& v : vectors.value())
            out.push_back(std::move(v));
    }

    if (!out.empty())
        dimension_.store(out.front().size());
    return out;
}

// HttpCrossEncoderProvider

HttpCrossEncoderProvider::HttpCrossEncoderProvider(std::string baseUrl,
                                                   HttpProviderOptions options)
    : baseUrl_(std::move(baseUrl)), options_(options) {}

Result<std::shared_ptr<HttpCrossEncoderProvider>>
HttpCrossEncoderProvider::connect(std::string baseUrl, HttpProviderOptions options) {
    auto health = probeHealth(baseUrl, options);
    if (!health) {
        return health.error();
    }
    spdlog::info("rerank service reachable at {}", baseUrl);
    return std::make_shared<HttpCrossEncoderProvider>(std::move(baseUrl), options);
}

Result<float> HttpCrossEncoderProvider::score(const std::string& query, const std::string& text) {
    auto scores = scoreBatch(query, {text});
    if (!scores)
        return scores.error();
    return scores.value().front();
}

Result<std::vector<float>>
HttpCrossEncoderProvider::scoreBatch(const std::string& query,
                                     const std::vector<std::string>& texts) {
    if (texts.empty())
        return std::vector<float>{};

    auto preparedQuery = prepareModelInput(query, options_.maxInputChars);
    if (!preparedQuery)
        return preparedQuery.error();

    json request = {{"query", preparedQuery.value()}, {"texts", json::array()}};
    for (const auto& t : texts) {
        auto prepared = prepareModelInput(t, options_.maxInputChars);
        if (!prepared)
            return prepared.error();
        request["texts"].push_back(std::move(prepared).value());
    }
    const std::string payload = request.dump();

    auto body = perform(detail::joinUrl(baseUrl_, "/rerank"), &payload, options_);
    if (!body)
        return body.error();
    return detail::parseRerankResponse(body.value(), texts.size());
}

} // namespace kgrag::providers
