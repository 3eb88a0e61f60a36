// =================================================================
// src/Arbiter/HttpProviderAdapter.cpp
// =================================================================
// HTTP adapter for OpenAI-compatible chat completion servers.

#include "Arbiter/HttpProviderAdapter.hpp"
#include "Arbiter/Logger.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <stdexcept>

namespace Arbiter {

HttpProviderAdapter::HttpProviderAdapter(const std::string& completion_path)
    : m_completion_path(completion_path) {
}

std::string HttpProviderAdapter::getName() const {
    return "http";
}

ProviderErrorClass HttpProviderAdapter::classifyStatus(int status) {
    if (status >= 200 && status < 300) return ProviderErrorClass::NONE;
    if (status == 408 || status == 504) return ProviderErrorClass::TIMEOUT;
    if (status == 429) return ProviderErrorClass::RATE_LIMITED;
    if (status == 401 || status == 403) return ProviderErrorClass::AUTH_FAILURE;
    if (status >= 500) return ProviderErrorClass::SERVER_ERROR;
    return ProviderErrorClass::MALFORMED_REQUEST;
}

std::optional<std::chrono::milliseconds> HttpProviderAdapter::parseRetryAfter(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        long seconds = std::stol(value, &consumed);
        if (consumed != value.size() || seconds < 0) {
            return std::nullopt;
        }
        return std::chrono::milliseconds(seconds * 1000);
    } catch (const std::exception&) {
        // HTTP-date form is not supported; treat as absent
        return std::nullopt;
    }
}

std::string HttpProviderAdapter::buildRequestBody(const ModelDescriptor& model,
                                                  const std::string& input,
                                                  const InvocationOptions& options) const {
    nlohmann::json messages = nlohmann::json::array();
    if (!options.system_instruction.empty()) {
        messages.push_back({{"role", "system"}, {"content", options.system_instruction}});
    }
    messages.push_back({{"role", "user"}, {"content", input}});

    nlohmann::json body = {
        {"model", model.name},
        {"messages", messages},
        {"max_tokens", options.max_tokens},
        {"temperature", options.temperature},
        {"stream", false}
    };
    return body.dump();
}

std::string HttpProviderAdapter::resolveApiKey(const ModelDescriptor& model) const {
    auto it = model.custom_attributes.find("api_key_env");
    if (it == model.custom_attributes.end()) {
        return "";
    }
    const char* value = std::getenv(it->second.c_str());
    return value ? std::string(value) : std::string();
}

InvocationResult HttpProviderAdapter::invoke(const ModelDescriptor& model,
                                             const std::string& input,
                                             const InvocationOptions& options) {
    auto start_time = std::chrono::steady_clock::now();
    auto elapsed = [&start_time]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
    };

    if (model.endpoint.empty()) {
        return InvocationResult::failure(ProviderErrorClass::MALFORMED_REQUEST,
                                         "Model " + model.id + " has no endpoint configured");
    }

    // The httplib constructor handles scheme://host:port parsing.
    httplib::Client client(model.endpoint);
    auto timeout_sec = std::chrono::duration_cast<std::chrono::seconds>(options.timeout).count();
    auto timeout_usec = std::chrono::duration_cast<std::chrono::microseconds>(options.timeout).count() % 1000000;
    client.set_connection_timeout(timeout_sec, timeout_usec);
    client.set_read_timeout(timeout_sec, timeout_usec);
    client.set_write_timeout(timeout_sec, timeout_usec);

    httplib::Headers headers = {{"Accept", "application/json"}};
    std::string api_key = resolveApiKey(model);
    if (!api_key.empty()) {
        headers.emplace("Authorization", "Bearer " + api_key);
    }

    auto res = client.Post(m_completion_path, headers,
                           buildRequestBody(model, input, options), "application/json");

    if (!res) {
        auto err = res.error();
        ProviderErrorClass error_class = (err == httplib::Error::Read || err == httplib::Error::Write)
            ? ProviderErrorClass::TIMEOUT
            : ProviderErrorClass::UNAVAILABLE;
        return InvocationResult::failure(error_class,
            "HTTP request to " + model.endpoint + " failed: " + httplib::to_string(err), elapsed());
    }

    ProviderErrorClass status_class = classifyStatus(res->status);
    if (status_class != ProviderErrorClass::NONE) {
        InvocationResult failure = InvocationResult::failure(status_class,
            "Provider returned status " + std::to_string(res->status) + ": " + res->body.substr(0, 200),
            elapsed());
        if (res->has_header("Retry-After")) {
            failure.error.retry_after = parseRetryAfter(res->get_header_value("Retry-After"));
        }
        return failure;
    }

    try {
        auto json = nlohmann::json::parse(res->body);
        std::string text;
        if (json.contains("choices") && !json["choices"].empty()) {
            text = json["choices"][0]["message"].value("content", "");
        }

        TokenUsage usage;
        if (json.contains("usage")) {
            usage.input_tokens = json["usage"].value("prompt_tokens", static_cast<size_t>(0));
            usage.output_tokens = json["usage"].value("completion_tokens", static_cast<size_t>(0));
        } else {
            // Rough estimate when the provider omits usage
            usage.input_tokens = input.size() / 4;
            usage.output_tokens = text.size() / 4;
        }

        return InvocationResult::ok(text, usage, elapsed());

    } catch (const nlohmann::json::exception& e) {
        Logger::getInstance().warning("HttpProviderAdapter",
            "Unparseable response from " + model.id, e.what());
        return InvocationResult::failure(ProviderErrorClass::SERVER_ERROR,
            "Unparseable provider response: " + std::string(e.what()), elapsed());
    }
}

} // namespace Arbiter
