#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>

namespace docweave::infrastructure {

using json = nlohmann::json;

OllamaClient::OllamaClient(const std::string& host, int port)
    : m_host(host), m_port(port) {}

std::optional<std::vector<float>> OllamaClient::getEmbedding(const std::string& model, const std::string& text) {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(180);

    json requestData = {
        {"model", model},
        {"prompt", text}
    };

    auto res = cli.Post("/api/embeddings", requestData.dump(), "application/json");
    if (!res) {
        throw std::runtime_error("Connection to " + m_host + ":" + std::to_string(m_port) +
                                 " failed: " + std::to_string(static_cast<int>(res.error())));
    }
    if (res->status != 200) {
        std::cerr << "[OllamaClient] HTTP Error " << res->status << ": " << res->body << std::endl;
        return std::nullopt;
    }

    try {
        auto body = json::parse(res->body);
        if (body.contains("embedding") && body["embedding"].is_array()) {
            auto vec = body["embedding"].get<std::vector<float>>();
            if (!vec.empty()) return vec;
        }
    } catch (const std::exception& e) {
        std::cerr << "[OllamaClient] JSON Parse Error: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::vector<std::string> OllamaClient::getAvailableModels() {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(5);

    auto res = cli.Get("/api/tags");
    std::vector<std::string> models;
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("models") && body["models"].is_array()) {
                for (const auto& item : body["models"]) {
                    if (item.contains("name")) {
                        models.push_back(item["name"].get<std::string>());
                    }
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[OllamaClient] JSON Parse Error: " << e.what() << std::endl;
        }
    } else if (!res) {
        std::cerr << "[OllamaClient] Connection failed: " << std::to_string(static_cast<int>(res.error())) << std::endl;
    }
    return models;
}

} // namespace docweave::infrastructure
