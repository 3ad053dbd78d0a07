#include "source_lookup.hpp"
#include "errors.hpp"
#include "util.hpp"
#include "validators.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

SourceLookup::SourceLookup(std::shared_ptr<HttpClient> http,
                           std::string sourcify_url,
                           std::string etherscan_url,
                           std::shared_ptr<ApiKeyStore> keys,
                           std::string fallback_api_key,
                           int timeout_ms)
    : http_(std::move(http))
    , sourcify_url_(std::move(sourcify_url))
    , etherscan_url_(std::move(etherscan_url))
    , keys_(std::move(keys))
    , fallback_api_key_(std::move(fallback_api_key))
    , timeout_ms_(timeout_ms)
{}

bool SourceLookup::try_sourcify(uint64_t chain_id, const std::string& address, SourceCode& out) {
    std::string url = fmt::format("{}/files/any/{}/{}", sourcify_url_, chain_id, address);
    auto response = http_->get(url, timeout_ms_);
    if (!response.ok()) {
        spdlog::debug("Sourcify miss for {} on chain {}: {}", util::mask_address(address), chain_id,
                      response.error.empty() ? fmt::format("HTTP {}", response.status) : response.error);
        return false;
    }

    try {
        auto doc = nlohmann::json::parse(response.body);
        const nlohmann::json* files = &doc;
        if (doc.is_object() && doc.contains("files")) {
            files = &doc["files"];
        }
        if (!files->is_array()) {
            return false;
        }

        for (const auto& file : *files) {
            if (!file.is_object() || !file.contains("content")) continue;
            std::string path = file.value("path", file.value("name", std::string("source")));
            out.files.emplace_back(path, file["content"].get<std::string>());
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Sourcify returned malformed JSON: {}", e.what());
        return false;
    }

    if (out.files.empty()) {
        return false;
    }
    out.origin = "sourcify";
    return true;
}

bool SourceLookup::try_etherscan(uint64_t chain_id, const std::string& address, SourceCode& out) {
    std::string api_key;
    try {
        api_key = keys_ ? keys_->get("etherscan").value_or("") : "";
    } catch (const RailError& e) {
        spdlog::warn("Etherscan key unavailable: {}", e.what());
    }
    if (api_key.empty()) {
        api_key = fallback_api_key_;
    }
    if (api_key.empty()) {
        spdlog::debug("No Etherscan API key configured, skipping fallback");
        return false;
    }

    std::string url = fmt::format("{}?chainid={}&module=contract&action=getsourcecode&address={}&apikey={}",
                                  etherscan_url_, chain_id, address, CurlHttpClient::escape(api_key));
    auto response = http_->get(url, timeout_ms_);
    if (!response.ok()) {
        spdlog::debug("Etherscan lookup failed: {}",
                      response.error.empty() ? fmt::format("HTTP {}", response.status) : response.error);
        return false;
    }

    try {
        auto doc = nlohmann::json::parse(response.body);
        if (doc.value("status", std::string()) != "1" || !doc.contains("result") ||
            !doc["result"].is_array() || doc["result"].empty()) {
            return false;
        }

        const auto& entry = doc["result"][0];
        std::string source = entry.value("SourceCode", std::string());
        if (source.empty()) {
            return false;
        }

        // Standard-JSON input arrives wrapped in an extra pair of braces
        if (source.size() > 4 && source.compare(0, 2, "{{") == 0) {
            auto input = nlohmann::json::parse(source.substr(1, source.size() - 2));
            if (input.contains("sources") && input["sources"].is_object()) {
                for (const auto& [path, file] : input["sources"].items()) {
                    out.files.emplace_back(path, file.value("content", std::string()));
                }
            }
        }
        if (out.files.empty()) {
            std::string name = entry.value("ContractName", std::string("Contract"));
            out.files.emplace_back(name + ".sol", source);
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Etherscan returned malformed JSON: {}", e.what());
        out.files.clear();
        return false;
    }

    out.origin = "etherscan";
    return true;
}

SourceCode SourceLookup::get_source_code(int64_t chain_id, const std::string& address) {
    uint64_t chain = validators::validate_chain_id(chain_id);
    std::string checksummed = validators::validate_address(address);

    SourceCode source;
    if (try_sourcify(chain, checksummed, source)) {
        spdlog::info("Source for {} on chain {} found on Sourcify", util::mask_address(checksummed), chain);
        return source;
    }

    source = SourceCode{};
    if (try_etherscan(chain, checksummed, source)) {
        spdlog::info("Source for {} on chain {} found on Etherscan", util::mask_address(checksummed), chain);
        return source;
    }

    throw RailError(ErrorCode::SourceNotFound,
                    fmt::format("Contract not found on Sourcify or Etherscan ({} on chain {})",
                                util::mask_address(checksummed), chain),
                    "Verify the address, or set an Etherscan API key with set_api_key");
}
