#include "../../include/rates/fed_funds_client.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace rolldesk::rates {

using json = nlohmann::json;

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* output) {
    size_t total_size = size * nmemb;
    output->append(static_cast<char*>(contents), total_size);
    return total_size;
}

}  // namespace

FedFundsClient::FedFundsClient(RatesConfig config, logging::AsyncLogger& logger, HttpGet http_get)
    : config_(std::move(config)), logger_(logger), http_get_(std::move(http_get)) {
    if (config_.api_key.empty()) {
        if (const char* env = std::getenv("FRED_API_KEY")) {
            config_.api_key = env;
        }
    }
    if (!http_get_) {
        http_get_ = &FedFundsClient::curl_get;
    }
}

std::string FedFundsClient::request_url() const {
    std::stringstream url;
    url << config_.base_url << "?series_id=" << config_.series_id << "&api_key=" << config_.api_key
        << "&sort_order=desc&limit=1&file_type=json";
    return url.str();
}

double FedFundsClient::get_rate() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cached_ && std::chrono::steady_clock::now() - fetched_at_ < config_.ttl) {
            return *cached_;
        }
    }

    if (config_.api_key.empty()) {
        LOG_WARN(logger_, Rates, "no FRED API key configured, using fallback rate");
    } else {
        try {
            std::string body = http_get_(request_url(), config_.http_timeout_s);
            if (auto rate = parse_observation(body)) {
                std::lock_guard<std::mutex> lock(mutex_);
                cached_ = *rate;
                fetched_at_ = std::chrono::steady_clock::now();
                LOGF_INFO(logger_, Rates, "Fed Funds rate updated: %.2f%%", *rate);
                return *rate;
            }
            LOG_WARN(logger_, Rates, "FRED response carried no observation");
        } catch (const std::exception& e) {
            LOGF_WARN(logger_, Rates, "failed to fetch Fed Funds rate: %s", e.what());
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    return cached_ ? *cached_ : config_.fallback_pct;
}

std::optional<double> FedFundsClient::cached_rate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cached_;
}

std::optional<double> FedFundsClient::parse_observation(const std::string& body) {
    json data = json::parse(body);
    if (!data.contains("observations") || !data["observations"].is_array() || data["observations"].empty()) {
        return std::nullopt;
    }
    const json& newest = data["observations"][0];
    if (!newest.contains("value") || !newest["value"].is_string()) {
        return std::nullopt;
    }
    const std::string raw = newest["value"].get<std::string>();
    if (raw.empty() || raw == ".") {
        return std::nullopt;
    }

    char* end = nullptr;
    double value = std::strtod(raw.c_str(), &end);
    if (end == raw.c_str() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::string FedFundsClient::curl_get(const std::string& url, long timeout_s) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    std::string response;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw std::runtime_error(std::string("CURL error: ") + curl_easy_strerror(res));
    }
    if (http_code != 200) {
        throw std::runtime_error("HTTP error " + std::to_string(http_code));
    }
    return response;
}

}  // namespace rolldesk::rates
