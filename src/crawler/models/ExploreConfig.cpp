#include "../../../include/docs_fetch/crawler/models/ExploreConfig.h"
#include "../../../include/docs_fetch/common/TextUtils.h"
#include "../../../include/Logger.h"
#include <cstdlib>
#include <stdexcept>

namespace docs_fetch::crawler {

namespace {

bool parsePositive(const char* name, const char* raw, long long& out) {
    try {
        size_t consumed = 0;
        long long value = std::stoll(raw, &consumed);
        if (consumed != std::string(raw).size() || value <= 0) {
            throw std::invalid_argument("not a positive integer");
        }
        out = value;
        return true;
    } catch (const std::exception& e) {
        LOG_WARNING(std::string("Ignoring invalid ") + name + "='" + raw + "': " + e.what());
        return false;
    }
}

void overrideMillis(const EnvLookup& lookup, const char* name, std::chrono::milliseconds& field) {
    const char* raw = lookup(name);
    if (!raw || !*raw) return;
    long long value = 0;
    if (parsePositive(name, raw, value)) {
        field = std::chrono::milliseconds(value);
        LOG_DEBUG(std::string(name) + " = " + std::to_string(value) + "ms");
    }
}

void overrideCount(const EnvLookup& lookup, const char* name, size_t& field) {
    const char* raw = lookup(name);
    if (!raw || !*raw) return;
    long long value = 0;
    if (parsePositive(name, raw, value)) {
        field = static_cast<size_t>(value);
        LOG_DEBUG(std::string(name) + " = " + std::to_string(value));
    }
}

} // namespace

ExploreConfig loadExploreConfig(const EnvLookup& lookup) {
    ExploreConfig config;

    if (const char* url = lookup("BROWSERLESS_URL"); url && *url) {
        config.browserlessUrl = url;
    }

    if (const char* raw = lookup("SPA_RENDERING_ENABLED"); raw && *raw) {
        std::string value = common::toLowerAscii(common::trim(raw));
        if (value == "true" || value == "1" || value == "yes" || value == "on") {
            config.spaRenderingEnabled = true;
        } else if (value == "false" || value == "0" || value == "no" || value == "off") {
            config.spaRenderingEnabled = false;
        } else {
            LOG_WARNING(std::string("Ignoring invalid SPA_RENDERING_ENABLED='") + raw + "'");
        }
    }

    overrideMillis(lookup, "EXPLORE_DEADLINE_MS", config.deadline);
    overrideMillis(lookup, "LIGHTWEIGHT_TIMEOUT_MS", config.lightweightTimeout);
    overrideMillis(lookup, "RENDER_NAVIGATION_TIMEOUT_MS", config.renderNavigationTimeout);
    overrideCount(lookup, "EXPLORE_FAN_OUT", config.fanOut);
    overrideCount(lookup, "EXPLORE_MAX_CONCURRENT_FETCHES", config.maxConcurrentFetches);

    if (const char* raw = lookup("EXPLORE_EXTRACTION_MODE"); raw && *raw) {
        std::string value = common::toLowerAscii(common::trim(raw));
        if (value == "dom") {
            config.extractionMode = ExtractionMode::DOM;
        } else if (value == "markup") {
            config.extractionMode = ExtractionMode::MARKUP;
        } else {
            LOG_WARNING(std::string("Ignoring invalid EXPLORE_EXTRACTION_MODE='") + raw + "'");
        }
    }

    if (const char* agent = lookup("EXPLORE_USER_AGENT"); agent && *agent) {
        config.userAgent = agent;
    }

    LOG_INFO("Explore config: deadline=" + std::to_string(config.deadline.count()) + "ms" +
             ", fanOut=" + std::to_string(config.fanOut) +
             ", maxConcurrentFetches=" + std::to_string(config.maxConcurrentFetches) +
             ", rendering=" + (config.spaRenderingEnabled ? config.browserlessUrl : std::string("disabled")));
    return config;
}

ExploreConfig loadExploreConfigFromEnv() {
    return loadExploreConfig([](const char* name) -> const char* { return std::getenv(name); });
}

} // namespace docs_fetch::crawler
