#include "CullingConfig.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <limits>
#include <SDL3/SDL_log.h>

using json = nlohmann::json;

namespace {

constexpr uint32_t MAX_FRAMES_IN_FLIGHT = 8;
constexpr uint32_t MAX_WORKGROUP_SIZE = 1024;

bool isPowerOfTwo(uint32_t v) {
    return v != 0 && (v & (v - 1)) == 0;
}

// Saturates at UINT64_MAX, which vkWaitSemaphores treats as no timeout
uint64_t millisecondsToNanoseconds(uint64_t ms) {
    constexpr uint64_t NS_PER_MS = 1'000'000ull;
    constexpr uint64_t maxNs = std::numeric_limits<uint64_t>::max();
    if (ms > maxNs / NS_PER_MS) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
            "CullingConfig: fenceTimeoutMs %llu too large, waiting without timeout",
            static_cast<unsigned long long>(ms));
        return maxNs;
    }
    return ms * NS_PER_MS;
}

} // namespace

bool CullingConfig::validate() {
    bool valid = true;

    if (framesInFlight == 0 || framesInFlight > MAX_FRAMES_IN_FLIGHT) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
            "CullingConfig: framesInFlight %u out of range [1, %u], using 3",
            framesInFlight, MAX_FRAMES_IN_FLIGHT);
        framesInFlight = 3;
        valid = false;
    }

    if (initialCapacity == 0) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
            "CullingConfig: initialCapacity must be > 0, using 1024");
        initialCapacity = 1024;
        valid = false;
    }

    if (!(growthFactor > 1.0f)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
            "CullingConfig: growthFactor %.2f must be > 1, using 2.0", growthFactor);
        growthFactor = 2.0f;
        valid = false;
    }

    if (!isPowerOfTwo(workgroupSize) || workgroupSize > MAX_WORKGROUP_SIZE) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
            "CullingConfig: workgroupSize %u must be a power of two <= %u, using 64",
            workgroupSize, MAX_WORKGROUP_SIZE);
        workgroupSize = 64;
        valid = false;
    }

    if (fenceTimeoutNs == 0) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
            "CullingConfig: fenceTimeoutNs must be > 0, using 5s");
        fenceTimeoutNs = 5'000'000'000ull;
        valid = false;
    }

    return valid;
}

CullingConfig CullingConfig::loadFromJson(const std::string& jsonPath) {
    std::ifstream file(jsonPath);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "CullingConfig: Failed to open config file: %s", jsonPath.c_str());
        return defaults();
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());
    return loadFromJsonString(content);
}

CullingConfig CullingConfig::loadFromJsonString(const std::string& jsonString) {
    CullingConfig config;

    try {
        json j = json::parse(jsonString);

        config.framesInFlight = j.value("framesInFlight", config.framesInFlight);
        config.initialCapacity = j.value("initialCapacity", config.initialCapacity);
        config.growthFactor = j.value("growthFactor", config.growthFactor);
        config.workgroupSize = j.value("workgroupSize", config.workgroupSize);
        config.shaderPath = j.value("shaderPath", config.shaderPath);
        config.preferDrawIndirectCount = j.value("preferDrawIndirectCount", config.preferDrawIndirectCount);

        if (j.contains("fenceTimeoutMs")) {
            config.fenceTimeoutNs = millisecondsToNanoseconds(j["fenceTimeoutMs"].get<uint64_t>());
        }
    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "CullingConfig: Failed to parse config: %s", e.what());
        return defaults();
    }

    if (!config.validate()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "CullingConfig: Out-of-range values replaced with defaults");
    }
    return config;
}
