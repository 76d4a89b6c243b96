#include "ShaderLoader.h"
#include <SDL3/SDL_log.h>
#include <fstream>

namespace ShaderLoader {

std::optional<std::vector<char>> readFile(const std::string& filename) {
    std::ifstream file(filename, std::ios::ate | std::ios::binary);

    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to open file: %s", filename.c_str());
        return std::nullopt;
    }

    size_t fileSize = static_cast<size_t>(file.tellg());
    std::vector<char> buffer(fileSize);

    file.seekg(0);
    file.read(buffer.data(), static_cast<std::streamsize>(fileSize));
    if (!file) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to read file: %s", filename.c_str());
        return std::nullopt;
    }

    return buffer;
}

std::optional<vk::raii::ShaderModule> createShaderModule(const vk::raii::Device& device, const std::vector<char>& code) {
    // SPIR-V is a stream of 32-bit words
    if (code.empty() || code.size() % sizeof(uint32_t) != 0) {
        return std::nullopt;
    }

    auto createInfo = vk::ShaderModuleCreateInfo{}
        .setCodeSize(code.size())
        .setPCode(reinterpret_cast<const uint32_t*>(code.data()));

    try {
        return vk::raii::ShaderModule(device, createInfo);
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to create shader module: %s", e.what());
        return std::nullopt;
    }
}

}
