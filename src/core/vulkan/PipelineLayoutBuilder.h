#pragma once

#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <vector>
#include <optional>
#include <SDL3/SDL_log.h>

/**
 * PipelineLayoutBuilder - Fluent builder for descriptor-only pipeline layouts
 *
 * The culling stage passes everything through descriptors, so no push
 * constant ranges are supported.
 *
 * Example usage:
 *   PipelineLayoutBuilder(device)
 *       .addDescriptorSetLayout(**computeDescSetLayout)
 *       .buildInto(pipelineLayout_);
 */
class PipelineLayoutBuilder {
public:
    explicit PipelineLayoutBuilder(const vk::raii::Device& device)
        : device_(&device) {}

    PipelineLayoutBuilder& addDescriptorSetLayout(vk::DescriptorSetLayout layout) {
        setLayouts_.push_back(layout);
        return *this;
    }

    std::optional<vk::raii::PipelineLayout> build() const {
        auto layoutInfo = vk::PipelineLayoutCreateInfo{}
            .setSetLayouts(setLayouts_);

        try {
            return vk::raii::PipelineLayout(*device_, layoutInfo);
        } catch (const vk::SystemError& e) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                "PipelineLayoutBuilder: Failed to create pipeline layout: %s", e.what());
            return std::nullopt;
        }
    }

    bool buildInto(std::optional<vk::raii::PipelineLayout>& outLayout) const {
        auto result = build();
        if (result) {
            outLayout = std::move(result);
            return true;
        }
        return false;
    }

private:
    const vk::raii::Device* device_;
    std::vector<vk::DescriptorSetLayout> setLayouts_;
};
