#pragma once

#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <optional>
#include <vector>
#include <SDL3/SDL_log.h>

/**
 * BindingBuilder - Immutable builder for a single descriptor set layout binding
 *
 * Example:
 *   auto ubo = BindingBuilder::uniformBuffer(0, vk::ShaderStageFlagBits::eCompute);
 *   auto ssbo = BindingBuilder::storageBuffer(1, vk::ShaderStageFlagBits::eCompute);
 */
class BindingBuilder {
public:
    constexpr BindingBuilder() = default;

    [[nodiscard]] constexpr BindingBuilder binding(uint32_t idx) const {
        BindingBuilder copy = *this;
        copy.binding_ = idx;
        return copy;
    }

    [[nodiscard]] constexpr BindingBuilder descriptorType(vk::DescriptorType type) const {
        BindingBuilder copy = *this;
        copy.descriptorType_ = type;
        return copy;
    }

    [[nodiscard]] constexpr BindingBuilder stageFlags(vk::ShaderStageFlags flags) const {
        BindingBuilder copy = *this;
        copy.stageFlags_ = flags;
        return copy;
    }

    // Stereotypes
    static constexpr BindingBuilder uniformBuffer(uint32_t bindingIdx, vk::ShaderStageFlags stages) {
        return BindingBuilder()
            .binding(bindingIdx)
            .descriptorType(vk::DescriptorType::eUniformBuffer)
            .stageFlags(stages);
    }

    static constexpr BindingBuilder storageBuffer(uint32_t bindingIdx, vk::ShaderStageFlags stages) {
        return BindingBuilder()
            .binding(bindingIdx)
            .descriptorType(vk::DescriptorType::eStorageBuffer)
            .stageFlags(stages);
    }

    [[nodiscard]] constexpr vk::DescriptorSetLayoutBinding build() const {
        return vk::DescriptorSetLayoutBinding{}
            .setBinding(binding_)
            .setDescriptorType(descriptorType_)
            .setDescriptorCount(1)
            .setStageFlags(stageFlags_);
    }

private:
    uint32_t binding_ = 0;
    vk::DescriptorType descriptorType_ = vk::DescriptorType::eUniformBuffer;
    vk::ShaderStageFlags stageFlags_ = {};
};

/**
 * DescriptorSetLayoutBuilder - Immutable builder for descriptor set layouts
 *
 * Example:
 *   auto layout = DescriptorSetLayoutBuilder()
 *       .addBinding(BindingBuilder::uniformBuffer(0, vk::ShaderStageFlagBits::eCompute))
 *       .addBinding(BindingBuilder::storageBuffer(1, vk::ShaderStageFlagBits::eCompute))
 *       .build(device);
 */
class DescriptorSetLayoutBuilder {
public:
    DescriptorSetLayoutBuilder() = default;

    [[nodiscard]] DescriptorSetLayoutBuilder addBinding(const BindingBuilder& binding) const {
        DescriptorSetLayoutBuilder copy = *this;
        copy.bindings_.push_back(binding.build());
        return copy;
    }

    [[nodiscard]] std::optional<vk::raii::DescriptorSetLayout> build(const vk::raii::Device& device) const {
        auto layoutInfo = vk::DescriptorSetLayoutCreateInfo{}
            .setBindings(bindings_);

        try {
            return vk::raii::DescriptorSetLayout(device, layoutInfo);
        } catch (const vk::SystemError& e) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                "DescriptorSetLayoutBuilder: Failed to create layout: %s", e.what());
            return std::nullopt;
        }
    }

    bool buildInto(const vk::raii::Device& device, std::optional<vk::raii::DescriptorSetLayout>& outLayout) const {
        auto result = build(device);
        if (result) {
            outLayout = std::move(result);
            return true;
        }
        return false;
    }

private:
    std::vector<vk::DescriptorSetLayoutBinding> bindings_;
};
