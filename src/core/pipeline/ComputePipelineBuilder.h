#pragma once

#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <cstring>
#include <optional>
#include <string>
#include <vector>
#include <SDL3/SDL_log.h>
#include "../ShaderLoader.h"

/**
 * ComputePipelineBuilder - Fluent builder for Vulkan compute pipelines
 *
 * Loads the SPIR-V module, creates the pipeline and destroys the module again.
 *
 *   ComputePipelineBuilder(raiiDevice)
 *       .setShader(shaderPath + "/visibility_cull.comp.spv")
 *       .setPipelineLayout(**pipelineLayout)
 *       .addSpecConstant(0, workgroupSize)
 *       .buildInto(pipeline_);
 */
class ComputePipelineBuilder {
public:
    explicit ComputePipelineBuilder(const vk::raii::Device& device)
        : device_(&device) {}

    ComputePipelineBuilder& setShader(const std::string& path) {
        shaderPath_ = path;
        return *this;
    }

    ComputePipelineBuilder& setPipelineLayout(vk::PipelineLayout layout) {
        pipelineLayout_ = layout;
        return *this;
    }

    template<typename T>
    ComputePipelineBuilder& addSpecConstant(uint32_t constantId, const T& value) {
        uint32_t offset = static_cast<uint32_t>(specData_.size());
        specData_.resize(specData_.size() + sizeof(T));
        std::memcpy(specData_.data() + offset, &value, sizeof(T));

        specMapEntries_.push_back(vk::SpecializationMapEntry{}
            .setConstantID(constantId)
            .setOffset(offset)
            .setSize(sizeof(T)));

        return *this;
    }

    std::optional<vk::raii::Pipeline> build() const {
        if (!pipelineLayout_) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                "ComputePipelineBuilder: Pipeline layout not set");
            return std::nullopt;
        }

        auto code = ShaderLoader::readFile(shaderPath_);
        if (!code) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                "ComputePipelineBuilder: Failed to load shader: %s", shaderPath_.c_str());
            return std::nullopt;
        }

        std::optional<vk::raii::ShaderModule> module = ShaderLoader::createShaderModule(*device_, *code);
        if (!module) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                "ComputePipelineBuilder: Invalid SPIR-V in %s", shaderPath_.c_str());
            return std::nullopt;
        }

        vk::SpecializationInfo specInfo;
        specInfo
            .setMapEntries(specMapEntries_)
            .setDataSize(specData_.size())
            .setPData(specData_.data());

        auto stageInfo = vk::PipelineShaderStageCreateInfo{}
            .setStage(vk::ShaderStageFlagBits::eCompute)
            .setModule(**module)
            .setPName("main");

        if (!specMapEntries_.empty()) {
            stageInfo.setPSpecializationInfo(&specInfo);
        }

        auto pipelineInfo = vk::ComputePipelineCreateInfo{}
            .setStage(stageInfo)
            .setLayout(pipelineLayout_);

        try {
            return device_->createComputePipeline(nullptr, pipelineInfo);
        } catch (const vk::SystemError& e) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                "ComputePipelineBuilder: Failed to create pipeline: %s", e.what());
            return std::nullopt;
        }
    }

    bool buildInto(std::optional<vk::raii::Pipeline>& outPipeline) const {
        auto result = build();
        if (result) {
            outPipeline = std::move(result);
            return true;
        }
        return false;
    }

private:
    const vk::raii::Device* device_;
    std::string shaderPath_;
    vk::PipelineLayout pipelineLayout_ = nullptr;
    std::vector<vk::SpecializationMapEntry> specMapEntries_;
    std::vector<uint8_t> specData_;
};
