#pragma once

#include "../types.hpp"
#include "completion_gateway.hpp"
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

// Forward declarations for llama.cpp types
struct llama_model;
struct llama_context;
struct llama_sampler;
struct llama_vocab;

namespace geist {
namespace gateway {

/**
 * @brief Local GGUF model settings
 */
struct LocalModelConfig {
    std::string model_path;
    int context_size = 4096;
    int n_gpu_layers = 0;
    bool use_mmap = true;
    bool use_mlock = false;
    int seed = -1;  ///< -1 selects a time-based seed

    Expected<void> validate() const {
        if (model_path.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Model path cannot be empty"});
        }
        if (context_size <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Context size must be positive"});
        }
        if (n_gpu_layers < 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "n_gpu_layers cannot be negative"});
        }
        return {};
    }
};

/**
 * @brief Completion gateway running a GGUF model in-process via llama.cpp
 *
 * The model is loaded lazily on the first complete() and freed by
 * release(). Each choice is decoded from a cleared KV cache with its own
 * sampler chain built from the request's generation settings.
 *
 * Thread Safety: complete() and release() are serialized internally.
 */
class LlamaCompletionGateway : public ICompletionGateway {
public:
    explicit LlamaCompletionGateway(LocalModelConfig config);
    ~LlamaCompletionGateway() override;

    LlamaCompletionGateway(const LlamaCompletionGateway&) = delete;
    LlamaCompletionGateway& operator=(const LlamaCompletionGateway&) = delete;
    LlamaCompletionGateway(LlamaCompletionGateway&&) = delete;
    LlamaCompletionGateway& operator=(LlamaCompletionGateway&&) = delete;

    Expected<CompletionResult> complete(const CompletionRequest& request) override;

    void release() override;

    /** @brief Load the model now instead of on first use. */
    Expected<void> initialize();

    /** @brief Initialize llama.cpp backends once per process. */
    static void initialize_global();

private:
    Expected<void> initialize_locked();
    void free_locked();

    Expected<std::string> format_prompt(const std::vector<Message>& messages);
    Expected<std::vector<int>> tokenize(const std::string& text);
    Expected<std::string> generate(const std::vector<int>& prompt_tokens,
                                   const GenerationSettings& settings,
                                   uint32_t seed,
                                   int& completion_tokens);

    llama_sampler* create_sampler_chain(const GenerationSettings& settings, uint32_t seed) const;

    static size_t find_stop_sequence(const std::string& generated_text, const std::string& stop);

    LocalModelConfig config_;
    std::string model_name_;

    // llama.cpp state (owned)
    llama_model* model_ = nullptr;
    llama_context* ctx_ = nullptr;
    const llama_vocab* vocab_ = nullptr;  // Retrieved from model, not owned
    const char* tmpl_ = nullptr;          // Model-lifetime chat template, may be null

    int context_size_ = 0;
    std::vector<char> formatted_;
    std::mutex mutex_;
};

} // namespace gateway
} // namespace geist
