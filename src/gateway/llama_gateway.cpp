#include "geist/gateway/llama_gateway.hpp"
#include <llama.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <climits>
#include <ctime>
#include <filesystem>

namespace geist {
namespace gateway {

static std::once_flag g_llama_init_flag;

void LlamaCompletionGateway::initialize_global() {
    std::call_once(g_llama_init_flag, []() {
        llama_log_set([](enum ggml_log_level level, const char* text, void*) {
            if (level >= GGML_LOG_LEVEL_WARN) {
                spdlog::warn("llama.cpp: {}", text);
            }
        }, nullptr);
        llama_backend_init();
        ggml_backend_load_all();
    });
}

LlamaCompletionGateway::LlamaCompletionGateway(LocalModelConfig config)
    : config_(std::move(config))
    , model_name_(std::filesystem::path(config_.model_path).stem().string())
{}

LlamaCompletionGateway::~LlamaCompletionGateway() {
    std::lock_guard<std::mutex> lock(mutex_);
    free_locked();
}

void LlamaCompletionGateway::free_locked() {
    // Reverse order of creation
    if (ctx_ != nullptr) {
        llama_free(ctx_);
        ctx_ = nullptr;
    }
    if (model_ != nullptr) {
        llama_model_free(model_);
        model_ = nullptr;
    }
    vocab_ = nullptr;
    tmpl_ = nullptr;
    context_size_ = 0;
}

void LlamaCompletionGateway::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (model_ != nullptr) {
        spdlog::info("Releasing local model {}", model_name_);
    }
    free_locked();
}

Expected<void> LlamaCompletionGateway::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialize_locked();
}

Expected<void> LlamaCompletionGateway::initialize_locked() {
    if (model_ != nullptr) {
        return {};
    }

    initialize_global();

    if (auto valid = config_.validate(); !valid) {
        return tl::unexpected(valid.error());
    }

    auto model_params = llama_model_default_params();
    model_params.n_gpu_layers = config_.n_gpu_layers;
    model_params.use_mmap = config_.use_mmap;
    model_params.use_mlock = config_.use_mlock;

    model_ = llama_model_load_from_file(config_.model_path.c_str(), model_params);
    if (model_ == nullptr) {
        return tl::unexpected(Error{
            ErrorCode::ModelLoadFailed,
            "Failed to load model from path: " + config_.model_path
        });
    }

    auto ctx_params = llama_context_default_params();
    ctx_params.n_ctx = static_cast<uint32_t>(config_.context_size);
    ctx_params.n_batch = static_cast<uint32_t>(config_.context_size);
    ctx_params.n_threads = -1;
    ctx_params.n_threads_batch = -1;

    ctx_ = llama_init_from_model(model_, ctx_params);
    if (ctx_ == nullptr) {
        free_locked();
        return tl::unexpected(Error{
            ErrorCode::ContextCreationFailed,
            "Failed to create llama context"
        });
    }
    context_size_ = static_cast<int>(llama_n_ctx(ctx_));

    vocab_ = llama_model_get_vocab(model_);
    if (vocab_ == nullptr) {
        free_locked();
        return tl::unexpected(Error{
            ErrorCode::BackendInitFailed,
            "Failed to get model vocabulary"
        });
    }

    // May be null; llama_chat_apply_template then falls back to ChatML
    tmpl_ = llama_model_chat_template(model_, nullptr);
    formatted_.resize(static_cast<size_t>(context_size_) * 4);

    spdlog::info("Loaded local model {} (context {})", model_name_, context_size_);
    return {};
}

Expected<std::string> LlamaCompletionGateway::format_prompt(const std::vector<Message>& messages) {
    std::vector<llama_chat_message> llama_msgs;
    llama_msgs.reserve(messages.size());
    for (const auto& msg : messages) {
        llama_msgs.push_back({role_to_string(msg.role), msg.content.c_str()});
    }

    int len = llama_chat_apply_template(
        tmpl_, llama_msgs.data(), llama_msgs.size(),
        true, formatted_.data(), static_cast<int32_t>(formatted_.size()));

    if (len > static_cast<int>(formatted_.size())) {
        formatted_.resize(static_cast<size_t>(len));
        len = llama_chat_apply_template(
            tmpl_, llama_msgs.data(), llama_msgs.size(),
            true, formatted_.data(), static_cast<int32_t>(formatted_.size()));
    }

    if (len < 0) {
        return tl::unexpected(Error{
            ErrorCode::InferenceFailed,
            "llama_chat_apply_template failed"
        });
    }
    return std::string(formatted_.begin(), formatted_.begin() + len);
}

Expected<std::vector<int>> LlamaCompletionGateway::tokenize(const std::string& text) {
    static_assert(sizeof(int) == sizeof(llama_token), "int must match llama_token size");

    const int32_t raw = llama_tokenize(vocab_, text.c_str(), static_cast<int32_t>(text.length()),
                                       nullptr, 0, true, true);
    if (raw == INT32_MIN) {
        return tl::unexpected(Error{
            ErrorCode::TokenizationFailed,
            "Tokenization overflow (input too large)"
        });
    }
    const int n_tokens = (raw < 0) ? -raw : raw;
    std::vector<int> tokens(static_cast<size_t>(n_tokens));
    if (n_tokens == 0) {
        return tokens;
    }
    if (llama_tokenize(vocab_, text.c_str(), static_cast<int32_t>(text.length()),
                       reinterpret_cast<llama_token*>(tokens.data()),
                       static_cast<int32_t>(tokens.size()), true, true) < 0) {
        return tl::unexpected(Error{
            ErrorCode::TokenizationFailed,
            "Tokenization failed"
        });
    }
    return tokens;
}

llama_sampler* LlamaCompletionGateway::create_sampler_chain(const GenerationSettings& settings,
                                                            uint32_t seed) const {
    auto chain_params = llama_sampler_chain_default_params();
    llama_sampler* chain = llama_sampler_chain_init(chain_params);
    if (chain == nullptr) {
        return nullptr;
    }

    // penalties -> top-p -> temperature -> distribution
    if (settings.frequency_penalty != 0.0f || settings.presence_penalty != 0.0f) {
        if (auto* penalties = llama_sampler_init_penalties(
                64, 1.0f, settings.frequency_penalty, settings.presence_penalty)) {
            llama_sampler_chain_add(chain, penalties);
        }
    }

    if (settings.top_p < 1.0f) {
        if (auto* top_p = llama_sampler_init_top_p(settings.top_p, 1)) {
            llama_sampler_chain_add(chain, top_p);
        }
    }

    if (settings.temperature > 0.0f) {
        if (auto* temp = llama_sampler_init_temp(settings.temperature)) {
            llama_sampler_chain_add(chain, temp);
        }
        if (auto* dist = llama_sampler_init_dist(seed)) {
            llama_sampler_chain_add(chain, dist);
            return chain;
        }
    }

    if (auto* greedy = llama_sampler_init_greedy()) {
        llama_sampler_chain_add(chain, greedy);
    }
    return chain;
}

size_t LlamaCompletionGateway::find_stop_sequence(const std::string& generated_text, const std::string& stop) {
    if (stop.empty() || generated_text.size() < stop.size()) {
        return 0;
    }
    return generated_text.compare(generated_text.size() - stop.size(), stop.size(), stop) == 0
        ? stop.size() : 0;
}

Expected<std::string> LlamaCompletionGateway::generate(const std::vector<int>& prompt_tokens,
                                                       const GenerationSettings& settings,
                                                       uint32_t seed,
                                                       int& completion_tokens) {
    llama_sampler* sampler = create_sampler_chain(settings, seed);
    if (sampler == nullptr) {
        return tl::unexpected(Error{ErrorCode::BackendInitFailed, "Failed to create sampler chain"});
    }
    struct SamplerGuard {
        llama_sampler* s;
        ~SamplerGuard() { llama_sampler_free(s); }
    } guard{sampler};

    // Every choice starts from an empty cache
    llama_memory_clear(llama_get_memory(ctx_), false);

    std::string generated_text;
    generated_text.reserve(static_cast<size_t>(settings.max_tokens) * 8);
    completion_tokens = 0;

    // llama_decode only reads through the batch pointer
    llama_batch batch = llama_batch_get_one(
        const_cast<llama_token*>(reinterpret_cast<const llama_token*>(prompt_tokens.data())),
        static_cast<int32_t>(prompt_tokens.size()));
    llama_token new_token;

    while (true) {
        const int n_ctx_used = llama_memory_seq_pos_max(llama_get_memory(ctx_), 0) + 1;
        if (n_ctx_used + batch.n_tokens > context_size_) {
            return tl::unexpected(Error{
                ErrorCode::ContextWindowExceeded,
                "Batch tokens exceed context size",
                "batch_size=" + std::to_string(batch.n_tokens) +
                " context_size=" + std::to_string(context_size_)
            });
        }

        if (llama_decode(ctx_, batch) != 0) {
            return tl::unexpected(Error{ErrorCode::InferenceFailed, "Failed to decode batch"});
        }

        new_token = llama_sampler_sample(sampler, ctx_, -1);
        if (llama_vocab_is_eog(vocab_, new_token)) {
            break;
        }

        char buff[256];
        const int n = llama_token_to_piece(vocab_, new_token, buff, sizeof(buff), 0, true);
        if (n < 0) {
            return tl::unexpected(Error{ErrorCode::InferenceFailed, "Failed to convert token to piece"});
        }
        generated_text.append(buff, static_cast<size_t>(n));
        ++completion_tokens;

        if (completion_tokens >= settings.max_tokens) {
            break;
        }

        if (settings.stop.has_value()) {
            if (const size_t match = find_stop_sequence(generated_text, *settings.stop); match > 0) {
                generated_text.resize(generated_text.size() - match);
                break;
            }
        }

        batch = llama_batch_get_one(&new_token, 1);
    }

    return generated_text;
}

Expected<CompletionResult> LlamaCompletionGateway::complete(const CompletionRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (auto valid = request.settings.validate(); !valid) {
        return tl::unexpected(valid.error());
    }
    if (auto ready = initialize_locked(); !ready) {
        return tl::unexpected(ready.error());
    }

    const auto start = std::chrono::steady_clock::now();

    auto prompt = format_prompt(request.messages());
    if (!prompt) {
        return tl::unexpected(prompt.error());
    }
    auto tokens = tokenize(*prompt);
    if (!tokens) {
        return tl::unexpected(tokens.error());
    }
    if (static_cast<int>(tokens->size()) >= context_size_) {
        return tl::unexpected(Error{
            ErrorCode::ContextWindowExceeded,
            "Prompt requires " + std::to_string(tokens->size()) +
            " tokens but context size is " + std::to_string(context_size_)
        });
    }

    const uint32_t base_seed = config_.seed < 0
        ? static_cast<uint32_t>(std::time(nullptr))
        : static_cast<uint32_t>(config_.seed);

    CompletionResult result;
    result.provider = "llama.cpp";
    result.model = model_name_;
    result.usage.prompt_tokens = static_cast<int>(tokens->size()) * request.settings.n;

    for (int i = 0; i < request.settings.n; ++i) {
        int completion_tokens = 0;
        auto text = generate(*tokens, request.settings, base_seed + static_cast<uint32_t>(i), completion_tokens);
        if (!text) {
            return tl::unexpected(text.error());
        }
        result.usage.completion_tokens += completion_tokens;
        result.choices.push_back(Message::assistant(std::move(*text)));
    }

    result.usage.total_tokens = result.usage.prompt_tokens + result.usage.completion_tokens;
    result.latency_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return result;
}

} // namespace gateway
} // namespace geist
