#pragma once
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <cstdint>

namespace costgate {

constexpr double kDefaultTemperature = 0.7;
constexpr uint32_t kDefaultMaxTokens = 1024;
constexpr double kDefaultTopP = 1.0;

// A single text-generation request. Optional fields fall back to the
// provider-side defaults above; `provider` falls back to the service default.
struct CompletionRequest {
    std::string prompt;
    std::optional<std::string> system;
    std::optional<std::string> provider;
    std::optional<double> temperature;
    std::optional<uint32_t> max_tokens;
    std::optional<double> top_p;
    std::vector<std::string> stop_sequences;

    // Force a fresh upstream call; the result is not stored either.
    bool skip_cache = false;

    // Free-form label for logs and activity records. Not part of the cache key.
    std::string description;
};

struct TokenUsage {
    uint64_t input_tokens = 0;
    uint64_t output_tokens = 0;
    uint64_t total_tokens = 0;
};

struct Completion {
    std::string text;
    TokenUsage usage;
};

// Abstract base class for upstream text-generation providers.
// complete() throws std::runtime_error on any upstream failure.
class Provider {
public:
    virtual ~Provider() = default;

    virtual Completion complete(const CompletionRequest& request) = 0;

    virtual std::string provider_name() const = 0;

    // False when credentials are missing; complete() will throw.
    virtual bool is_configured() const = 0;
};

class HttpClient; // forward declaration
struct ProviderEntry;

// Factory: create provider by name via the plugin registry.
std::unique_ptr<Provider> create_provider(const std::string& name,
                                          const ProviderEntry& entry,
                                          HttpClient& http);

} // namespace costgate
