#pragma once

#include <string>

namespace nyayacpp {

struct GenerationRequest {
  std::string system_prompt;
  std::string user_prompt;
  int max_tokens = 500;
  float temperature = 0.7F;
};

// Text generation backend. Implementations must be safe to call from several threads at once.
class GenerationClient {
 public:
  virtual ~GenerationClient() = default;

  virtual bool available() const { return true; }
  // Throws ProviderTransientError for retryable failures, ProviderError otherwise.
  virtual std::string Generate(const GenerationRequest& request) = 0;
};

// Runs a shell command per request with the rendered prompt on stdin and returns its stdout.
// NYAYACPP_MAX_TOKENS and NYAYACPP_TEMPERATURE are exported to the command.
class CommandGenerationClient final : public GenerationClient {
 public:
  explicit CommandGenerationClient(std::string command);

  const std::string& command() const { return command_; }

  bool available() const override;
  std::string Generate(const GenerationRequest& request) override;

 private:
  std::string command_;
};

// System prompt, a blank line, then the user prompt.
[[nodiscard]] std::string RenderPrompt(const GenerationRequest& request);

}  // namespace nyayacpp
