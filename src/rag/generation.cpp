#include "nyayacpp/generation.hpp"
#include "nyayacpp/errors.hpp"

#include "../text/legal_text.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

namespace nyayacpp {
namespace {

std::string ShellEscape(const std::string& value) {
  std::string out = "'";
  for (const char ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

// Removes the prompt file when the request finishes.
class PromptFile final {
 public:
  explicit PromptFile(const std::string& contents) {
    auto pattern = (std::filesystem::temp_directory_path() / "nyayacpp-prompt-XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    const int fd = ::mkstemp(buffer.data());
    if (fd < 0) {
      throw ProviderError("generation: cannot create prompt file");
    }
    ::close(fd);
    path_ = buffer.data();
    std::ofstream out(path_, std::ios::binary | std::ios::trunc);
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    if (!out) {
      std::error_code ec;
      std::filesystem::remove(path_, ec);
      throw ProviderError("generation: cannot write prompt file " + path_.string());
    }
  }

  ~PromptFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
      spdlog::warn("generation: failed to remove prompt file {}: {}", path_.string(), ec.message());
    }
  }

  PromptFile(const PromptFile&) = delete;
  PromptFile& operator=(const PromptFile&) = delete;

  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

}  // namespace

std::string RenderPrompt(const GenerationRequest& request) {
  if (request.system_prompt.empty()) {
    return request.user_prompt;
  }
  return request.system_prompt + "\n\n" + request.user_prompt;
}

CommandGenerationClient::CommandGenerationClient(std::string command) : command_(text::Trim(command)) {
  if (command_.empty()) {
    throw ConfigurationError("CommandGenerationClient: generation command must not be empty");
  }
}

bool CommandGenerationClient::available() const {
  const auto words = text::SplitWhitespaceTokens(command_);
  if (words.empty()) {
    return false;
  }
  const std::string lookup = "command -v " + ShellEscape(words.front()) + " >/dev/null 2>&1";
  return std::system(lookup.c_str()) == 0;
}

std::string CommandGenerationClient::Generate(const GenerationRequest& request) {
  if (request.max_tokens <= 0) {
    throw ConfigurationError("generation: max_tokens must be positive");
  }
  PromptFile prompt(RenderPrompt(request));
  const auto shell_command = fmt::format("NYAYACPP_MAX_TOKENS={} NYAYACPP_TEMPERATURE={:.2f} {} < {}",
                                         request.max_tokens,
                                         request.temperature,
                                         command_,
                                         ShellEscape(prompt.path().string()));

  FILE* pipe = ::popen(shell_command.c_str(), "r");
  if (pipe == nullptr) {
    throw ProviderTransientError("generation: failed to start command");
  }
  std::string output{};
  std::array<char, 4096> buffer{};
  while (true) {
    const auto n = std::fread(buffer.data(), 1, buffer.size(), pipe);
    if (n > 0) {
      output.append(buffer.data(), n);
    }
    if (n < buffer.size()) {
      break;
    }
  }
  const int status = ::pclose(pipe);
  if (status != 0) {
    const int exit_code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : status;
    throw ProviderTransientError("generation: command exited with status " + std::to_string(exit_code));
  }

  auto trimmed = text::Trim(output);
  if (trimmed.empty()) {
    throw ProviderError("generation: command produced no output");
  }
  return trimmed;
}

}  // namespace nyayacpp
