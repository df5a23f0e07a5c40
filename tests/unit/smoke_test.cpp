#include "nyayacpp/legal_assistant.hpp"
#include "nyayacpp/types.hpp"

#include "../test_logger.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>

int main() {
  nyayacpp::tests::Log("smoke_test: start");
  nyayacpp::AssistantConfig config;
  if (config.chunking.chunk_size != 1024 || config.chunking.overlap != 128) {
    std::cerr << "chunking defaults mismatch\n";
    return EXIT_FAILURE;
  }
  if (config.retrieval.top_k_cases != 5 || config.workflow.cases_analyzed != 5) {
    std::cerr << "retrieval/workflow defaults mismatch\n";
    return EXIT_FAILURE;
  }
  if (config.workflow.min_follow_ups != 2 || config.workflow.max_follow_ups != 4) {
    std::cerr << "follow-up bounds mismatch\n";
    return EXIT_FAILURE;
  }
  try {
    nyayacpp::ValidateConfig(config);
  } catch (const std::exception& ex) {
    std::cerr << "default config rejected: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }

  nyayacpp::tests::Log("smoke_test: finished");
  std::cout << "nyayacpp smoke test passed\n";
  return EXIT_SUCCESS;
}
