#include "prompts.hpp"

#include "nyayacpp/case_corpus.hpp"

#include "../text/legal_text.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nyayacpp::prompts {
namespace {

constexpr const char* kAnalysisSystemPrompt =
    "You are a legal query analyzer. Extract the main legal issues and keywords from the user's query.\n"
    "Return your response in this format:\n"
    "LEGAL ISSUES:\n"
    "- [issue 1]\n"
    "- [issue 2]\n"
    "\n"
    "KEYWORDS:\n"
    "- [keyword 1]\n"
    "- [keyword 2]";

constexpr const char* kSummarySystemPrompt =
    "You are a legal case summarizer. Extract the key legal arguments, holdings, and reasoning from the "
    "provided case text. Be concise but comprehensive.";

constexpr const char* kAnalystSystemPrompt =
    "You are NyayaSahayak, an expert Indian legal AI assistant.\n"
    "Provide comprehensive legal analysis based on the retrieved cases.\n"
    "\n"
    "Your response should:\n"
    "1. Address the legal query directly\n"
    "2. Reference specific cases and their holdings by title and citation\n"
    "3. Explain relevant legal principles and doctrines\n"
    "4. Provide balanced analysis\n"
    "5. Use proper legal terminology\n"
    "6. Acknowledge any limitations";

constexpr const char* kDirectSystemPrompt =
    "You are an expert Indian legal AI assistant named NyayaSahayak.\n"
    "Your role is to provide accurate, well-reasoned legal analysis based on Indian case law and statutes.\n"
    "\n"
    "When answering:\n"
    "1. Base your response on the provided case law context\n"
    "2. Cite specific cases and their citations\n"
    "3. Explain legal principles clearly\n"
    "4. Identify relevant legal doctrines and precedents\n"
    "5. Provide balanced analysis considering multiple perspectives\n"
    "6. Use proper legal terminology\n"
    "\n"
    "Always maintain professional tone and acknowledge limitations when information is insufficient.";

constexpr std::string_view kFollowUpHeading = "follow-up questions:";
constexpr std::size_t kExtractiveSnippetBytes = 400;

std::vector<std::string> SplitLines(std::string_view text) {
  std::vector<std::string> lines{};
  std::size_t start = 0;
  while (start <= text.size()) {
    const auto end = text.find('\n', start);
    if (end == std::string_view::npos) {
      lines.emplace_back(text.substr(start));
      break;
    }
    lines.emplace_back(text.substr(start, end - start));
    start = end + 1;
  }
  return lines;
}

// Strips "- ", "* ", "1. " or "2) " from a list line. Returns false for non-list lines.
bool StripBullet(const std::string& line, std::string& item) {
  if (line.empty()) {
    return false;
  }
  if (line[0] == '-' || line[0] == '*') {
    item = text::Trim(std::string_view(line).substr(1));
    return true;
  }
  std::size_t digits = 0;
  while (digits < line.size() && std::isdigit(static_cast<unsigned char>(line[digits])) != 0) {
    ++digits;
  }
  if (digits > 0 && digits < line.size() && (line[digits] == '.' || line[digits] == ')')) {
    item = text::Trim(std::string_view(line).substr(digits + 1));
    return true;
  }
  return false;
}

std::string StripMarkup(std::string value) {
  while (!value.empty() && (value.back() == '*' || value.back() == '#' || value.back() == '_')) {
    value.pop_back();
  }
  std::size_t start = 0;
  while (start < value.size() && (value[start] == '*' || value[start] == '_')) {
    ++start;
  }
  return text::Trim(std::string_view(value).substr(start));
}

bool ContainsInsensitive(const std::string& haystack_lower, const std::string& needle) {
  const auto needle_lower = text::ToLower(needle);
  return !needle_lower.empty() && haystack_lower.find(needle_lower) != std::string::npos;
}

std::string IssueSubject(const WorkflowState& state) {
  std::string subject = state.extracted_issues.empty() ? state.query : state.extracted_issues.front();
  subject = text::Trim(subject);
  while (!subject.empty() && (subject.back() == '?' || subject.back() == '.')) {
    subject.pop_back();
  }
  return subject.empty() ? std::string("this issue") : subject;
}

std::vector<std::string> DefaultFollowUps(const WorkflowState& state) {
  if (!state.evidence_found || state.retrieved_cases.empty()) {
    return {
        "Can you describe the facts of your situation in more detail?",
        "Which court or jurisdiction is relevant to your question?",
        "Which statute or constitutional provision do you believe applies?",
        "Is there a particular period of decisions you are interested in?",
    };
  }
  const auto subject = IssueSubject(state);
  return {
      "How have later decisions applied the reasoning in " + state.retrieved_cases.front().title + "?",
      "What remedies are available in matters involving " + subject + "?",
      "Which statutory provisions govern " + subject + "?",
      "Are there contrary precedents on " + subject + "?",
  };
}

std::string CasesList(const std::vector<RetrievedCase>& cases, std::size_t limit) {
  std::string out{};
  for (std::size_t i = 0; i < cases.size() && i < limit; ++i) {
    out += "- " + cases[i].title + " (" + cases[i].citation + ")\n";
  }
  return out;
}

std::string FollowUpInstruction(const WorkflowConfig& config) {
  return "\n\nEnd your response with a section headed \"FOLLOW-UP QUESTIONS:\" listing " +
         std::to_string(config.min_follow_ups) + " to " + std::to_string(config.max_follow_ups) +
         " follow-up questions, one per line, each starting with \"- \".";
}

}  // namespace

GenerationRequest AnalysisRequest(const std::string& query, const WorkflowConfig& config) {
  return GenerationRequest{
      .system_prompt = kAnalysisSystemPrompt,
      .user_prompt = "Analyze this legal query: " + query,
      .max_tokens = config.analysis_max_tokens,
      .temperature = config.temperature,
  };
}

AnalysisResult ParseAnalysis(std::string_view response, std::size_t max_issues, std::size_t max_keywords) {
  enum class Section { kNone, kIssues, kKeywords };
  AnalysisResult result{};
  Section section = Section::kNone;
  for (const auto& raw_line : SplitLines(response)) {
    const auto line = text::Trim(raw_line);
    const auto lower = text::ToLower(line);
    if (lower.find("legal issues:") != std::string::npos) {
      section = Section::kIssues;
      continue;
    }
    if (lower.find("keywords:") != std::string::npos) {
      section = Section::kKeywords;
      continue;
    }
    std::string item{};
    if (!StripBullet(line, item)) {
      continue;
    }
    item = StripMarkup(std::move(item));
    if (item.empty()) {
      continue;
    }
    if (section == Section::kIssues && result.issues.size() < max_issues) {
      result.issues.push_back(std::move(item));
    } else if (section == Section::kKeywords && result.keywords.size() < max_keywords) {
      result.keywords.push_back(std::move(item));
    }
  }
  return result;
}

std::string SegmentContext(const RetrievedCase& retrieved, std::size_t max_segments, std::size_t max_bytes) {
  std::string context{};
  std::size_t used = 0;
  for (const auto& segment : retrieved.supporting_segments) {
    if (used >= max_segments) {
      break;
    }
    if (!context.empty()) {
      context += "\n...\n";
    }
    context += segment.text;
    ++used;
  }
  return text::TruncateUtf8(context, max_bytes);
}

GenerationRequest SummaryRequest(const RetrievedCase& retrieved, const WorkflowConfig& config) {
  const auto context = SegmentContext(retrieved,
                                      retrieved.supporting_segments.size(),
                                      static_cast<std::size_t>(config.summary_context_chars));
  return GenerationRequest{
      .system_prompt = kSummarySystemPrompt,
      .user_prompt = "Case: " + retrieved.title + "\nCitation: " + retrieved.citation + "\n\nText:\n" + context +
                     "\n\nProvide a brief summary of the key legal points.",
      .max_tokens = config.summary_max_tokens,
      .temperature = config.temperature,
  };
}

GenerationRequest SynthesisRequest(const WorkflowState& state, const WorkflowConfig& config) {
  std::string issues{};
  for (const auto& issue : state.extracted_issues) {
    issues += "- " + issue + "\n";
  }

  const auto case_limit = static_cast<std::size_t>(std::max(state.cases_analyzed_cap, 1));
  std::string context{};
  if (!state.summaries.empty()) {
    for (const auto& summary : state.summaries) {
      if (!context.empty()) {
        context += "\n\n";
      }
      context += "[" + summary.title + " (" + summary.citation + ")]: " + summary.summary;
    }
  } else {
    for (std::size_t i = 0; i < state.retrieved_cases.size() && i < case_limit; ++i) {
      const auto& retrieved = state.retrieved_cases[i];
      if (!context.empty()) {
        context += "\n\n";
      }
      context += "[" + retrieved.title + " (" + retrieved.citation + ")]: " +
                 SegmentContext(retrieved,
                                static_cast<std::size_t>(config.direct_context_segments_per_case),
                                static_cast<std::size_t>(config.summary_context_chars));
    }
  }

  return GenerationRequest{
      .system_prompt = std::string(kAnalystSystemPrompt) + FollowUpInstruction(config),
      .user_prompt = "Query: " + state.query + "\n\nLegal Issues Identified:\n" + issues + "\nRelated Cases:\n" +
                     CasesList(state.retrieved_cases, case_limit) + "\nCase Summaries and Analysis:\n" + context +
                     "\n\nProvide a comprehensive legal analysis addressing the query.",
      .max_tokens = config.synthesis_max_tokens,
      .temperature = config.temperature,
  };
}

GenerationRequest DirectSynthesisRequest(const WorkflowState& state,
                                         std::size_t case_count,
                                         const WorkflowConfig& config) {
  std::string context{};
  for (std::size_t i = 0; i < state.retrieved_cases.size() && i < case_count; ++i) {
    const auto& retrieved = state.retrieved_cases[i];
    context += "[Case " + std::to_string(i + 1) + "]\n";
    context += "Title: " + retrieved.title + "\n";
    context += "Citation: " + retrieved.citation + "\n";
    context += "Court: " + retrieved.court + "\n";
    context += "Decision Date: " + retrieved.decision_date + "\n\n";
    context += "Relevant Text:\n" +
               SegmentContext(retrieved,
                              static_cast<std::size_t>(config.direct_context_segments_per_case),
                              static_cast<std::size_t>(config.summary_context_chars)) +
               "\n\n---\n";
  }
  return GenerationRequest{
      .system_prompt = std::string(kDirectSystemPrompt) + FollowUpInstruction(config),
      .user_prompt = "Based on the following Indian legal cases and context, please answer the query.\n\nCONTEXT:\n" +
                     context + "\nQUERY: " + state.query + "\n\nPlease provide a comprehensive legal analysis.",
      .max_tokens = config.synthesis_max_tokens,
      .temperature = config.temperature,
  };
}

SynthesisResult ParseSynthesis(std::string_view response) {
  SynthesisResult result{};
  const auto lower = text::ToLower(response);
  const auto heading = lower.find(kFollowUpHeading);
  if (heading == std::string::npos) {
    result.answer = text::Trim(response);
    return result;
  }

  auto answer = std::string(response.substr(0, heading));
  // Drop a markdown heading prefix left on the heading line, e.g. "## " or "**".
  const auto line_start = answer.rfind('\n');
  const auto tail = text::Trim(std::string_view(answer).substr(line_start == std::string::npos ? 0 : line_start));
  if (!tail.empty() && tail.find_first_not_of("#*_ ") == std::string::npos) {
    answer.erase(line_start == std::string::npos ? 0 : line_start);
  }
  result.answer = text::Trim(answer);

  const auto rest = response.substr(heading + kFollowUpHeading.size());
  for (const auto& raw_line : SplitLines(rest)) {
    const auto line = StripMarkup(text::Trim(raw_line));
    if (line.empty()) {
      continue;
    }
    std::string item{};
    if (StripBullet(line, item)) {
      item = StripMarkup(std::move(item));
    } else if (line.back() == '?') {
      item = line;
    } else {
      continue;
    }
    if (!item.empty()) {
      result.follow_ups.push_back(std::move(item));
    }
  }
  return result;
}

std::vector<std::string> ClampFollowUps(std::vector<std::string> follow_ups,
                                        const WorkflowState& state,
                                        std::size_t min_count,
                                        std::size_t max_count) {
  if (follow_ups.size() > max_count) {
    follow_ups.resize(max_count);
  }
  if (follow_ups.size() < min_count) {
    for (auto& candidate : DefaultFollowUps(state)) {
      if (follow_ups.size() >= min_count) {
        break;
      }
      const auto candidate_lower = text::ToLower(candidate);
      const bool duplicate = std::any_of(follow_ups.begin(), follow_ups.end(), [&](const std::string& existing) {
        return text::ToLower(existing) == candidate_lower;
      });
      if (!duplicate) {
        follow_ups.push_back(std::move(candidate));
      }
    }
  }
  return follow_ups;
}

bool MentionsAnyCase(const std::string& answer, const std::vector<RetrievedCase>& cases) {
  const auto answer_lower = text::ToLower(answer);
  for (const auto& retrieved : cases) {
    if (retrieved.title != kUntitledCase && ContainsInsensitive(answer_lower, retrieved.title)) {
      return true;
    }
    if (retrieved.citation != kNoCitation && ContainsInsensitive(answer_lower, retrieved.citation)) {
      return true;
    }
  }
  return false;
}

std::string SourcesLine(const std::vector<RetrievedCase>& cases) {
  std::string line = "Sources: ";
  for (std::size_t i = 0; i < cases.size(); ++i) {
    if (i != 0) {
      line += "; ";
    }
    line += cases[i].title + " (" + cases[i].citation + ")";
  }
  return line;
}

std::string ExtractiveAnswer(const WorkflowState& state, std::size_t case_count) {
  std::string answer = "A generated analysis is not available. The closest matching cases for \"" + state.query +
                       "\" are:";
  for (std::size_t i = 0; i < state.retrieved_cases.size() && i < case_count; ++i) {
    const auto& retrieved = state.retrieved_cases[i];
    std::string gist{};
    const auto summary = std::find_if(state.summaries.begin(), state.summaries.end(), [&](const CaseSummary& s) {
      return s.case_id == retrieved.case_id;
    });
    if (summary != state.summaries.end()) {
      gist = summary->summary;
    } else if (!retrieved.supporting_segments.empty()) {
      gist = text::TruncateUtf8(retrieved.supporting_segments.front().text, kExtractiveSnippetBytes);
    }
    answer += "\n- " + retrieved.title + " (" + retrieved.citation + "), " + retrieved.court + ", " +
              retrieved.decision_date + ": " + text::Trim(gist);
  }
  return answer;
}

}  // namespace nyayacpp::prompts
