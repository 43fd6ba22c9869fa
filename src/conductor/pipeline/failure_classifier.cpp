#include "conductor/pipeline/failure_classifier.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace conductor {

namespace {

struct Detector {
  FailureSignature signature;
  std::array<std::string_view, 4> needles;
};

// Order matters: the more specific "could not determine current" must be
// tried before the generic "could not determine".
constexpr std::array<Detector, 6> kDetectors = {{
    {FailureSignature::MissingCurrentState,
     {"could not determine current", "current state", "missing current", ""}},
    {FailureSignature::MissingTargetFile,
     {"file not found", "no such file", "missing target file", ""}},
    {FailureSignature::VagueRequirements,
     {"could not determine", "ambiguous", "unclear", "vague"}},
    {FailureSignature::SyntaxError,
     {"syntax error", "syntaxerror", "parse error", "unexpected token"}},
    {FailureSignature::TestFailure,
     {"tests failed", "test failed", "failed test", "assertion"}},
    {FailureSignature::Timeout, {"timed out", "timeout", "", ""}},
}};

constexpr std::array<std::string_view, 4> kMissingCurrentStateSteps = {
    "Examine the target file to identify its current state",
    "Document the exact code or text that needs changing",
    "Write explicit current/required change blocks",
    "Name exact line numbers or functions",
};

constexpr std::array<std::string_view, 4> kMissingTargetFileSteps = {
    "Identify the specific file that needs modification",
    "Verify the file exists in the codebase",
    "Document the full file path",
    "Confirm write access to the file",
};

constexpr std::array<std::string_view, 4> kVagueRequirementsSteps = {
    "Break the requirement down into specific actions",
    "Identify concrete, measurable outcomes",
    "Write a step-by-step implementation plan",
    "Define clear success criteria",
};

constexpr std::array<std::string_view, 3> kSyntaxErrorSteps = {
    "Inspect the reported location for malformed code",
    "Run the project's formatter or linter on the touched files",
    "Reduce the change to the smallest compilable edit",
};

constexpr std::array<std::string_view, 3> kTestFailureSteps = {
    "Reproduce the failing test locally",
    "Compare the expected and actual values in the assertion",
    "Decide whether the code or the test expectation is wrong",
};

constexpr std::array<std::string_view, 3> kTimeoutSteps = {
    "Split the subtask into smaller units of work",
    "Check the worker backend for stalls or contention",
    "Raise the per-subtask timeout if the work is legitimately long",
};

constexpr std::array<std::string_view, 4> kUnknownSteps = {
    "Research the specific failure message",
    "Investigate similar tasks that succeeded",
    "Consult the documentation for the failing worker",
    "Write a more detailed task description",
};

auto contains(std::string_view haystack, std::string_view needle)
    -> bool {
  return !std::ranges::search(haystack, needle).empty();
}

}  // namespace

auto classify_failure(std::string_view error) -> FailureSignature {
  std::string lowered(error);
  std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  for (const auto& detector : kDetectors) {
    for (auto needle : detector.needles) {
      if (!needle.empty() && contains(lowered, needle)) {
        return detector.signature;
      }
    }
  }
  return FailureSignature::Unknown;
}

auto next_steps(FailureSignature signature)
    -> std::span<const std::string_view> {
  switch (signature) {
    case FailureSignature::MissingCurrentState:
      return kMissingCurrentStateSteps;
    case FailureSignature::MissingTargetFile:
      return kMissingTargetFileSteps;
    case FailureSignature::VagueRequirements:
      return kVagueRequirementsSteps;
    case FailureSignature::SyntaxError:
      return kSyntaxErrorSteps;
    case FailureSignature::TestFailure:
      return kTestFailureSteps;
    case FailureSignature::Timeout:
      return kTimeoutSteps;
    case FailureSignature::Unknown:
      break;
  }
  return kUnknownSteps;
}

auto next_step_hint(FailureSignature signature) -> std::string {
  return fmt::format("{}", fmt::join(next_steps(signature), "; "));
}

auto suggested_fix(FailureSignature signature) -> std::string_view {
  switch (signature) {
    case FailureSignature::MissingCurrentState:
      return "Include the current code or text alongside the requested change";
    case FailureSignature::MissingTargetFile:
      return "Name the target file by its full path";
    case FailureSignature::VagueRequirements:
      return "Restate the request as concrete, verifiable steps";
    case FailureSignature::SyntaxError:
      return "Apply a mechanical fix to the malformed output";
    case FailureSignature::TestFailure:
      return "Regenerate the change against the failing assertions";
    case FailureSignature::Timeout:
      return "Simplify or split the subtask";
    case FailureSignature::Unknown:
      break;
  }
  return "Review and improve the implementation";
}

}  // namespace conductor
