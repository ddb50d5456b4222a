#include "internal/skills/dialog_extractor.hpp"

#include <array>
#include <cctype>
#include <sstream>

#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace engram::skills {

namespace {

// Matched against the lowercased line.
constexpr std::array<std::string_view, 2> kStepPrefixes = {"step", "шаг"};

constexpr std::array<std::string_view, 4> kExampleKeywords = {"example", "e.g.", "например", "пример"};

constexpr std::array<std::string_view, 10> kConstraintKeywords = {
    "must not", "never", "do not", "don't", "forbidden", "constraint", "нельзя", "запрещено", "ограничение", "не ",
};

template <std::size_t N>
bool ContainsAny(std::string_view text, const std::array<std::string_view, N>& keywords) {
  for (auto keyword : keywords) {
    if (util::Contains(text, keyword)) return true;
  }
  return false;
}

bool IsNumbered(std::string_view line) {
  std::size_t digits = 0;
  while (digits < line.size() && std::isdigit(static_cast<unsigned char>(line[digits]))) ++digits;
  return digits > 0 && digits < line.size() && (line[digits] == '.' || line[digits] == ')');
}

bool IsStep(std::string_view line, std::string_view lowered) {
  if (IsNumbered(line) || util::StartsWith(line, "- ")) return true;
  for (auto prefix : kStepPrefixes) {
    if (util::StartsWith(lowered, prefix)) return true;
  }
  return false;
}

// "1. do x" -> "do x", "- do x" -> "do x"
std::string StripMarker(std::string_view line) {
  std::size_t start = 0;
  while (start < line.size()) {
    const char c = line[start];
    if (std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == ')' || c == '-' || c == ' ') {
      ++start;
      continue;
    }
    break;
  }
  auto stripped = util::Trim(line.substr(start));
  return stripped.empty() ? util::Trim(line) : stripped;
}

} // namespace

DialogSkill ExtractSkillFromDialog(std::string_view text) {
  if (util::IsBlank(text)) throw util::InvalidArgument("dialog text must not be blank");

  DialogSkill        skill;
  std::istringstream input{std::string(text)};
  std::string        raw;
  while (std::getline(input, raw)) {
    const auto line = util::Trim(raw);
    if (line.empty()) continue;

    if (skill.goal.empty()) {
      skill.goal = line;
      continue;
    }

    const auto lowered = util::ToLower(line);
    if (IsStep(line, lowered)) {
      skill.steps.push_back(StripMarker(line));
    } else if (ContainsAny(lowered, kExampleKeywords)) {
      skill.examples.push_back(line);
    } else if (ContainsAny(lowered, kConstraintKeywords)) {
      skill.constraints.push_back(line);
    }
  }
  return skill;
}

} // namespace engram::skills
