#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace engram::skills {

struct DialogSkill {
  std::string              goal;
  std::vector<std::string> steps;
  std::vector<std::string> examples;
  std::vector<std::string> constraints;
};

/*
  Heuristic skill extraction from free dialog text.

  The first non-empty line is the goal. Each later line is a step when it
  starts with a number ("1.", "2)"), a "- " bullet or the word step/шаг;
  otherwise an example when it mentions an example keyword; otherwise a
  constraint when it mentions a prohibition. Other lines are ignored.

  Throws util::InvalidArgument for blank text.
*/
DialogSkill ExtractSkillFromDialog(std::string_view text);

} // namespace engram::skills
