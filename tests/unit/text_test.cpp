#include "internal/util/errors.hpp"
#include "internal/util/string_list.hpp"
#include "internal/util/text.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace {

using namespace engram::util;

void TestTrimAndNormalize() {
  assert(Trim("  a b \n") == "a b");
  assert(Trim("\t\t") == "");
  assert(NormalizeText("  Port   80\tIS open ") == "port 80 is open");
  assert(NormalizeText("Port 80") == NormalizeText("port  80 "));
  assert(NormalizeText("port 80") != NormalizeText("port 8080"));
}

void TestNonAsciiCaseFolding() {
  assert(ToLower("ПОРТ Равен 80") == "порт равен 80");
  assert(ToLower("ЁЖИК Ї") == "ёжик ї");
  assert(ToLower("ÀÉÎÕÜ Straße ŁÓDŹ") == "àéîõü straße łódź");
  // untouched: already lower, CJK, malformed bytes
  assert(ToLower("уже 東京") == "уже 東京");
  assert(ToLower(std::string("A\xD0")) == std::string("a\xD0"));

  assert(NormalizeText("Порт равен 80") == NormalizeText("  порт   РАВЕН 80 "));
  assert(NormalizeText("порт равен 80") != NormalizeText("порт равен 8080"));
  assert(KeywordOverlap("ПОРТ", "порт 80") == 1.0);
  assert(KeywordOverlap("сервер Порт", "Сервер слушает порт") == 1.0);
}

void TestBlankAndNul() {
  assert(IsBlank(""));
  assert(IsBlank(" \t\n"));
  assert(!IsBlank(" x "));
  assert(StripNul(std::string("a\0b", 3)) == "ab");
}

void TestKeywordOverlap() {
  assert(KeywordOverlap("port server", "The Server listens") == 0.5);
  assert(KeywordOverlap("", "anything") == 0.0);
  assert(KeywordOverlap("   ", "anything") == 0.0);
  assert(KeywordOverlap("PORT", "port 80") == 1.0);

  const auto tokens = Tokenize("A  b\tC");
  assert((tokens == std::vector<std::string>{"a", "b", "c"}));
}

void TestIsoTimestamps() {
  const auto parsed = ParseIso8601("2024-05-01T12:00:00Z");
  assert(parsed.has_value());
  assert(ToUnixSeconds(*parsed) == 1714564800);

  // no zone designator means UTC
  const auto naive = ParseIso8601("2024-05-01 12:00:00");
  assert(naive.has_value());
  assert(ToUnixSeconds(*naive) == 1714564800);

  assert(ToIso8601(FromUnixSeconds(1714564800)) == "2024-05-01T12:00:00.000Z");
  assert(!ParseIso8601("not a date").has_value());
  assert(!ParseIso8601("").has_value());
}

void TestStringListsAndIds() {
  const std::vector<std::string> steps = {"open the file", "say \"hi\"", "шаг три"};
  assert(DecodeStringList(EncodeStringList(steps)) == steps);
  assert(DecodeStringList("").empty());

  bool threw = false;
  try {
    (void)DecodeStringList("{not json");
  } catch (const InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  const auto id = NewShortId("skill-");
  assert(id.size() == 18);
  assert(StartsWith(id, "skill-"));
  assert(NewId() != NewId());
  assert(NewId().size() == 36);
}

} // namespace

int main() {
  TestTrimAndNormalize();
  TestNonAsciiCaseFolding();
  TestBlankAndNul();
  TestKeywordOverlap();
  TestIsoTimestamps();
  TestStringListsAndIds();

  std::cout << "engram_unit_text: pass" << std::endl;
  return 0;
}
