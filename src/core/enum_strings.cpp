#include "stratai/core/enum_strings.h"

#include "stratai/util/strings.h"

namespace stratai {

std::string difficulty_level_to_string(DifficultyLevel l) {
  switch (l) {
    case DifficultyLevel::Civilian: return "civilian";
    case DifficultyLevel::Ensign: return "ensign";
    case DifficultyLevel::Captain: return "captain";
    case DifficultyLevel::Commodore: return "commodore";
    case DifficultyLevel::Admiral: return "admiral";
    case DifficultyLevel::GrandAdmiral: return "grand_admiral";
  }
  return "commodore";
}

bool difficulty_level_from_string(const std::string& raw, DifficultyLevel& out) {
  const std::string s = to_lower(trim_copy(raw));
  if (s == "civilian") {
    out = DifficultyLevel::Civilian;
  } else if (s == "ensign") {
    out = DifficultyLevel::Ensign;
  } else if (s == "captain") {
    out = DifficultyLevel::Captain;
  } else if (s == "commodore") {
    out = DifficultyLevel::Commodore;
  } else if (s == "admiral") {
    out = DifficultyLevel::Admiral;
  } else if (s == "grand_admiral" || s == "grandadmiral") {
    out = DifficultyLevel::GrandAdmiral;
  } else {
    return false;
  }
  return true;
}

} // namespace stratai
