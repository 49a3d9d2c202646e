#include "backranq/engine/evaluation.hpp"

#include <algorithm>
#include <charconv>

namespace backranq::engine
{
  int Score::toCp(int ceiling) const noexcept
  {
    if (kind == Kind::Mate)
      return value > 0 ? ceiling : -ceiling;
    return std::clamp(value, -ceiling, ceiling);
  }

  std::string Score::toString() const
  {
    return (kind == Kind::Mate ? "mate " : "cp ") + std::to_string(value);
  }

  std::optional<Score> Score::parse(std::string_view text)
  {
    while (!text.empty() && text.front() == ' ')
      text.remove_prefix(1);

    Kind kind;
    if (text.rfind("cp ", 0) == 0)
      kind = Kind::Cp;
    else if (text.rfind("mate ", 0) == 0)
      kind = Kind::Mate;
    else
      return std::nullopt;

    text.remove_prefix(kind == Kind::Cp ? 3 : 5);
    while (!text.empty() && text.back() == ' ')
      text.remove_suffix(1);

    int v = 0;
    const char *first = text.data();
    const char *last = text.data() + text.size();
    if (!text.empty() && *first == '+')
      ++first;
    auto [ptr, ec] = std::from_chars(first, last, v);
    if (ec != std::errc{} || ptr != last)
      return std::nullopt;
    return Score{kind, v};
  }

} // namespace backranq::engine
