#include "backranq/engine/uci/uci_info.hpp"

#include <charconv>

namespace backranq::engine::uci
{
  namespace
  {
    std::vector<std::string_view> splitWs(std::string_view s)
    {
      std::vector<std::string_view> out;
      std::size_t i = 0;
      while (i < s.size())
      {
        while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\r' || s[i] == '\n'))
          ++i;
        std::size_t j = i;
        while (j < s.size() && s[j] != ' ' && s[j] != '\t' && s[j] != '\r' && s[j] != '\n')
          ++j;
        if (j > i)
          out.push_back(s.substr(i, j - i));
        i = j;
      }
      return out;
    }

    std::optional<int> toInt(std::string_view sv)
    {
      int v = 0;
      auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
      if (ec != std::errc{} || ptr != sv.data() + sv.size())
        return std::nullopt;
      return v;
    }
  } // namespace

  std::optional<InfoLine> parseInfoLine(std::string_view line)
  {
    const auto tok = splitWs(line);
    if (tok.empty() || tok[0] != "info")
      return std::nullopt;

    InfoLine info;
    for (std::size_t i = 1; i < tok.size(); ++i)
    {
      const std::string_view t = tok[i];
      if (t == "string")
        return std::nullopt;

      if (t == "depth" && i + 1 < tok.size())
        info.depth = toInt(tok[++i]);
      else if (t == "multipv" && i + 1 < tok.size())
      {
        auto v = toInt(tok[++i]);
        info.multipv = (v && *v > 0) ? *v : 1;
      }
      else if (t == "time" && i + 1 < tok.size())
        info.timeMs = toInt(tok[++i]);
      else if (t == "score" && i + 2 < tok.size())
      {
        const std::string_view kind = tok[i + 1];
        auto v = toInt(tok[i + 2]);
        i += 2;
        if (v && kind == "cp")
          info.score = Score::cp(*v);
        else if (v && kind == "mate")
          info.score = Score::mate(*v);
      }
      else if (t == "lowerbound" || t == "upperbound")
        info.bound = true;
      else if (t == "pv")
      {
        // pv runs to the end of the line
        for (++i; i < tok.size(); ++i)
          info.pv.emplace_back(tok[i]);
      }
    }
    return info;
  }

  std::optional<std::string> parseBestMove(std::string_view line)
  {
    const auto tok = splitWs(line);
    if (tok.empty() || tok[0] != "bestmove")
      return std::nullopt;
    if (tok.size() < 2 || tok[1] == "(none)" || tok[1] == "0000")
      return std::string{};
    return std::string(tok[1]);
  }

} // namespace backranq::engine::uci
