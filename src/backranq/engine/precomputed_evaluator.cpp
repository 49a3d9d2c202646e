#include "backranq/engine/precomputed_evaluator.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace backranq::engine
{
  namespace fs = std::filesystem;

  static std::string trim(std::string s)
  {
    auto issp = [](unsigned char c)
    { return std::isspace(c); };
    while (!s.empty() && issp((unsigned char)s.front()))
      s.erase(s.begin());
    while (!s.empty() && issp((unsigned char)s.back()))
      s.pop_back();
    return s;
  }

  // "cp 35 f1b5 a7a6" -> line; the first pv move is the line's move.
  static bool parseLineValue(const std::string &v, EvalLine &out)
  {
    std::istringstream is(v);
    std::string kind, value;
    if (!(is >> kind >> value))
      return false;
    auto score = Score::parse(kind + " " + value);
    if (!score)
      return false;
    out = EvalLine{};
    out.score = *score;
    std::string mv;
    while (is >> mv)
      out.pvUci.push_back(mv);
    if (out.pvUci.empty())
      return false;
    out.moveUci = out.pvUci.front();
    return true;
  }

  std::string PrecomputedEvaluator::positionKey(const std::string &fen)
  {
    // Placement, side, castling, en passant
    std::istringstream is(fen);
    std::string field, key;
    for (int i = 0; i < 4 && (is >> field); ++i)
    {
      if (i)
        key.push_back(' ');
      key += field;
    }
    return key;
  }

  void PrecomputedEvaluator::add(const std::string &fen, EvalSnapshot snap)
  {
    std::lock_guard lk(m_mtx);
    m_table[positionKey(fen)] = {fen, std::move(snap)};
  }

  bool PrecomputedEvaluator::contains(const std::string &fen) const
  {
    std::lock_guard lk(m_mtx);
    return m_table.count(positionKey(fen)) != 0;
  }

  std::size_t PrecomputedEvaluator::size() const
  {
    std::lock_guard lk(m_mtx);
    return m_table.size();
  }

  EvalStreamPtr PrecomputedEvaluator::evaluate(const EvalRequest &req)
  {
    {
      std::lock_guard lk(m_mtx);
      auto it = m_table.find(positionKey(req.fen));
      // Entries shallower than the request count as misses.
      if (it != m_table.end() && !(req.minDepth && it->second.second.depth < *req.minDepth))
      {
        EvalSnapshot snap = it->second.second;
        const std::size_t want = static_cast<std::size_t>(std::max(1, req.multiPv));
        if (snap.lines.size() > want)
          snap.lines.resize(want);
        auto stream = std::make_shared<EvalStream>(1);
        stream->publish(std::move(snap));
        stream->finish();
        return stream;
      }
    }

    if (!m_fallback)
    {
      auto stream = std::make_shared<EvalStream>(1);
      stream->fail("no precomputed evaluation for " + req.fen);
      return stream;
    }

    EvalStreamPtr stream = m_fallback->evaluate(req);
    std::lock_guard lk(m_mtx);
    m_pending.emplace_back(req.fen, stream);
    return stream;
  }

  void PrecomputedEvaluator::harvestPending()
  {
    std::lock_guard lk(m_mtx);
    for (const auto &[fen, stream] : m_pending)
    {
      if (!stream || stream->status() != StreamStatus::Done)
        continue;
      auto snap = stream->latest();
      if (snap && !snap->lines.empty())
        m_table[positionKey(fen)] = {fen, std::move(*snap)};
    }
    m_pending.clear();
  }

  bool PrecomputedEvaluator::loadFromFile(const std::string &path, std::string *err)
  {
    std::ifstream in(path);
    if (!in.good())
    {
      if (err)
        *err = "Cannot open evaluation table: " + path;
      return false;
    }

    std::string curFen;
    EvalSnapshot cur;
    bool inBlock = false;
    std::size_t loaded = 0;

    auto flush = [&]()
    {
      if (inBlock && !cur.lines.empty())
      {
        add(curFen, std::move(cur));
        ++loaded;
      }
      cur = EvalSnapshot{};
      curFen.clear();
      inBlock = false;
    };

    std::string line;
    int lineNo = 0;
    while (std::getline(in, line))
    {
      ++lineNo;
      line = trim(line);
      if (line.empty() || line[0] == '#')
        continue;

      if (line.rfind("[position ", 0) == 0 && line.back() == ']')
      {
        flush();
        curFen = trim(line.substr(std::string("[position ").size(),
                                  line.size() - std::string("[position ").size() - 1));
        inBlock = !curFen.empty();
        continue;
      }

      if (!inBlock)
        continue;

      auto eq = line.find('=');
      if (eq == std::string::npos)
        continue;

      const std::string k = trim(line.substr(0, eq));
      const std::string v = trim(line.substr(eq + 1));

      if (k == "depth")
        cur.depth = std::atoi(v.c_str());
      else if (k == "time")
        cur.timeMs = std::atoi(v.c_str());
      else if (k == "line")
      {
        EvalLine el;
        if (parseLineValue(v, el))
          cur.lines.push_back(std::move(el));
        else
          std::cerr << "[PrecomputedEvaluator] " << path << ":" << lineNo
                    << " bad line entry, skipped\n";
      }
    }
    flush();
    return loaded > 0;
  }

  bool PrecomputedEvaluator::saveToFile(const std::string &path, std::string *err)
  {
    harvestPending();

    const fs::path target(path);
    const fs::path tmp = target.string() + ".tmp";
    {
      std::ofstream out(tmp, std::ios::trunc);
      if (!out.good())
      {
        if (err)
          *err = "Cannot write evaluation table: " + tmp.string();
        return false;
      }

      std::lock_guard lk(m_mtx);
      std::vector<const std::pair<std::string, EvalSnapshot> *> rows;
      rows.reserve(m_table.size());
      for (const auto &kv : m_table)
        rows.push_back(&kv.second);
      std::sort(rows.begin(), rows.end(), [](auto *a, auto *b)
                { return a->first < b->first; });

      for (const auto *row : rows)
      {
        out << "[position " << row->first << "]\n";
        out << "depth=" << row->second.depth << "\n";
        if (row->second.timeMs)
          out << "time=" << row->second.timeMs << "\n";
        for (const auto &l : row->second.lines)
        {
          out << "line=" << l.score.toString();
          for (const auto &m : l.pvUci)
            out << " " << m;
          out << "\n";
        }
        out << "\n";
      }
      if (!out.good())
      {
        if (err)
          *err = "Write failed: " + tmp.string();
        return false;
      }
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec)
    {
      if (err)
        *err = "Cannot replace " + target.string() + ": " + ec.message();
      return false;
    }
    return true;
  }

} // namespace backranq::engine
