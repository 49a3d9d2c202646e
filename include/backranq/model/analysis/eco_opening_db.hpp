#pragma once

#include <string>
#include <string_view>

namespace backranq::model::analysis
{
  // ECO code -> opening family name.
  // A built-in table covers the common codes; a TSV file can extend or override it.
  //
  // TSV format:
  //   B28<TAB>Sicilian Defense: O'Kelly Variation
  //
  class EcoOpeningDb final
  {
  public:
    // Returns a human name for an ECO code, or empty string if unknown.
    static std::string nameForEco(std::string_view eco);

    // Later loads overwrite/extend earlier mappings. Returns false if nothing was read.
    static bool loadFromTsvFile(const std::string &path);

    // "eco:b28" / " B28 " -> "B28"; empty when no code is present.
    static std::string normalizeEco(std::string_view eco);
  };

} // namespace backranq::model::analysis
