#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include "elfscope/base/path_utils.hpp"

namespace elfscope::locate {

// ordered by strength: a stronger kind always wins over a weaker one
enum class match_kind { none = 0, basename = 1, suffix = 2, exact = 3 };

inline const char* to_string(match_kind kind) {
  switch (kind) {
    case match_kind::none:
      return "none";
    case match_kind::basename:
      return "basename";
    case match_kind::suffix:
      return "suffix";
    case match_kind::exact:
      return "exact";
  }
  return "none";
}

/**
 * @brief how well a loaded module path answers a requested name
 *
 * - absolute request: only an identical path matches (exact)
 * - relative request with a separator: identical (exact) or a tail of the candidate starting
 *   at a '/' boundary (suffix)
 * - bare file name: equal to the candidate's basename (basename)
 */
inline match_kind match_module(std::string_view requested, std::string_view candidate) {
  if (requested.empty() || candidate.empty()) {
    return match_kind::none;
  }
  if (requested == candidate) {
    return match_kind::exact;
  }
  if (base::is_absolute_path(requested)) {
    return match_kind::none;
  }

  if (base::has_separator(requested)) {
    if (candidate.size() > requested.size() && base::ends_with(candidate, requested) &&
        candidate[candidate.size() - requested.size() - 1] == '/') {
      return match_kind::suffix;
    }
    return match_kind::none;
  }

  return base::basename_view(candidate) == requested ? match_kind::basename : match_kind::none;
}

inline bool is_bare_name(std::string_view requested) { return !requested.empty() && !base::has_separator(requested); }

/**
 * @brief index of the best candidate for a request
 *
 * The strongest match kind wins; among equal kinds the earliest candidate (enumeration order)
 * is kept. path_of maps a candidate to its path.
 */
template <typename range_type, typename path_fn>
std::optional<size_t> best_match(std::string_view requested, const range_type& candidates, path_fn path_of) {
  std::optional<size_t> best;
  match_kind best_kind = match_kind::none;
  size_t index = 0;
  for (const auto& candidate : candidates) {
    const match_kind kind = match_module(requested, path_of(candidate));
    if (kind > best_kind) {
      best_kind = kind;
      best = index;
      if (kind == match_kind::exact) {
        break;
      }
    }
    ++index;
  }
  return best;
}

} // namespace elfscope::locate
