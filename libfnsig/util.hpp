// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#ifndef Fnsig_Utility_H
#define Fnsig_Utility_H

#include <string>
#include <sstream>
#include <utility>
#include <type_traits>
#include <memory>
#include <vector>
#include <chrono>
#include <cstdint>

// This file should be as minimal as possible to reduce circular inclusion pain.  If something
// you want to add here requires Sawyer or ROSE headers, add it to misc instead.

#define LEND std::endl

namespace fnsig {

// Addresses in either program.  Wide enough for every architecture ROSE can partition.
using address_t = std::uint64_t;

std::string get_file_contents(const std::string & filename);
uint64_t parse_number(const std::string& str);
std::string to_lower(std::string input);

// Are we on a color terminal?
bool color_terminal(int fd);

// make_unique, which should have been in c++11, but is not
#if __cplusplus < 201402L
template<typename T, typename... Args>
std::unique_ptr<T> make_unique(Args&&... args)
{
  return std::unique_ptr<T>(new T(std::forward<Args>(args)...));
}
#else
using std::make_unique;
#endif

// Elapsed wall time since construction, printed in seconds by default.
template <typename Rep = double, typename Period = std::ratio<1>>
class Timer {
 public:
  using clock = std::chrono::steady_clock;
  using duration = std::chrono::duration<Rep, Period>;

  Timer() : start_(clock::now()) {}

  duration dur() const {
    return std::chrono::duration_cast<duration>(clock::now() - start_);
  }

 private:
  clock::time_point start_;
};

template <typename Stream, typename Rep, typename Period>
Stream & operator<<(Stream & stream, Timer<Rep, Period> const & timer) {
  stream << timer.dur().count();
  return stream;
}

template <typename Rep = double, typename Period = std::ratio<1>>
auto make_timer() {
  return Timer<Rep, Period>{};
}

} // namespace fnsig

#endif // Fnsig_Utility_H

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
