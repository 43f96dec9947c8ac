#include "park/concurrent/reference_generator.hpp"

#include "park/time/time_utils.hpp"

namespace park {

namespace {

constexpr std::uint64_t kSequenceSpace = 36ULL * 36ULL * 36ULL * 36ULL;
constexpr char kDigits[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";

// "2025-03-01T10:15:00Z" -> "20250301101500"
std::string compact_stamp(Timestamp tp) {
  const std::string iso = format_iso8601(tp);
  std::string out;
  out.reserve(14);
  for (std::size_t i = 0; i < iso.size() && out.size() < 14; ++i) {
    if (iso[i] >= '0' && iso[i] <= '9') {
      out.push_back(iso[i]);
    }
  }
  return out;
}

}  // namespace

std::string ReferenceGenerator::next() {
  std::uint64_t seq =
      sequence_.fetch_add(1, std::memory_order_relaxed) % kSequenceSpace;

  char suffix[4];
  for (int i = 3; i >= 0; --i) {
    suffix[i] = kDigits[seq % 36];
    seq /= 36;
  }

  return prefix_ + compact_stamp(ms_to_timestamp(time_provider_.now_ms())) +
         std::string(suffix, 4);
}

}  // namespace park
