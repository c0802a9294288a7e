#include "sticky_router.hpp"

#include <algorithm>

using std::string;
using std::vector;

namespace splitbit {
namespace {

constexpr uint64_t fnv_offset_basis = 0xcbf29ce484222325ull;
constexpr uint64_t fnv_prime = 0x100000001b3ull;

uint64_t fnv1a(uint64_t hash, const string& data)
{
  for (unsigned char c : data) {
    hash ^= c;
    hash *= fnv_prime;
  }
  return hash;
}

// murmur3 fmix64
uint64_t fmix64(uint64_t h)
{
  h ^= h >> 33;
  h *= 0xff51afd7ed558ccdull;
  h ^= h >> 33;
  h *= 0xc4ceb9fe1a85ec53ull;
  h ^= h >> 33;
  return h;
}

} // namespace

uint64_t StickyRouter::hash_subject(
  const string& subject_id, const string& selector_name)
{
  uint64_t hash = fnv1a(fnv_offset_basis, subject_id);
  hash = fnv1a(hash, ":");
  return fmix64(fnv1a(hash, selector_name));
}

bee::OrError<string> StickyRouter::select_trial(
  const string& subject_id,
  const string& selector_name,
  const vector<string>& trial_keys)
{
  if (trial_keys.empty()) {
    return bee::Error("Sticky routing requires at least one trial");
  }
  if (subject_id.empty()) {
    return bee::Error("Sticky routing requires a subject identifier");
  }

  vector<string> sorted_keys = trial_keys;
  std::sort(sorted_keys.begin(), sorted_keys.end());

  uint64_t bucket = hash_subject(subject_id, selector_name) % sorted_keys.size();
  return sorted_keys[bucket];
}

} // namespace splitbit
