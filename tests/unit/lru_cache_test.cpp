#include "internal/db/common/lru_cache.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using stateshift::db::common::LruCache;

void TestEvictsLeastRecentlyUsed() {
  LruCache<std::string, int> cache(2);
  cache.Put("a", 1);
  cache.Put("b", 2);

  // Touch "a" so "b" becomes the eviction candidate.
  assert(cache.Get("a").value() == 1);
  cache.Put("c", 3);

  assert(cache.Size() == 2);
  assert(cache.Get("a").has_value());
  assert(!cache.Get("b").has_value());
  assert(cache.Get("c").value() == 3);
}

void TestPutOverwritesExistingEntry() {
  LruCache<std::string, int> cache(2);
  cache.Put("a", 1);
  cache.Put("a", 5);
  assert(cache.Size() == 1);
  assert(cache.Get("a").value() == 5);
}

void TestEraseAndClear() {
  LruCache<std::string, int> cache(4);
  cache.Put("a", 1);
  cache.Put("b", 2);
  cache.Erase("a");
  cache.Erase("missing");
  assert(!cache.Get("a").has_value());
  assert(cache.Size() == 1);

  cache.Clear();
  assert(cache.Size() == 0);
}

void TestZeroCapacityDisablesCaching() {
  LruCache<std::string, int> cache(0);
  cache.Put("a", 1);
  assert(cache.Size() == 0);
  assert(!cache.Get("a").has_value());
}

void TestHitRate() {
  LruCache<std::string, int> cache(2);
  assert(cache.HitRate() == 0.0);

  cache.Put("a", 1);
  (void)cache.Get("a");
  (void)cache.Get("b");
  assert(cache.HitRate() == 0.5);
}

} // namespace

int main() {
  TestEvictsLeastRecentlyUsed();
  TestPutOverwritesExistingEntry();
  TestEraseAndClear();
  TestZeroCapacityDisablesCaching();
  TestHitRate();

  std::cout << "stateshift_unit_lru_cache: pass\n";
  return 0;
}
