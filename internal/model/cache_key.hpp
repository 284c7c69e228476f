#pragma once

#include <functional>
#include <string>

namespace mediacache::model {

/*
  Identity of one cached media object at one quality.
*/
struct CacheKey {
  std::string source_id;
  std::string media_id;
  std::string quality;

  bool operator==(const CacheKey&) const = default;

  std::string ToString() const {
    return source_id + "/" + media_id + "/" + quality;
  }
};

} // namespace mediacache::model
