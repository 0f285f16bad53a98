#ifndef IO_JSON_UTIL_H_
#define IO_JSON_UTIL_H_

#include "nlohmann/json.hpp"
#include "util/log.hpp"

#define JSON_CHECK_AND_UPDATE_SIMPLE_VALUE(obj, key, dst)   \
  if ((obj).contains(key)) {                                \
    (obj).at(key).get_to(dst);                              \
  } else {                                                  \
    LOG_VERBOSE("missing key %s. use default value.", key); \
  }

#define JSON_CHECK_AND_UPDATE_ARRAY_VALUE(obj, key, dst, n) \
  if (!(obj).contains(key)) {                               \
    LOG_VERBOSE("missing key %s", key);                     \
  } else if (!(obj).at(key).is_array()) {                   \
    LOG_VERBOSE("%s must be an array.", key);               \
  } else {                                                  \
    int i = 0;                                              \
    for (const auto& j_item : (obj).at(key)) {              \
      if (i >= (n)) {                                       \
        break;                                              \
      }                                                     \
      j_item.get_to((dst)[i]);                              \
      i++;                                                  \
    }                                                       \
  }

#endif  // IO_JSON_UTIL_H_
