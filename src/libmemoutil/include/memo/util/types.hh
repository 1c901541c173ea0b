#pragma once
///@file

#include <list>
#include <set>
#include <string>
#include <map>
#include <vector>

namespace memo {

typedef std::list<std::string> Strings;

/**
 * Ordered `std::string -> std::string` map with a transparent
 * comparator, so lookups by `std::string_view` or `const char *` do not
 * allocate a temporary key.
 */
using StringMap = std::map<std::string, std::string, std::less<>>;

/**
 * Ordered string set with a transparent comparator.
 *
 * @see StringMap
 */
using StringSet = std::set<std::string, std::less<>>;

} // namespace memo
