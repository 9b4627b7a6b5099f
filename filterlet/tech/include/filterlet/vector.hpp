#pragma once

#include <amc/vector.hpp>  // IWYU pragma: export

namespace filterlet {

template <class T>
using vector = amc::vector<T>;

}  // namespace filterlet
