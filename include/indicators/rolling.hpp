#pragma once
#include <cstddef>
#include <vector>

namespace ind {

// Görgetett egyszerű átlag p hosszú ablakkal; az első p-1 elemnél az ablak
// a sorozat elejéig zsugorodik, így minden pozícióra van érték.
std::vector<double> rolling_mean(const std::vector<double>& v, std::size_t p);

// Napi különbségek; az első elem 0 (nincs előző nap)
std::vector<double> diff(const std::vector<double>& v);

} // namespace ind
