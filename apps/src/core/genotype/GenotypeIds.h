#pragma once

#include "core/StrongType.h"

#include <cstdint>

namespace NeuroEvo {

using GenotypeId = StrongType<struct GenotypeIdTag, uint64_t>;
using NodeId = StrongType<struct NodeIdTag, uint64_t>;
using SpeciesId = StrongType<struct SpeciesIdTag>;

using Innovation = uint64_t;

} // namespace NeuroEvo
