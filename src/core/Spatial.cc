#include "strata/core/Spatial.hh"

namespace strata {

// Template instantiations for common types
template class Vector3<float, Space::Local>;
template class Vector3<float, Space::World>;
template class Vector4<float, Space::Clip>;
template class Vector4<float, Space::Color>;
template class Matrix4x4<float>;

} // namespace strata
