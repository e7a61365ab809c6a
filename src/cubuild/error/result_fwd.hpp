#pragma once

// Headers that only declare functions returning result<T> include this instead of result.hpp

namespace boost::leaf {

template <typename T>
class result;

}  // namespace boost::leaf

namespace cubuild {

using boost::leaf::result;

}  // namespace cubuild
