#ifndef XDGBASE_CORE_TYPE_DEFINITIONS_HPP
#define XDGBASE_CORE_TYPE_DEFINITIONS_HPP

#include <string>
#include <type_traits>
#include <utility>

#include <boost/optional.hpp>

namespace xdgbase {

using std::string;

using boost::none;
using boost::optional;

// some(x) creates a boost::optional of the proper type with the value of :x.
template<class T>
auto
some(T&& x)
{
    return optional<std::remove_cv_t<std::remove_reference_t<T>>>(
        std::forward<T>(x));
}

} // namespace xdgbase

#endif
