#pragma once

#include <cstddef>


namespace mc
{

// pointer
using nullptr_t = std::nullptr_t;

//
// Sum types
//

struct nullopt_t;
template <class T>
struct optional;

template <class E>
struct as_error_t;
template <class T, class E>
struct result;

template <class OnSuccess, class OnFailure>
struct match_handlers;

} // namespace mc
