
#ifndef UTIL_RAISE_H_
#define UTIL_RAISE_H_

#include <utility>

#if defined(__GNUC__)
#define UTIL_COLD_CODE __attribute__((noinline, cold))
#else
#define UTIL_COLD_CODE
#endif

/**
 * @brief Throws an error of type `E`, aggregate-initialized from `args`.
 * The error types of this project are plain structs, so this is the one
 * place where they get thrown.
 *
 * @param args The values used to initialize the error.
 */
template <class E, class... Args>
[[noreturn]] UTIL_COLD_CODE void Raise(Args &&...args) {
	throw E{std::forward<Args>(args)...};
}

#endif
