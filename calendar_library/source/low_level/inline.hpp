#ifndef UTK_CALENDAR_SOURCE_INLINE_HEADER
#define UTK_CALENDAR_SOURCE_INLINE_HEADER

#include <cstdint>
#include <type_traits>

#if defined(__GNUC__) || defined(__clang__)
	#define INLINE __attribute__((always_inline, artificial)) inline
	#define CONST_INLINE __attribute__((const, always_inline, artificial)) inline
#else
	#define INLINE inline
	#define CONST_INLINE inline
#endif

namespace UtcTimeKit::calendar::source::low_level {

	// division rounding towards negative infinity, b > 0
	template <typename T> CONST_INLINE constexpr T floor_div(T a, T b) {
		static_assert(std::is_integral_v<T> && std::is_signed_v<T>);
		const T q = a / b;
		return (a % b != 0 && a < 0) ? q - 1 : q;
	}

	// remainder matching floor_div, result in [0, b)
	template <typename T> CONST_INLINE constexpr T floor_mod(T a, T b) {
		return a - floor_div(a, b) * b;
	}

	static_assert(floor_div<int64_t>(-1, 10) == -1);
	static_assert(floor_div<int64_t>(-10, 10) == -1);
	static_assert(floor_div<int64_t>(19, 10) == 1);
	static_assert(floor_mod<int64_t>(-1, 10) == 9);
	static_assert(floor_mod<int64_t>(-86400, 86400) == 0);

} // namespace UtcTimeKit::calendar::source::low_level

#endif
