// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef SCOPE_EXIT_HXX
#define SCOPE_EXIT_HXX

#include <utility>

/**
 * Invokes a function object when this object goes out of scope.
 */
template<typename F>
class ScopeExitGuard {
	[[no_unique_address]]
	F function;

public:
	explicit ScopeExitGuard(F &&f) noexcept
		:function(std::forward<F>(f)) {}

	~ScopeExitGuard() noexcept {
		function();
	}

	ScopeExitGuard(const ScopeExitGuard &) = delete;
	ScopeExitGuard &operator=(const ScopeExitGuard &) = delete;
};

struct ScopeExitTag {
	/* allows writing AtScopeExit() { ... }; without closing
	   parentheses */
	template<typename F>
	ScopeExitGuard<F> operator+(F &&f) noexcept {
		return ScopeExitGuard<F>(std::forward<F>(f));
	}
};

#define ScopeExitCat(a, b) a ## b
#define ScopeExitName(line) ScopeExitCat(at_scope_exit_, line)

/**
 * Execute code when the current scope ends.
 *
 * Usage: AtScopeExit(some, variables) { some; code; };
 */
#define AtScopeExit(...) auto ScopeExitName(__LINE__) = ScopeExitTag() + [__VA_ARGS__]()

#endif
