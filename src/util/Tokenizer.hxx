// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef TOKENIZER_HXX
#define TOKENIZER_HXX

/**
 * Splits a mutable string into words and quoted strings.  The input
 * is modified in place.
 */
class Tokenizer {
	char *input;

public:
	/**
	 * @param _input the input string; the contents will be
	 * modified by this class
	 */
	constexpr explicit Tokenizer(char *_input) noexcept:input(_input) {}

	Tokenizer(const Tokenizer &) = delete;
	Tokenizer &operator=(const Tokenizer &) = delete;

	char *Rest() noexcept {
		return input;
	}

	char CurrentChar() const noexcept {
		return *input;
	}

	bool IsEnd() const noexcept {
		return CurrentChar() == 0;
	}

	/**
	 * Reads the next word (a letter followed by letters, digits
	 * and underscores).  Throws std::runtime_error on error.
	 *
	 * @return a pointer to the null-terminated word, or nullptr
	 * on end of line
	 */
	char *NextWord();

	/**
	 * Reads the next unquoted word from the input string.  Throws
	 * std::runtime_error on error.
	 *
	 * @return a pointer to the null-terminated word, or nullptr
	 * on end of line
	 */
	char *NextUnquoted();

	/**
	 * Reads the next quoted string from the input string.  A
	 * backslash escapes the following character.  Throws
	 * std::runtime_error on error.
	 *
	 * @return a pointer to the null-terminated string, or nullptr
	 * on end of line
	 */
	char *NextString();

	/**
	 * Reads the next unquoted word or quoted string from the
	 * input.  Throws std::runtime_error on error.
	 *
	 * @return a pointer to the null-terminated string, or nullptr
	 * on end of line
	 */
	char *NextParam();

private:
	/**
	 * Terminate the current token at #input and skip the
	 * following whitespace.
	 */
	void EndToken() noexcept;
};

#endif
