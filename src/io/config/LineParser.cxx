// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "LineParser.hxx"

#include <fmt/core.h>

#include <cerrno>
#include <cstring>
#include <limits>

#include <stdlib.h>

void
LineParser::ExpectWhitespace()
{
	if (!IsWhitespaceNotNull(front()))
		throw Error("Syntax error");

	++p;
	Strip();
}

void
LineParser::ExpectEnd()
{
	if (!IsEnd())
		throw Error(fmt::format("Unexpected tokens at end of line: {}",
					p));
}

void
LineParser::ExpectSymbol(char symbol)
{
	if (front() != symbol)
		throw Error(fmt::format("'{}' expected", symbol));

	++p;
	Strip();
}

bool
LineParser::SkipWord(const char *word) noexcept
{
	const std::size_t length = strlen(word);
	if (strncmp(p, word, length) != 0)
		return false;

	char *after = p + length;
	if (IsWordChar(*after))
		/* only a prefix matched */
		return false;

	if (*after != 0 && !IsWhitespaceNotNull(*after))
		return false;

	p = StripLeft(after);
	return true;
}

const char *
LineParser::NextWord() noexcept
{
	if (!IsWordChar(front()))
		return nullptr;

	const char *result = p;
	do {
		++p;
	} while (IsWordChar(front()));

	/* a symbol following the word is left in place for the
	   caller */
	if (IsWhitespaceNotNull(front())) {
		*p++ = 0;
		Strip();
	}

	return result;
}

inline char *
LineParser::NextUnquotedValue() noexcept
{
	char *result = p;
	while (IsUnquotedChar(front()))
		++p;

	if (!IsEnd()) {
		if (!IsWhitespaceNotNull(front()))
			return nullptr;

		*p++ = 0;
		Strip();
	}

	return result;
}

inline char *
LineParser::NextQuotedValue(char stop) noexcept
{
	char *result = p;
	char *end = strchr(p, stop);
	if (end == nullptr)
		return nullptr;

	*end = 0;
	p = end + 1;
	Strip();

	return result;
}

char *
LineParser::NextValue() noexcept
{
	if (IsEnd())
		return nullptr;

	const char ch = front();
	if (IsQuote(ch)) {
		++p;
		return NextQuotedValue(ch);
	} else
		return NextUnquotedValue();
}

char *
LineParser::NextUnescape() noexcept
{
	if (IsEnd())
		return nullptr;

	const char stop = front();
	if (!IsQuote(stop))
		return NextUnquotedValue();

	char *dest = ++p;
	char *value = dest;

	while (true) {
		char ch = *p++;

		if (ch == 0)
			return nullptr;

		if (ch == stop) {
			*dest = 0;
			Strip();
			return value;
		}

		if (ch == '\\' && stop == '"') {
			ch = *p++;
			if (ch == 0)
				return nullptr;
		}

		*dest++ = ch;
	}
}

bool
LineParser::NextBool()
{
	const char *value = NextValue();
	if (value == nullptr)
		throw Error("yes/no expected");

	if (strcmp(value, "yes") == 0)
		return true;
	else if (strcmp(value, "no") == 0)
		return false;
	else
		throw Error("yes/no expected");
}

unsigned
LineParser::NextPositiveInteger()
{
	const char *string = NextValue();
	if (string == nullptr)
		throw Error("Integer expected");

	char *endptr;
	unsigned long l = strtoul(string, &endptr, 10);
	if (endptr == string || *endptr != 0)
		throw Error("Integer expected");

	if (l == 0)
		throw Error("Positive integer expected");

	if (l > std::numeric_limits<unsigned>::max())
		throw Error("Number is too large");

	return (unsigned)l;
}

uint64_t
LineParser::NextSize()
{
	const char *string = NextValue();
	if (string == nullptr || !IsDigitASCII(*string))
		throw Error("Size expected");

	char *endptr;
	errno = 0;
	const unsigned long long value = strtoull(string, &endptr, 10);
	if (errno != 0)
		throw Error("Size is too large");

	unsigned shift = 0;
	switch (*endptr) {
	case 0:
		break;

	case 'k':
	case 'K':
		shift = 10;
		++endptr;
		break;

	case 'M':
		shift = 20;
		++endptr;
		break;

	case 'G':
		shift = 30;
		++endptr;
		break;

	default:
		throw Error("Size expected");
	}

	if (*endptr != 0)
		throw Error("Size expected");

	if (value > (std::numeric_limits<uint64_t>::max() >> shift))
		throw Error("Size is too large");

	return uint64_t(value) << shift;
}

const char *
LineParser::ExpectWord()
{
	const char *value = NextWord();
	if (value == nullptr)
		throw Error("Word expected");

	return value;
}

const char *
LineParser::ExpectWordAndSymbol(char symbol,
				const char *error1,
				const char *error2)
{
	const char *value = NextWord();
	if (value == nullptr)
		throw Error(error1);

	/* NextWord() has left the symbol (or whitespace) in place */
	Strip();
	if (front() != symbol)
		throw Error(error2);

	*p++ = 0;
	Strip();

	return value;
}

char *
LineParser::ExpectValue()
{
	char *value = NextValue();
	if (value == nullptr || *value == 0)
		throw Error("Value expected");

	return value;
}

char *
LineParser::ExpectValueAndEnd()
{
	char *value = ExpectValue();
	ExpectEnd();
	return value;
}
