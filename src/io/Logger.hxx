// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>
#include <fmt/format.h>

#include <array>
#include <concepts>
#include <exception>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

/*
 * Log levels used throughout this project:
 *
 * 1 = errors and warnings
 * 2 = one line per request (the default)
 * 3 = debug messages (per block)
 */

namespace LoggerDetail {

template<typename T>
struct ParamWrapper;

template<>
struct ParamWrapper<std::string_view> {
	std::string_view value;

	constexpr explicit ParamWrapper(std::string_view _value) noexcept
		:value(_value) {}

	constexpr std::string_view GetValue() const noexcept {
		return value;
	}
};

template<>
struct ParamWrapper<const char *> : ParamWrapper<std::string_view> {
	using ParamWrapper<std::string_view>::ParamWrapper;
};

template<>
struct ParamWrapper<char *> : ParamWrapper<std::string_view> {
	using ParamWrapper<std::string_view>::ParamWrapper;
};

template<>
struct ParamWrapper<std::string> {
	std::string value;

	template<typename S>
	explicit ParamWrapper(S &&_value) noexcept
		:value(std::forward<S>(_value)) {}

	[[gnu::pure]]
	std::string_view GetValue() const noexcept {
		return value;
	}
};

/**
 * Renders an exception with all of its nested causes.
 */
template<>
struct ParamWrapper<std::exception_ptr> : ParamWrapper<std::string> {
	explicit ParamWrapper(std::exception_ptr ep) noexcept;
};

template<std::integral T>
struct ParamWrapper<T> {
	fmt::format_int value;

	explicit ParamWrapper(T _value) noexcept
		:value(_value) {}

	std::string_view GetValue() const noexcept {
		return {value.data(), value.size()};
	}
};

template<typename... Params>
class ParamArray {
	std::tuple<ParamWrapper<Params>...> wrappers;

public:
	static constexpr std::size_t count = sizeof...(Params);
	std::array<std::string_view, count> values;

	explicit ParamArray(Params... params) noexcept
		:wrappers(params...)
	{
		std::apply([this](const auto &...w){
			auto *i = values.data();
			((*i++ = w.GetValue()), ...);
		}, wrappers);
	}
};

extern unsigned max_level;

inline bool
CheckLevel(unsigned level) noexcept
{
	return level <= max_level;
}

void
WriteV(std::string_view domain, std::span<const std::string_view> buffers) noexcept;

template<typename... Params>
void
LogConcat(unsigned level, std::string_view domain, Params... _params) noexcept
{
	if (!CheckLevel(level))
		return;

	const ParamArray<Params...> params(_params...);
	WriteV(domain, params.values);
}

void
Fmt(unsigned level, std::string_view domain,
    fmt::string_view format_str, fmt::format_args args) noexcept;

} /* namespace LoggerDetail */

inline void
SetLogLevel(unsigned level) noexcept
{
	LoggerDetail::max_level = level;
}

inline bool
CheckLogLevel(unsigned level) noexcept
{
	return LoggerDetail::CheckLevel(level);
}

template<typename... Params>
void
LogConcat(unsigned level, std::string_view domain, Params... params) noexcept
{
	LoggerDetail::LogConcat(level, domain, params...);
}

template<typename S, typename... Args>
void
LogFmt(unsigned level, std::string_view domain,
       const S &format_str, Args&&... args) noexcept
{
	LoggerDetail::Fmt(level, domain, format_str,
			  fmt::make_format_args(args...));
}

template<typename Domain>
class BasicLogger : public Domain {
public:
	BasicLogger() = default;

	template<typename D>
	explicit BasicLogger(D &&_domain)
		:Domain(std::forward<D>(_domain)) {}

	static bool CheckLevel(unsigned level) noexcept {
		return LoggerDetail::CheckLevel(level);
	}

	template<typename... Params>
	void operator()(unsigned level, Params... params) const noexcept {
		LoggerDetail::LogConcat(level, GetDomain(), params...);
	}

	template<typename S, typename... Args>
	void Fmt(unsigned level, const S &format_str,
		 Args&&... args) const noexcept {
		LoggerDetail::Fmt(level, GetDomain(), format_str,
				  fmt::make_format_args(args...));
	}

	std::string_view GetDomain() const noexcept {
		return Domain::GetDomain();
	}
};

class StringLoggerDomain {
	std::string name;

public:
	StringLoggerDomain() = default;

	template<typename T>
	explicit StringLoggerDomain(T &&_name) noexcept
		:name(std::forward<T>(_name)) {}

	std::string_view GetDomain() const noexcept {
		return name;
	}
};

class Logger : public BasicLogger<StringLoggerDomain> {
public:
	Logger() = default;

	template<typename D>
	explicit Logger(D &&_domain)
		:BasicLogger(std::forward<D>(_domain)) {}
};

/**
 * A logger domain which is made of a parent domain and a child name,
 * separated by a slash, e.g. "http/4f2a9c01".
 */
class ChildLoggerDomain : public StringLoggerDomain {
public:
	template<typename P>
	ChildLoggerDomain(const P &parent, std::string_view _name) noexcept
		:StringLoggerDomain(Make(parent.GetDomain(), _name)) {}

private:
	static std::string Make(std::string_view parent,
				std::string_view name) noexcept;
};

class ChildLogger : public BasicLogger<ChildLoggerDomain> {
public:
	template<typename P>
	ChildLogger(const P &parent, std::string_view _name) noexcept
		:BasicLogger(ChildLoggerDomain(parent, _name)) {}
};

/**
 * A lighter version of #StringLoggerDomain which uses a literal
 * string as its domain.
 */
class LiteralLoggerDomain {
	std::string_view domain;

public:
	constexpr explicit LiteralLoggerDomain(std::string_view _domain={}) noexcept
		:domain(_domain) {}

	constexpr std::string_view GetDomain() const noexcept {
		return domain;
	}
};

/**
 * A lighter version of #Logger which uses a literal string as its
 * domain.
 */
class LLogger : public BasicLogger<LiteralLoggerDomain> {
public:
	LLogger() = default;

	template<typename D>
	explicit LLogger(D &&_domain) noexcept
		:BasicLogger(std::forward<D>(_domain)) {}
};
