// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <type_traits>
#include <utility>

/**
 * A bound method: a pointer to an object plus a pointer to a
 * function which invokes a (non-static) method on it.  This is a
 * lightweight replacement for std::function which needs no heap
 * allocation.
 */
template<typename S=void()>
class BoundMethod;

template<typename R, bool NoExcept, typename... Args>
class BoundMethod<R(Args...) noexcept(NoExcept)> {
	using function_pointer = R (*)(void *, Args...) noexcept(NoExcept);

	void *instance_;
	function_pointer function;

public:
	BoundMethod() = default;

	constexpr
	BoundMethod(void *_instance, function_pointer _function) noexcept
		:instance_(_instance), function(_function) {}

	/**
	 * Construct an "undefined" object.  It must not be called,
	 * and its "bool" operator returns false.
	 */
	constexpr BoundMethod(std::nullptr_t) noexcept
		:instance_(nullptr), function(nullptr) {}

	constexpr explicit operator bool() const noexcept {
		return function != nullptr;
	}

	R operator()(Args... args) const noexcept(NoExcept) {
		return function(instance_, std::forward<Args>(args)...);
	}
};

namespace BindMethodDetail {

template<typename M>
struct MethodTraits;

template<typename R, bool NoExcept, typename T, typename... Args>
struct MethodTraits<R (T::*)(Args...) noexcept(NoExcept)> {
	using class_type = T;
	using plain_signature = R(Args...) noexcept(NoExcept);

	template<R (T::*method)(Args...) noexcept(NoExcept)>
	static R Invoke(void *instance, Args... args) noexcept(NoExcept) {
		return (static_cast<T *>(instance)->*method)(std::forward<Args>(args)...);
	}
};

} // namespace BindMethodDetail

/**
 * Construct a #BoundMethod instance from a method pointer known at
 * compile time.
 */
template<auto method>
constexpr auto
BindMethod(typename BindMethodDetail::MethodTraits<decltype(method)>::class_type &instance) noexcept
{
	using Traits = BindMethodDetail::MethodTraits<decltype(method)>;
	using Signature = typename Traits::plain_signature;

	return BoundMethod<Signature>(&instance,
				      &Traits::template Invoke<method>);
}

#define BIND_METHOD(instance, method) \
	BindMethod<method>(instance)

/**
 * Shortcut macro which takes an instance and a method name and
 * constructs a #BoundMethod instance.
 */
#define BIND_THIS_METHOD(method) \
	BIND_METHOD(*this, &std::remove_reference_t<decltype(*this)>::method)
