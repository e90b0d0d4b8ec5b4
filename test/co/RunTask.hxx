// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "co/InvokeTask.hxx"
#include "co/Task.hxx"
#include "event/Loop.hxx"

#include <exception>
#include <optional>
#include <stdexcept>
#include <type_traits>

/**
 * Runs a #Co::Task to completion inside an #EventLoop.
 */
class TaskRunner {
	EventLoop &event_loop;

	Co::InvokeTask invoke;

	std::exception_ptr error;

	bool done = false;

public:
	explicit TaskRunner(EventLoop &_event_loop) noexcept
		:event_loop(_event_loop) {}

	/**
	 * Start the task without waiting for it.
	 */
	void Start(Co::InvokeTask &&_invoke) noexcept {
		invoke = std::move(_invoke);
		invoke.Start(BIND_THIS_METHOD(OnCompletion));
	}

	bool IsDone() const noexcept {
		return done;
	}

	/**
	 * Run the event loop until the task has finished; rethrows
	 * its exception.
	 */
	void Wait() {
		if (!done)
			event_loop.Run();

		if (!done)
			throw std::runtime_error("Task did not complete");

		if (error)
			std::rethrow_exception(error);
	}

private:
	void OnCompletion(std::exception_ptr _error) noexcept {
		error = std::move(_error);
		done = true;
		event_loop.Break();
	}
};

template<typename T>
Co::InvokeTask
AwaitAndStore(Co::Task<T> task, std::optional<T> &result_r)
{
	result_r.emplace(co_await task);
}

inline Co::InvokeTask
AwaitVoid(Co::Task<void> task)
{
	co_await task;
}

/**
 * Run the task inside the event loop and return its result.
 * Exceptions are rethrown.
 */
template<typename T>
T
RunTask(EventLoop &event_loop, Co::Task<T> &&task)
{
	TaskRunner runner(event_loop);

	if constexpr (std::is_void_v<T>) {
		runner.Start(AwaitVoid(std::move(task)));
		runner.Wait();
	} else {
		std::optional<T> result;
		runner.Start(AwaitAndStore(std::move(task), result));
		runner.Wait();
		return std::move(*result);
	}
}
