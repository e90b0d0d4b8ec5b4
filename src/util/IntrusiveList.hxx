// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cassert>
#include <cstddef>
#include <iterator>
#include <type_traits>

enum class IntrusiveHookMode {
	/**
	 * The hook must be unlinked manually before it gets
	 * destroyed.
	 */
	NORMAL,

	/**
	 * The destructor unlinks the hook automatically.
	 */
	AUTO_UNLINK,
};

/**
 * The part of #IntrusiveListHook which does not depend on the hook
 * mode.  A list only deals with this type.
 */
class IntrusiveListNode {
	template<typename T> friend class IntrusiveList;

protected:
	IntrusiveListNode *next = nullptr, *prev = nullptr;

	IntrusiveListNode() noexcept = default;
	~IntrusiveListNode() noexcept = default;

public:
	IntrusiveListNode(const IntrusiveListNode &) = delete;
	IntrusiveListNode &operator=(const IntrusiveListNode &) = delete;

	bool is_linked() const noexcept {
		return next != nullptr;
	}

	void unlink() noexcept {
		assert(is_linked());

		next->prev = prev;
		prev->next = next;
		next = prev = nullptr;
	}

private:
	void InsertBefore(IntrusiveListNode &other) noexcept {
		assert(!is_linked());

		next = &other;
		prev = other.prev;
		prev->next = this;
		other.prev = this;
	}
};

template<IntrusiveHookMode _mode=IntrusiveHookMode::NORMAL>
class IntrusiveListHook : public IntrusiveListNode {
public:
	static constexpr IntrusiveHookMode mode = _mode;

	IntrusiveListHook() noexcept = default;

	~IntrusiveListHook() noexcept {
		if constexpr (mode == IntrusiveHookMode::AUTO_UNLINK) {
			if (is_linked())
				unlink();
		} else
			assert(!is_linked());
	}
};

using AutoUnlinkIntrusiveListHook =
	IntrusiveListHook<IntrusiveHookMode::AUTO_UNLINK>;

/**
 * A doubly linked list which uses a hook embedded in its items
 * (i.e. no allocation).  The items must derive from
 * #IntrusiveListHook.  The list does not own its items.
 */
template<typename T>
class IntrusiveList {
	struct Head final : IntrusiveListNode {
		Head() noexcept {
			SelfLink();
		}

		void SelfLink() noexcept {
			next = prev = this;
		}

		friend class IntrusiveList;
	};

	Head head;

	static T &Cast(IntrusiveListNode &node) noexcept {
		return static_cast<T &>(node);
	}

	static const T &Cast(const IntrusiveListNode &node) noexcept {
		return static_cast<const T &>(node);
	}

public:
	IntrusiveList() noexcept = default;

	~IntrusiveList() noexcept {
		clear();
	}

	IntrusiveList(const IntrusiveList &) = delete;
	IntrusiveList &operator=(const IntrusiveList &) = delete;

	[[gnu::pure]]
	bool empty() const noexcept {
		return head.next == &head;
	}

	[[gnu::pure]]
	std::size_t size() const noexcept {
		std::size_t n = 0;
		for (const IntrusiveListNode *i = head.next; i != &head; i = i->next)
			++n;
		return n;
	}

	/**
	 * Unlink all items (without disposing them).
	 */
	void clear() noexcept {
		while (!empty())
			head.next->unlink();
	}

	T &front() noexcept {
		assert(!empty());
		return Cast(*head.next);
	}

	const T &front() const noexcept {
		assert(!empty());
		return Cast(*head.next);
	}

	void push_front(T &t) noexcept {
		static_cast<IntrusiveListNode &>(t).InsertBefore(*head.next);
	}

	void push_back(T &t) noexcept {
		static_cast<IntrusiveListNode &>(t).InsertBefore(head);
	}

	/**
	 * Insert @t before @position.
	 */
	void insert_before(T &position, T &t) noexcept {
		static_cast<IntrusiveListNode &>(t).InsertBefore(position);
	}

	void pop_front() noexcept {
		assert(!empty());
		head.next->unlink();
	}

	template<typename D>
	void pop_front_and_dispose(D &&disposer) noexcept {
		auto &i = front();
		pop_front();
		disposer(&i);
	}

	template<typename D>
	void clear_and_dispose(D &&disposer) noexcept {
		while (!empty())
			pop_front_and_dispose(disposer);
	}

	class iterator final {
		friend class IntrusiveList;

		IntrusiveListNode *cursor;

		constexpr explicit iterator(IntrusiveListNode *_cursor) noexcept
			:cursor(_cursor) {}

	public:
		using iterator_category = std::bidirectional_iterator_tag;
		using value_type = T;
		using difference_type = std::ptrdiff_t;
		using pointer = T *;
		using reference = T &;

		constexpr bool operator==(const iterator &other) const noexcept {
			return cursor == other.cursor;
		}

		constexpr bool operator!=(const iterator &other) const noexcept {
			return cursor != other.cursor;
		}

		T &operator*() const noexcept {
			return Cast(*cursor);
		}

		T *operator->() const noexcept {
			return &Cast(*cursor);
		}

		iterator &operator++() noexcept {
			cursor = cursor->next;
			return *this;
		}

		iterator &operator--() noexcept {
			cursor = cursor->prev;
			return *this;
		}
	};

	iterator begin() noexcept {
		return iterator{head.next};
	}

	iterator end() noexcept {
		return iterator{&head};
	}

	/**
	 * Unlink the item at the given position and return an
	 * iterator to the following one.
	 */
	iterator erase(iterator i) noexcept {
		auto *next = i.cursor->next;
		i.cursor->unlink();
		return iterator{next};
	}
};
