#ifndef SMARTNUM_UTIL_HPP
#define SMARTNUM_UTIL_HPP 1

#include <functional>
#include <mutex>
#include <optional>

namespace smartnum{
	//! Builds a visitor out of a set of lambdas for std::visit
	template<typename ... Fns>
	struct Overloaded: Fns...{
		using Fns::operator()...;
	};

	template<typename ... Fns>
	Overloaded(Fns...) -> Overloaded<Fns...>;

	/**
	 * \brief Write-once slot for a lazily computed value
	 *
	 * The first call to get runs the producer, every later call (from any
	 * thread) returns a reference to the same stored value. If the producer
	 * throws, the slot stays empty and the next call tries again.
	 **/
	template<typename T>
	class Lazy{
		public:
			Lazy() = default;

			Lazy(const Lazy&) = delete;
			Lazy &operator=(const Lazy&) = delete;

			template<typename Fn>
			const T &get(Fn &&fn) const{
				std::call_once(m_flag, [this, &fn]{ m_value.emplace(std::invoke(std::forward<Fn>(fn))); });
				return *m_value;
			}

		private:
			mutable std::once_flag m_flag;
			mutable std::optional<T> m_value;
	};
}

#endif // !SMARTNUM_UTIL_HPP
