/*
 * Rmbg Memory Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <typeinfo>
#include <utility>
#include <vector>

#include <Rmbg/Logger/ILogger.hpp>

namespace Rmbg::Memory {

/**
 * @class ObjectPool
 * @brief A thread-safe pool of reusable objects of a single concrete type.
 *
 * Objects are handed out as std::shared_ptr with a custom deleter that puts
 * them back into the pool when the last reference goes away, so every exit
 * path of the borrower (including exceptions) returns the object.
 *
 * The pool's lifecycle is managed by std::enable_shared_from_this: objects
 * still borrowed when the pool is destroyed are simply freed on release.
 *
 * @tparam T The pooled type. The pool never inspects it.
 */
template<typename T> class ObjectPool : public std::enable_shared_from_this<ObjectPool<T>> {
public:
	using Lease = std::shared_ptr<T>;
	using Factory = std::function<std::unique_ptr<T>()>;

	/**
	 * @brief Creates a new pool.
	 *
	 * @param logger Logger used for allocation diagnostics.
	 * @param factory Produces a fresh object whenever no idle one is available.
	 * @param maxIdle The maximum number of idle objects kept. Must be greater than 0.
	 *
	 * @throw std::invalid_argument If maxIdle is 0 or factory is empty.
	 */
	static std::shared_ptr<ObjectPool> create(std::shared_ptr<const Logger::ILogger> logger, Factory factory,
						  std::size_t maxIdle = 8)
	{
		if (!logger) {
			throw std::invalid_argument("logger must not be null");
		} else if (!factory) {
			throw std::invalid_argument("factory must not be empty");
		} else if (maxIdle == 0) {
			throw std::invalid_argument("maxIdle must be greater than 0");
		}
		return std::shared_ptr<ObjectPool>(new ObjectPool(std::move(logger), std::move(factory), maxIdle));
	}

	/**
	 * @brief Creates a pool whose objects are default-constructed.
	 */
	static std::shared_ptr<ObjectPool> create(std::shared_ptr<const Logger::ILogger> logger,
						  std::size_t maxIdle = 8)
	{
		return create(std::move(logger), [] { return std::make_unique<T>(); }, maxIdle);
	}

	~ObjectPool() noexcept = default;

	ObjectPool(const ObjectPool &) = delete;
	ObjectPool &operator=(const ObjectPool &) = delete;
	ObjectPool(ObjectPool &&) = delete;
	ObjectPool &operator=(ObjectPool &&) = delete;

	/**
	 * @brief Borrows an object, reusing the most recently returned one when possible.
	 *
	 * The borrower owns the object exclusively until the returned pointer and all
	 * its copies are gone.
	 */
	Lease acquire()
	{
		std::unique_ptr<T> object;
		{
			std::lock_guard<std::mutex> lock(poolMutex_);
			if (!idle_.empty()) {
				object = std::move(idle_.back());
				idle_.pop_back();
			}
		}

		if (!object) {
			object = factory_();
			if (!object) {
				throw std::runtime_error("ObjectPool factory returned null");
			}
			logger_->debug("Allocated new pooled object of type {}", typeid(T).name());
		}

		T *raw = object.release();
		std::weak_ptr<ObjectPool> weakSelf = this->weak_from_this();
		return Lease(raw, [weakSelf = std::move(weakSelf)](T *ptr) {
			std::unique_ptr<T> returned(ptr);
			if (auto self = weakSelf.lock()) {
				self->release(std::move(returned));
			}
		});
	}

	std::size_t getIdleCount() const
	{
		std::lock_guard<std::mutex> lock(poolMutex_);
		return idle_.size();
	}

	std::size_t getMaxIdle() const noexcept { return maxIdle_; }

private:
	ObjectPool(std::shared_ptr<const Logger::ILogger> logger, Factory factory, std::size_t maxIdle)
		: logger_(std::move(logger)),
		  factory_(std::move(factory)),
		  maxIdle_(maxIdle)
	{
	}

	void release(std::unique_ptr<T> object) noexcept
	{
		std::lock_guard<std::mutex> lock(poolMutex_);
		if (idle_.size() < maxIdle_) {
			idle_.push_back(std::move(object));
		}
	}

	const std::shared_ptr<const Logger::ILogger> logger_;
	const Factory factory_;
	const std::size_t maxIdle_;
	std::vector<std::unique_ptr<T>> idle_;
	mutable std::mutex poolMutex_;
};

} // namespace Rmbg::Memory
