/**
 * DO NOT REMOVE COPYRIGHT NOTICES OR THIS HEADER.
 *
 * Contributor(s):
 *
 * The Original Software is RateStrap.
 * The Initial Developer of the Original Software is REDUKTI LIMITED (http://redukti.com).
 *
 * Copyright 2017-2019 REDUKTI LIMITED. All Rights Reserved.
 *
 * The contents of this file are subject to the the GNU General Public License
 * Version 3 (https://www.gnu.org/licenses/gpl.txt).
 */

#include <threadpool.h>

#include <logger.h>

#include <stdio.h>

#include <chrono>
#include <exception>
#include <stdexcept>

namespace ratestrap
{

// Identifies the pool and worker running on this thread
static thread_local WorkStealingPool *current_pool = nullptr;
static thread_local size_t current_index = 0;

WorkStealingPool::WorkStealingPool(size_t num_threads) : queued_(0), next_queue_(0), stopping_(false)
{
	if (num_threads == 0) {
		num_threads = std::thread::hardware_concurrency();
		if (num_threads == 0)
			num_threads = 1;
	}
	for (size_t i = 0; i < num_threads; i++)
		queues_.push_back(std::unique_ptr<WorkQueue>(new WorkQueue()));
	for (size_t i = 0; i < num_threads; i++)
		workers_.push_back(std::thread(&WorkStealingPool::worker_loop, this, i));
	debug("Started pool with %d workers\n", (int)num_threads);
}

WorkStealingPool::~WorkStealingPool()
{
	{
		std::lock_guard<std::mutex> guard(wake_lock_);
		stopping_ = true;
	}
	wake_.notify_all();
	for (auto &worker : workers_)
		worker.join();
}

void WorkStealingPool::enqueue(std::function<void()> task)
{
	size_t index;
	if (current_pool == this)
		index = current_index;
	else
		index = next_queue_++ % queues_.size();
	// Count first so that the counter never drops below zero
	{
		std::lock_guard<std::mutex> guard(wake_lock_);
		queued_++;
	}
	{
		std::lock_guard<std::mutex> guard(queues_[index]->lock);
		queues_[index]->tasks.push_back(std::move(task));
	}
	wake_.notify_one();
}

bool WorkStealingPool::pop_local(size_t index, std::function<void()> &task)
{
	WorkQueue &queue = *queues_[index];
	std::lock_guard<std::mutex> guard(queue.lock);
	if (queue.tasks.empty())
		return false;
	task = std::move(queue.tasks.back());
	queue.tasks.pop_back();
	queued_--;
	return true;
}

bool WorkStealingPool::steal(size_t thief, std::function<void()> &task)
{
	for (size_t i = 1; i < queues_.size(); i++) {
		WorkQueue &victim = *queues_[(thief + i) % queues_.size()];
		std::lock_guard<std::mutex> guard(victim.lock);
		if (victim.tasks.empty())
			continue;
		task = std::move(victim.tasks.front());
		victim.tasks.pop_front();
		queued_--;
		return true;
	}
	return false;
}

bool WorkStealingPool::try_take(size_t start, std::function<void()> &task)
{
	for (size_t i = 0; i < queues_.size(); i++) {
		WorkQueue &queue = *queues_[(start + i) % queues_.size()];
		std::lock_guard<std::mutex> guard(queue.lock);
		if (queue.tasks.empty())
			continue;
		task = std::move(queue.tasks.front());
		queue.tasks.pop_front();
		queued_--;
		return true;
	}
	return false;
}

void WorkStealingPool::worker_loop(size_t index)
{
	current_pool = this;
	current_index = index;
	for (;;) {
		std::function<void()> task;
		if (pop_local(index, task) || steal(index, task)) {
			task();
			continue;
		}
		std::unique_lock<std::mutex> guard(wake_lock_);
		wake_.wait(guard, [this]() { return stopping_ || queued_ > 0; });
		if (stopping_ && queued_ == 0)
			break;
	}
	current_pool = nullptr;
}

void WorkStealingPool::parallel_for(size_t n, const std::function<void(size_t)> &fn)
{
	std::vector<std::future<void>> results;
	results.reserve(n);
	for (size_t i = 0; i < n; i++)
		results.push_back(submit([&fn, i]() { fn(i); }));
	size_t start = current_pool == this ? current_index : 0;
	for (auto &result : results) {
		// Help out rather than block while our tasks are pending
		while (result.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
			std::function<void()> task;
			if (try_take(start, task))
				task();
			else
				result.wait_for(std::chrono::milliseconds(1));
		}
	}
	std::exception_ptr first_exception;
	for (auto &result : results) {
		try {
			result.get();
		} catch (...) {
			if (!first_exception)
				first_exception = std::current_exception();
		}
	}
	if (first_exception)
		std::rethrow_exception(first_exception);
}

static int test_submit()
{
	int failure_count = 0;
	WorkStealingPool pool(4);
	if (pool.size() != 4)
		failure_count++;
	std::vector<std::future<int>> futures;
	for (int i = 0; i < 100; i++)
		futures.push_back(pool.submit([i]() { return i * i; }));
	for (int i = 0; i < 100; i++) {
		if (futures[i].get() != i * i)
			failure_count++;
	}
	return failure_count;
}

static int test_parallel_for()
{
	int failure_count = 0;
	WorkStealingPool pool(3);
	std::vector<int> slots(1000, 0);
	std::atomic<int> calls(0);
	pool.parallel_for(slots.size(), [&](size_t i) {
		slots[i] = (int)i + 1;
		calls++;
	});
	if (calls != 1000)
		failure_count++;
	for (size_t i = 0; i < slots.size(); i++) {
		if (slots[i] != (int)i + 1) {
			failure_count++;
			break;
		}
	}
	// Nested use from inside a worker must not deadlock
	std::atomic<int> inner(0);
	pool.parallel_for(4, [&](size_t) { pool.parallel_for(4, [&](size_t) { inner++; }); });
	if (inner != 16)
		failure_count++;

	bool caught = false;
	try {
		pool.parallel_for(8, [](size_t i) {
			if (i == 5)
				throw std::runtime_error("task failed");
		});
	} catch (const std::runtime_error &) {
		caught = true;
	}
	if (!caught)
		failure_count++;
	return failure_count;
}

static int test_drain_on_destroy()
{
	std::atomic<int> executed(0);
	{
		WorkStealingPool pool(2);
		for (int i = 0; i < 50; i++)
			pool.submit([&executed]() {
				std::this_thread::sleep_for(std::chrono::microseconds(100));
				executed++;
			});
	}
	return executed == 50 ? 0 : 1;
}

int test_threadpool()
{
	int failure_count = 0;
	failure_count += test_submit();
	failure_count += test_parallel_for();
	failure_count += test_drain_on_destroy();
	if (failure_count == 0)
		printf("Thread Pool Tests OK\n");
	else
		printf("Thread Pool Tests FAILED\n");
	return failure_count;
}

} // namespace ratestrap
