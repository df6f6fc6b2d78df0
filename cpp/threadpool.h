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

#ifndef _RATESTRAP_THREADPOOL_H
#define _RATESTRAP_THREADPOOL_H

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace ratestrap
{

// Fixed size pool of worker threads, each owning a task deque.
// A worker takes tasks from the back of its own deque and, when
// that is empty, steals from the front of another worker's deque.
// Tasks submitted from outside the pool are distributed round robin;
// tasks submitted by a worker go to that worker's own deque.
//
// The destructor runs every task already queued before joining
// the workers.
class WorkStealingPool
{
	public:
	// num_threads of 0 means std::thread::hardware_concurrency()
	explicit WorkStealingPool(size_t num_threads = 0);
	~WorkStealingPool();

	size_t size() const { return workers_.size(); }

	template <typename F> auto submit(F f) -> std::future<decltype(f())>
	{
		typedef decltype(f()) result_type;
		auto task = std::make_shared<std::packaged_task<result_type()>>(std::move(f));
		std::future<result_type> result = task->get_future();
		enqueue([task]() { (*task)(); });
		return result;
	}

	// Runs fn(0) ... fn(n-1) on the pool and waits for all of them.
	// The calling thread executes queued tasks while it waits. An
	// exception thrown by a task is rethrown here once all tasks
	// have finished.
	void parallel_for(size_t n, const std::function<void(size_t)> &fn);

	private:
	struct WorkQueue {
		std::mutex lock;
		std::deque<std::function<void()>> tasks;
	};

	void enqueue(std::function<void()> task);
	bool pop_local(size_t index, std::function<void()> &task);
	bool steal(size_t thief, std::function<void()> &task);
	// Takes any task, from the front of the first non-empty queue
	bool try_take(size_t start, std::function<void()> &task);
	void worker_loop(size_t index);

	WorkStealingPool(const WorkStealingPool &) = delete;
	WorkStealingPool &operator=(const WorkStealingPool &) = delete;

	std::vector<std::unique_ptr<WorkQueue>> queues_;
	std::vector<std::thread> workers_;
	std::atomic<size_t> queued_;
	std::atomic<size_t> next_queue_;
	std::atomic<bool> stopping_;
	std::mutex wake_lock_;
	std::condition_variable wake_;
};

extern int test_threadpool();

} // namespace ratestrap

#endif
